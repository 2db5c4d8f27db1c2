/**
 * @file fwd.hpp
 * @brief Forward declarations for bak
 */

#ifndef BAK_FWD_HPP
#define BAK_FWD_HPP

namespace bak {

class Error;
class Options;
class TransferRequest;
class FileCopier;
class CancellationMonitor;
class ProgressState;
class ProgressReporter;
class Transfer;

struct Frame;
struct ReporterOptions;
struct TransferOutcome;

} // namespace bak

#endif // BAK_FWD_HPP
