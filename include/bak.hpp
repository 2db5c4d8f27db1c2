/**
 * @file bak.hpp
 * @brief Main header for bak
 *
 * bak copies a file or a directory tree, stages each file through a
 * temporary name unless told not to, draws a progress line while it works
 * and stops cleanly between files on SIGINT/SIGTERM. Bytes move through
 * the AuraIO engine.
 *
 * Example:
 * @code
 * #include <bak.hpp>
 *
 * int main() {
 *     bak::CancellationMonitor monitor;
 *     monitor.install();
 *
 *     auto request = bak::Options().source("src").destination("dst").build();
 *     bak::Transfer transfer(request, monitor);
 *     auto outcome = transfer.run();
 *     return 0;
 * }
 * @endcode
 */

#ifndef BAK_HPP
#define BAK_HPP

#include <bak/fwd.hpp>
#include <bak/error.hpp>
#include <bak/log.hpp>
#include <bak/format.hpp>
#include <bak/options.hpp>
#include <bak/enumerate.hpp>
#include <bak/copier.hpp>
#include <bak/cancel.hpp>
#include <bak/progress.hpp>
#include <bak/transfer.hpp>

/// Library version string
#define BAK_VERSION "0.1"

#endif // BAK_HPP
