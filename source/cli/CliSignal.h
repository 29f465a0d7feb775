#ifndef CLISIGNAL_H
#define CLISIGNAL_H

/**
 * @file CliSignal.h
 * @brief Ctrl+C handling for the batch commands.
 *
 * SIGINT and SIGTERM (CTRL_C_EVENT and CTRL_BREAK_EVENT on Windows) only
 * raise a flag. The batch loop polls it between files, so the file being
 * written is always finished and the remaining files are reported as
 * skipped.
 */

#include <atomic>

namespace Cli {

/**
 * @brief Route interrupt signals to the cancellation flag.
 *
 * Call once before the first batch starts.
 */
void installSignalHandlers();

/**
 * @brief The flag handed to BatchOps::generateMasks / extractAnnotations.
 * @return Pointer to a process-wide flag (never null)
 */
std::atomic<bool>* getCancellationFlag();

/**
 * @brief Check whether an interrupt arrived.
 *
 * The first call that observes the flag prints a one-line notice to
 * stderr; signal handlers themselves never do I/O.
 */
bool wasCancelled();

/// Clear the flag and the notice state.
void resetCancellation();

} // namespace Cli

#endif // CLISIGNAL_H
