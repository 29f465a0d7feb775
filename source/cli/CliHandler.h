#ifndef CLIHANDLER_H
#define CLIHANDLER_H

/**
 * @file CliHandler.h
 * @brief The two batch commands behind `masklabel <command>`.
 *
 * Both commands take one input directory and `-o <dir>`, resolve a class
 * table (--classes, else the mapping file from the settings, else the
 * built-in table), run the BatchOps function and print results through
 * ConsoleProgress.
 */

#include "CliParser.h"
#include "../annotations/ClassTable.h"
#include "../batch/BatchOperations.h"

#include <QCommandLineParser>

namespace Cli {

/**
 * @brief generate-masks: annotation records -> `<name>_mask.png`.
 * @return An ExitCode value
 */
int handleGenerateMasks(const QCommandLineParser& parser);

/**
 * @brief extract-annotations: mask rasters -> annotation records.
 * @return An ExitCode value
 */
int handleExtractAnnotations(const QCommandLineParser& parser);

/// --json wins over --verbose.
OutputMode getOutputMode(const QCommandLineParser& parser);

/**
 * @brief Class table for a command.
 * @param ok False if the mapping file that was chosen is unusable
 */
ClassTable resolveClassTable(const QCommandLineParser& parser,
                             QString* errorMessage, bool* ok);

/**
 * @brief Exit code for a finished batch.
 *
 * IoError for an unusable directory, InvalidArgs when there was nothing to
 * convert, TotalFailure when no file succeeded or was skipped, otherwise
 * PartialFailure if any file failed.
 */
int exitCodeFromResult(const BatchOps::BatchResult& result);

} // namespace Cli

#endif // CLIHANDLER_H
