#ifndef CLIPARSER_H
#define CLIPARSER_H

/**
 * @file CliParser.h
 * @brief Headless entry point: `masklabel <command> [options] <directory>`.
 *
 * A recognized command (or -h/-v) as the first argument selects CLI mode;
 * anything else starts the labeling window. QCommandLineParser has no notion
 * of subcommands, so the command word is stripped before parsing and each
 * command gets its own option set.
 */

#include <QString>
#include <QCommandLineParser>

class QCoreApplication;

namespace Cli {

enum class Command {
    None,               ///< Not a CLI invocation
    Help,
    Version,
    GenerateMasks,      ///< Annotation records -> mask rasters
    ExtractAnnotations  ///< Mask rasters -> annotation records
};

/// Per-file reporting style of ConsoleProgress.
enum class OutputMode {
    Simple,     ///< One status line per file
    Verbose,    ///< Paths, status and warnings per file
    Json        ///< One JSON object per line
};

/**
 * @brief Process exit codes.
 *
 * Scripts can rely on these values; do not renumber.
 */
namespace ExitCode {
    constexpr int Success = 0;
    constexpr int PartialFailure = 1; ///< At least one file failed
    constexpr int TotalFailure = 2;   ///< Every file failed
    constexpr int InvalidArgs = 3;    ///< Bad options, bad class mapping or nothing to do
    constexpr int IoError = 4;        ///< Input or output directory unusable
    constexpr int Cancelled = 5;      ///< Interrupted by Ctrl+C
}

/**
 * @brief Cheap argv check, safe before any QCoreApplication exists.
 */
bool isCliMode(int argc, char* argv[]);

/// @return The command named by argv[1], or Command::None.
Command parseCommand(int argc, char* argv[]);

/// @return The word that selects @p cmd on the command line ("generate-masks").
QString commandName(Command cmd);

/**
 * @brief Register the options and positional argument of @p cmd.
 */
void setupParser(QCommandLineParser& parser, Command cmd);

/**
 * @brief Print usage for @p cmd, or the command overview for None/Help.
 */
void showHelp(Command cmd);

void showVersion();

/**
 * @brief Parse argv, dispatch to the command handler and return its exit code.
 */
int run(QCoreApplication& app, int argc, char* argv[]);

} // namespace Cli

#endif // CLIPARSER_H
