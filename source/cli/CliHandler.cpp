#include "CliHandler.h"
#include "CliProgress.h"
#include "CliSignal.h"
#include "../core/LabelSettings.h"

#include <QCoreApplication>
#include <QDir>

namespace Cli {

namespace {

QString tr(const char* text)
{
    return QCoreApplication::translate("CLI", text);
}

QString absolutePath(const QString& path)
{
    return QDir::cleanPath(QDir::current().absoluteFilePath(path));
}

/**
 * Arguments shared by both commands, checked before anything runs.
 */
struct CommonArgs {
    QString inputDir;
    QString outputDir;
    ClassTable classTable;
    bool failFast = false;
    bool dryRun = false;
};

bool parseCommonArgs(const QCommandLineParser& parser, Command cmd,
                     ConsoleProgress& progress, CommonArgs* args)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        progress.reportError(tr("Expected exactly one input directory. Run 'masklabel %1 --help' for usage.")
                             .arg(commandName(cmd)));
        return false;
    }

    const QString outputDir = parser.value(QStringLiteral("output"));
    if (outputDir.isEmpty()) {
        progress.reportError(tr("Missing output directory (-o <dir>)."));
        return false;
    }

    QString err;
    bool tableOk = false;
    args->classTable = resolveClassTable(parser, &err, &tableOk);
    if (!tableOk) {
        progress.reportError(tr("Invalid class mapping: %1").arg(err));
        return false;
    }

    args->inputDir = absolutePath(positional.first());
    args->outputDir = absolutePath(outputDir);
    args->failFast = parser.isSet(QStringLiteral("fail-fast"));
    args->dryRun = parser.isSet(QStringLiteral("dry-run"));
    return true;
}

int finishBatch(ConsoleProgress& progress, const BatchOps::BatchResult& result,
                bool dryRun, const QString& nothingFoundMessage)
{
    if (result.pathError()) {
        progress.reportError(result.errorMessage);
    } else if (result.totalCount() == 0) {
        progress.reportError(nothingFoundMessage);
    } else {
        progress.reportSummary(result, dryRun);
        if (wasCancelled()) {
            return ExitCode::Cancelled;
        }
    }
    return exitCodeFromResult(result);
}

} // namespace

OutputMode getOutputMode(const QCommandLineParser& parser)
{
    if (parser.isSet(QStringLiteral("json"))) {
        return OutputMode::Json;
    }
    return parser.isSet(QStringLiteral("verbose")) ? OutputMode::Verbose : OutputMode::Simple;
}

ClassTable resolveClassTable(const QCommandLineParser& parser,
                             QString* errorMessage, bool* ok)
{
    const QString mappingFile = parser.value(QStringLiteral("classes"));
    if (mappingFile.isEmpty()) {
        return LabelSettings::batchClassTable(errorMessage, ok);
    }
    return ClassTable::loadFromFile(mappingFile, errorMessage, ok);
}

int exitCodeFromResult(const BatchOps::BatchResult& result)
{
    if (result.pathError()) {
        return ExitCode::IoError;
    }
    if (result.totalCount() == 0) {
        return ExitCode::InvalidArgs;
    }
    if (result.errorCount == 0) {
        return ExitCode::Success;
    }
    const bool nothingWorked = result.successCount == 0 && result.skippedCount == 0;
    return nothingWorked ? ExitCode::TotalFailure : ExitCode::PartialFailure;
}

// =============================================================================
// generate-masks
// =============================================================================

int handleGenerateMasks(const QCommandLineParser& parser)
{
    ConsoleProgress progress(getOutputMode(parser));

    CommonArgs args;
    if (!parseCommonArgs(parser, Command::GenerateMasks, progress, &args)) {
        return ExitCode::InvalidArgs;
    }

    BatchOps::MaskGenerationOptions options;
    options.annotationDir = args.inputDir;
    options.outputDir = args.outputDir;
    options.classTable = args.classTable;
    options.dryRun = args.dryRun;
    options.displayScaling = !parser.isSet(QStringLiteral("raw"));
    if (parser.isSet(QStringLiteral("images"))) {
        options.imageDir = absolutePath(parser.value(QStringLiteral("images")));
    }

    options.lineThickness = LabelSettings::lineThickness();
    if (parser.isSet(QStringLiteral("thickness"))) {
        const QString value = parser.value(QStringLiteral("thickness"));
        bool isNumber = false;
        const int thickness = value.toInt(&isNumber);
        if (!isNumber || thickness <= 0) {
            progress.reportError(tr("Invalid --thickness '%1': expected a positive integer.").arg(value));
            return ExitCode::InvalidArgs;
        }
        options.lineThickness = thickness;
    }

    const BatchOps::BatchResult result = BatchOps::generateMasks(
        options, progress.callback(), getCancellationFlag(), progress.resultCallback(args.failFast));

    return finishBatch(progress, result, args.dryRun,
                       tr("No annotation records (*.json) found in %1.").arg(args.inputDir));
}

// =============================================================================
// extract-annotations
// =============================================================================

int handleExtractAnnotations(const QCommandLineParser& parser)
{
    ConsoleProgress progress(getOutputMode(parser));

    CommonArgs args;
    if (!parseCommonArgs(parser, Command::ExtractAnnotations, progress, &args)) {
        return ExitCode::InvalidArgs;
    }

    BatchOps::AnnotationExtractionOptions options;
    options.maskDir = args.inputDir;
    options.outputDir = args.outputDir;
    options.dryRun = args.dryRun;
    options.includeBackground = parser.isSet(QStringLiteral("include-background"));
    options.classTable = args.classTable;

    // Masks written with display scaling carry display values, not ids
    if (parser.isSet(QStringLiteral("display-scaled"))) {
        QString err;
        bool ok = false;
        options.classTable = args.classTable.displayScaled(&err, &ok);
        if (!ok) {
            progress.reportError(tr("Invalid class mapping: %1").arg(err));
            return ExitCode::InvalidArgs;
        }
    }

    const BatchOps::BatchResult result = BatchOps::extractAnnotations(
        options, progress.callback(), getCancellationFlag(), progress.resultCallback(args.failFast));

    return finishBatch(progress, result, args.dryRun,
                       tr("No mask images found in %1.").arg(args.inputDir));
}

} // namespace Cli
