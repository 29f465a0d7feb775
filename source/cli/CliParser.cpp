#include "CliParser.h"
#include "CliHandler.h"
#include "CliSignal.h"

#include <QCoreApplication>
#include <QTextStream>
#include <QVector>
#include <cstring>

namespace Cli {

namespace {

// Keep in step with project(VERSION) in CMakeLists.txt
const char* const APP_VERSION = "1.0.0";

constexpr int OPTION_COLUMN = 28;

struct CommandInfo {
    Command command;
    const char* name;
    const char* argument;       ///< Positional directory argument
    const char* argumentHelp;
    const char* summary;
    const char* example;
};

const CommandInfo COMMANDS[] = {
    { Command::GenerateMasks, "generate-masks", "annotations",
      QT_TRANSLATE_NOOP("CLI", "Directory of annotation records (*.json)"),
      QT_TRANSLATE_NOOP("CLI", "Rasterize annotation records into masks (<name>_mask.png)"),
      "masklabel generate-masks ~/photos/json_data -i ~/photos -o ~/masks" },
    { Command::ExtractAnnotations, "extract-annotations", "masks",
      QT_TRANSLATE_NOOP("CLI", "Directory of mask images (png, bmp, jpg, tif)"),
      QT_TRANSLATE_NOOP("CLI", "Trace mask regions back into annotation records"),
      "masklabel extract-annotations ~/masks -o ~/records --classes classes.txt" },
};

struct OptionInfo {
    const char* shortName;      ///< nullptr if none
    const char* longName;
    const char* valueName;      ///< nullptr for flags
    const char* description;
};

const OptionInfo GENERATE_OPTIONS[] = {
    { "i", "images", "dir",
      QT_TRANSLATE_NOOP("CLI", "Source images; only read for records without original_size") },
    { nullptr, "thickness", "N",
      QT_TRANSLATE_NOOP("CLI", "Stroke width for lines and freehand (default: settings, 5)") },
    { nullptr, "raw", nullptr,
      QT_TRANSLATE_NOOP("CLI", "Write class ids instead of values spread over 0..255") },
};

const OptionInfo EXTRACT_OPTIONS[] = {
    { nullptr, "display-scaled", nullptr,
      QT_TRANSLATE_NOOP("CLI", "Masks hold display values (written without --raw)") },
    { nullptr, "include-background", nullptr,
      QT_TRANSLATE_NOOP("CLI", "Also trace the background class (id 0)") },
};

const OptionInfo COMMON_OPTIONS[] = {
    { "o", "output", "dir", QT_TRANSLATE_NOOP("CLI", "Output directory [required]") },
    { nullptr, "classes", "file",
      QT_TRANSLATE_NOOP("CLI", "Class mapping, one \"value, label\" per line") },
    { nullptr, "verbose", nullptr, QT_TRANSLATE_NOOP("CLI", "Show paths and warnings per file") },
    { nullptr, "json", nullptr, QT_TRANSLATE_NOOP("CLI", "One JSON object per line (for scripts)") },
    { nullptr, "fail-fast", nullptr, QT_TRANSLATE_NOOP("CLI", "Stop after the first failed file") },
    { nullptr, "dry-run", nullptr, QT_TRANSLATE_NOOP("CLI", "Convert but write nothing") },
};

QString tr(const char* text)
{
    return QCoreApplication::translate("CLI", text);
}

const CommandInfo* findCommand(Command cmd)
{
    for (const CommandInfo& info : COMMANDS) {
        if (info.command == cmd) {
            return &info;
        }
    }
    return nullptr;
}

QVector<OptionInfo> optionsFor(Command cmd)
{
    QVector<OptionInfo> options;
    if (cmd == Command::GenerateMasks) {
        for (const OptionInfo& o : GENERATE_OPTIONS) options << o;
    } else if (cmd == Command::ExtractAnnotations) {
        for (const OptionInfo& o : EXTRACT_OPTIONS) options << o;
    }
    for (const OptionInfo& o : COMMON_OPTIONS) options << o;
    return options;
}

QString optionLabel(const OptionInfo& option)
{
    QString label = option.shortName
        ? QStringLiteral("-%1, ").arg(QLatin1String(option.shortName))
        : QStringLiteral("    ");
    label += QStringLiteral("--") + QLatin1String(option.longName);
    if (option.valueName) {
        label += QStringLiteral(" <%1>").arg(QLatin1String(option.valueName));
    }
    return label;
}

void printRow(QTextStream& out, const QString& left, const QString& right)
{
    out << "  " << left.leftJustified(OPTION_COLUMN) << " " << right << "\n";
}

bool isArg(const char* arg, const char* shortForm, const char* longForm)
{
    return std::strcmp(arg, shortForm) == 0 || std::strcmp(arg, longForm) == 0;
}

} // namespace

// =============================================================================
// Command detection
// =============================================================================

bool isCliMode(int argc, char* argv[])
{
    // --test-* and a folder path fall through to the GUI
    return parseCommand(argc, argv) != Command::None;
}

Command parseCommand(int argc, char* argv[])
{
    if (argc < 2) {
        return Command::None;
    }

    const char* word = argv[1];
    for (const CommandInfo& info : COMMANDS) {
        if (std::strcmp(word, info.name) == 0) {
            return info.command;
        }
    }
    if (isArg(word, "-h", "--help")) {
        return Command::Help;
    }
    if (isArg(word, "-v", "--version")) {
        return Command::Version;
    }
    return Command::None;
}

QString commandName(Command cmd)
{
    if (const CommandInfo* info = findCommand(cmd)) {
        return QLatin1String(info->name);
    }
    switch (cmd) {
        case Command::Help:    return QStringLiteral("help");
        case Command::Version: return QStringLiteral("version");
        default:               return QString();
    }
}

// =============================================================================
// Parser setup
// =============================================================================

void setupParser(QCommandLineParser& parser, Command cmd)
{
    parser.setApplicationDescription(tr("MaskLabel - image annotation and segmentation mask tool"));
    parser.addHelpOption();
    parser.addVersionOption();

    const CommandInfo* info = findCommand(cmd);
    if (!info) {
        return;
    }

    parser.addPositionalArgument(QLatin1String(info->argument), tr(info->argumentHelp),
                                 QStringLiteral("<%1>").arg(QLatin1String(info->argument)));

    for (const OptionInfo& option : optionsFor(cmd)) {
        QStringList names;
        if (option.shortName) {
            names << QLatin1String(option.shortName);
        }
        names << QLatin1String(option.longName);

        if (option.valueName) {
            parser.addOption(QCommandLineOption(names, tr(option.description),
                                                QLatin1String(option.valueName)));
        } else {
            parser.addOption(QCommandLineOption(names, tr(option.description)));
        }
    }
}

// =============================================================================
// Help and version
// =============================================================================

void showHelp(Command cmd)
{
    QTextStream out(stdout);
    const CommandInfo* info = findCommand(cmd);

    if (!info) {
        out << tr("Usage: masklabel <command> [options] <directory>") << "\n"
            << "       masklabel [image folder]\n\n"
            << tr("Draw labeled shapes over images and convert them to and from\n"
                  "single-channel segmentation masks.") << "\n\n"
            << tr("COMMANDS:") << "\n";
        for (const CommandInfo& c : COMMANDS) {
            printRow(out, QLatin1String(c.name), tr(c.summary));
        }
        printRow(out, tr("(none)"), tr("Open the labeling window"));

        out << "\n" << tr("OPTIONS:") << "\n";
        printRow(out, QStringLiteral("-h, --help"), tr("Show this help"));
        printRow(out, QStringLiteral("-v, --version"), tr("Show version information"));

        out << "\n" << tr("EXIT CODES:") << "\n";
        printRow(out, QString::number(ExitCode::Success), tr("Every file converted or skipped"));
        printRow(out, QString::number(ExitCode::PartialFailure), tr("Some files failed"));
        printRow(out, QString::number(ExitCode::TotalFailure), tr("All files failed"));
        printRow(out, QString::number(ExitCode::InvalidArgs), tr("Invalid arguments or nothing to convert"));
        printRow(out, QString::number(ExitCode::IoError), tr("Input or output directory unusable"));
        printRow(out, QString::number(ExitCode::Cancelled), tr("Cancelled (Ctrl+C)"));

        out << "\n" << tr("Run 'masklabel <command> --help' for command options.") << "\n";
        out.flush();
        return;
    }

    out << tr("Usage: masklabel %1 [options] <%2> -o <dir>")
               .arg(QLatin1String(info->name), QLatin1String(info->argument)) << "\n\n"
        << tr(info->summary) << "\n\n"
        << tr("ARGUMENTS:") << "\n";
    printRow(out, QStringLiteral("<%1>").arg(QLatin1String(info->argument)), tr(info->argumentHelp));

    out << "\n" << tr("OPTIONS:") << "\n";
    for (const OptionInfo& option : optionsFor(cmd)) {
        printRow(out, optionLabel(option), tr(option.description));
    }
    printRow(out, QStringLiteral("-h, --help"), tr("Show this help"));

    out << "\n" << tr("EXAMPLE:") << "\n  " << QLatin1String(info->example) << "\n";
    out.flush();
}

void showVersion()
{
    QTextStream out(stdout);
    out << "MaskLabel " << APP_VERSION << "\n";
}

// =============================================================================
// Entry point
// =============================================================================

int run(QCoreApplication& app, int argc, char* argv[])
{
    app.setApplicationVersion(QLatin1String(APP_VERSION));
    installSignalHandlers();

    const Command cmd = parseCommand(argc, argv);
    switch (cmd) {
        case Command::Version:
            showVersion();
            return ExitCode::Success;
        case Command::Help:
            showHelp(Command::None);
            return ExitCode::Success;
        case Command::None:
            showHelp(Command::None);
            return ExitCode::InvalidArgs;
        default:
            break;
    }

    QCommandLineParser parser;
    setupParser(parser, cmd);

    // argv[0] stays so QCommandLineParser reports the right program name
    QStringList args { QString::fromLocal8Bit(argv[0]) };
    for (int i = 2; i < argc; ++i) {
        args << QString::fromLocal8Bit(argv[i]);
    }

    if (!parser.parse(args)) {
        QTextStream err(stderr);
        err << tr("Error: ") << parser.errorText() << "\n"
            << tr("Run 'masklabel %1 --help' for usage.").arg(commandName(cmd)) << "\n";
        return ExitCode::InvalidArgs;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        showHelp(cmd);
        return ExitCode::Success;
    }
    if (parser.isSet(QStringLiteral("version"))) {
        showVersion();
        return ExitCode::Success;
    }

    if (cmd == Command::GenerateMasks) {
        return handleGenerateMasks(parser);
    }
    return handleExtractAnnotations(parser);
}

} // namespace Cli
