// ============================================================================
// MaskLabel - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QCoreApplication>
#include <QTranslator>
#include <QLocale>
#include <QStandardPaths>
#include <QFileInfo>

#include "MainWindow.h"
#include "cli/CliParser.h"
#include "core/LabelSettings.h"

// Platform-specific includes
#ifdef Q_OS_WIN
#include <windows.h>
#endif

// Test includes
#include "annotations/AnnotationTests.h"
#include "core/ViewTransformTests.h"
#include "core/AnnotationStoreTests.h"
#include "core/LabelingSessionTests.h"
#include "core/ResizeDebouncerTests.h"
#include "raster/RasterTests.h"
#include "batch/BatchOperationsTests.h"

static const char* ORGANIZATION_NAME = "MaskLabel";
static const char* APPLICATION_NAME = "App";

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QCoreApplication& app, QTranslator& translator)
{
    const QString langCode = QLocale::system().name().section('_', 0, 0);

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/masklabel/translations",
        "/usr/local/share/masklabel/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "masklabel/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (path.isEmpty()) {
            continue;
        }
        if (translator.load(path + "/masklabel_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

static int runTests(const QString& testType)
{
#ifdef Q_OS_WIN
    AllocConsole();
    freopen("CONOUT$", "w", stdout);
    freopen("CONOUT$", "w", stderr);
#endif

    bool success = false;

    if (testType == "viewtransform") {
        success = ViewTransformTests::runAllTests();
    } else if (testType == "annotations") {
        success = AnnotationTests::runAllTests();
    } else if (testType == "store") {
        success = AnnotationStoreTests::runAllTests();
    } else if (testType == "raster") {
        success = RasterTests::runAllTests();
    } else if (testType == "session") {
        success = LabelingSessionTests::runAllTests();
    } else if (testType == "batch") {
        success = BatchOperationsTests::runAllTests();
    } else if (testType == "debouncer") {
        ResizeDebouncerTests tests;
        return QTest::qExec(&tests);
    }

    return success ? 0 : 1;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    // ========== CLI Mode ==========
    // Batch commands run without a display
    if (Cli::isCliMode(argc, argv)) {
        QCoreApplication app(argc, argv);
        app.setOrganizationName(ORGANIZATION_NAME);
        app.setApplicationName(APPLICATION_NAME);

        QTranslator translator;
        loadTranslations(app, translator);

        return Cli::run(app, argc, argv);
    }

    QApplication app(argc, argv);
    app.setOrganizationName(ORGANIZATION_NAME);
    app.setApplicationName(APPLICATION_NAME);

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QString inputFolder;
    QString testToRun;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--test-viewtransform") {
            testToRun = "viewtransform";
        } else if (arg == "--test-annotations") {
            testToRun = "annotations";
        } else if (arg == "--test-store") {
            testToRun = "store";
        } else if (arg == "--test-raster") {
            testToRun = "raster";
        } else if (arg == "--test-session") {
            testToRun = "session";
        } else if (arg == "--test-debouncer") {
            testToRun = "debouncer";
        } else if (arg == "--test-batch") {
            testToRun = "batch";
        } else if (!arg.startsWith("--") && inputFolder.isEmpty()) {
            inputFolder = arg;
        }
    }

    // Handle test commands
    if (!testToRun.isEmpty()) {
        return runTests(testToRun);
    }

    // ========== Launch Application ==========
    auto* w = new MainWindow();
    w->setAttribute(Qt::WA_DeleteOnClose);
    w->show();

    if (inputFolder.isEmpty() && QFileInfo(LabelSettings::lastFolder()).isDir()) {
        inputFolder = LabelSettings::lastFolder();
    }
    if (!inputFolder.isEmpty()) {
        w->openFolder(inputFolder);
    }

    return app.exec();
}
