#include "CliProgress.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>

namespace Cli {

namespace {

QString tr(const char* text)
{
    return QCoreApplication::translate("CLI", text);
}

QString fileName(const QString& path)
{
    return QFileInfo(path).fileName();
}

} // namespace

ConsoleProgress::ConsoleProgress(OutputMode mode)
    : m_mode(mode)
    , m_out(stdout)
    , m_err(stderr)
{
}

// =============================================================================
// Batch callbacks
// =============================================================================

BatchOps::ProgressCallback ConsoleProgress::callback()
{
    return [this](int current, int total, const QString& file, const QString& status) {
        if (m_mode != OutputMode::Verbose) {
            return;
        }
        m_out << "[" << current << "/" << total << "] " << fileName(file) << ": " << status << "\n";
        m_out.flush();
    };
}

BatchOps::ResultCallback ConsoleProgress::resultCallback(bool failFast)
{
    return [this, failFast](int current, int total, const BatchOps::FileResult& result) {
        reportFile(current, total, result);

        if (!failFast || result.status != BatchOps::FileStatus::Error) {
            return true;
        }
        if (current < total) {
            reportWarning(tr("Stopping due to --fail-fast flag."));
        }
        return false;
    };
}

// =============================================================================
// Per-file output
// =============================================================================

void ConsoleProgress::reportFile(int index, int total, const BatchOps::FileResult& result)
{
    if (m_mode == OutputMode::Json) {
        QJsonArray warnings;
        for (const QString& w : result.warnings) {
            warnings.append(w);
        }

        QJsonObject obj;
        obj["type"] = QStringLiteral("file");
        obj["index"] = index;
        obj["input"] = result.inputPath;
        obj["output"] = result.outputPath;
        obj["status"] = statusName(result.status);
        obj["annotations"] = result.annotationCount;
        if (!result.message.isEmpty()) {
            obj["message"] = result.message;
        }
        if (result.errorKind != BatchOps::ErrorKind::None) {
            obj["error_kind"] = errorKindName(result.errorKind);
        }
        obj["warnings"] = warnings;
        writeJson(m_out, obj);
        return;
    }

    if (m_mode == OutputMode::Simple) {
        // [2/10] street_01.json... OK (4 annotations)
        m_out << "[" << index << "/" << total << "] " << fileName(result.inputPath)
              << "... " << statusText(result) << "\n";
        m_out.flush();
        return;
    }

    // Verbose: the progress callback already printed the file name
    if (!result.outputPath.isEmpty()) {
        m_out << "    -> " << result.outputPath << "\n";
    }
    m_out << "    " << statusText(result) << "\n";
    for (const QString& warning : result.warnings) {
        m_out << "    " << tr("warning: ") << warning << "\n";
    }
    m_out.flush();
}

QString ConsoleProgress::statusText(const BatchOps::FileResult& result) const
{
    QString text;
    switch (result.status) {
        case BatchOps::FileStatus::Success:
            text = tr("OK");
            if (result.annotationCount > 0) {
                text += tr(" (%1 annotations)").arg(result.annotationCount);
            }
            if (!result.warnings.isEmpty()) {
                text += tr(", %1 warning(s)").arg(result.warnings.size());
            }
            return text;
        case BatchOps::FileStatus::Skipped:
            text = tr("SKIPPED");
            if (!result.message.isEmpty()) {
                text += QStringLiteral(" (%1)").arg(result.message);
            }
            return text;
        case BatchOps::FileStatus::Error:
            text = tr("ERROR");
            if (!result.message.isEmpty()) {
                text += QStringLiteral(": %1").arg(result.message);
            }
            return text;
    }
    return text;
}

// =============================================================================
// Summary
// =============================================================================

void ConsoleProgress::reportSummary(const BatchOps::BatchResult& result, bool dryRun)
{
    if (m_mode == OutputMode::Json) {
        QJsonObject obj;
        obj["type"] = QStringLiteral("summary");
        obj["total"] = result.totalCount();
        obj["success"] = result.successCount;
        obj["skipped"] = result.skippedCount;
        obj["errors"] = result.errorCount;
        obj["warnings"] = result.warningCount();
        obj["elapsed_ms"] = static_cast<double>(result.elapsedMs);
        obj["dry_run"] = dryRun;
        writeJson(m_out, obj);
        return;
    }

    m_out << "\n" << (dryRun ? tr("Dry run: nothing was written.") + "\n" : QString());
    m_out << tr("%1 file(s): %2 converted").arg(result.totalCount()).arg(result.successCount);
    if (result.skippedCount > 0) {
        m_out << tr(", %1 skipped").arg(result.skippedCount);
    }
    if (result.errorCount > 0) {
        m_out << tr(", %1 failed").arg(result.errorCount);
    }
    if (result.warningCount() > 0) {
        m_out << tr(", %1 warning(s)").arg(result.warningCount());
    }
    m_out << " " << tr("in %1").arg(formatDuration(result.elapsedMs)) << "\n";
    m_out.flush();
}

// =============================================================================
// Errors and warnings (stderr)
// =============================================================================

void ConsoleProgress::reportError(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        writeJson(m_err, QJsonObject{ {"type", "error"}, {"message", message} });
    } else {
        m_err << tr("Error: ") << message << "\n";
        m_err.flush();
    }
}

void ConsoleProgress::reportWarning(const QString& message)
{
    if (m_mode == OutputMode::Json) {
        writeJson(m_err, QJsonObject{ {"type", "warning"}, {"message", message} });
    } else {
        m_err << tr("Warning: ") << message << "\n";
        m_err.flush();
    }
}

// =============================================================================
// Helpers
// =============================================================================

void ConsoleProgress::writeJson(QTextStream& stream, const QJsonObject& object)
{
    stream << QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact)) << "\n";
    stream.flush();
}

QString ConsoleProgress::formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    if (ms < 60 * 1000) {
        return QStringLiteral("%1 s").arg(ms / 1000.0, 0, 'f', 1);
    }
    return QStringLiteral("%1m %2s").arg(ms / 60000).arg((ms % 60000) / 1000);
}

QString ConsoleProgress::statusName(BatchOps::FileStatus status)
{
    switch (status) {
        case BatchOps::FileStatus::Success: return QStringLiteral("success");
        case BatchOps::FileStatus::Skipped: return QStringLiteral("skipped");
        case BatchOps::FileStatus::Error:   return QStringLiteral("error");
    }
    return QString();
}

QString ConsoleProgress::errorKindName(BatchOps::ErrorKind kind)
{
    switch (kind) {
        case BatchOps::ErrorKind::None:                 return QString();
        case BatchOps::ErrorKind::PathError:            return QStringLiteral("path");
        case BatchOps::ErrorKind::SchemaError:          return QStringLiteral("schema");
        case BatchOps::ErrorKind::ImageSizeUnavailable: return QStringLiteral("image_size_unavailable");
        case BatchOps::ErrorKind::InvalidOption:        return QStringLiteral("invalid_option");
        case BatchOps::ErrorKind::ReadFailed:           return QStringLiteral("read_failed");
        case BatchOps::ErrorKind::WriteFailed:          return QStringLiteral("write_failed");
    }
    return QString();
}

} // namespace Cli
