#ifndef CLIPROGRESS_H
#define CLIPROGRESS_H

/**
 * @file CliProgress.h
 * @brief Terminal reporting for the batch commands.
 *
 * Results go to stdout, errors and warnings to stderr, so `--json` output
 * on stdout stays one parseable object per line:
 *
 *   {"type":"file","input":"...","output":"...","status":"success","annotations":3,"warnings":[]}
 *   {"type":"summary","total":10,"success":9,"skipped":0,"errors":1,...}
 */

#include "CliParser.h"
#include "../batch/BatchOperations.h"

#include <QJsonObject>
#include <QTextStream>

namespace Cli {

/**
 * @brief Formats per-file results and the final summary.
 *
 * Hand callback() and resultCallback() to the BatchOps functions; every
 * file is then printed as soon as it is done.
 */
class ConsoleProgress {
public:
    explicit ConsoleProgress(OutputMode mode = OutputMode::Simple);

    /**
     * @brief Called before each file. Only Verbose mode prints anything.
     */
    BatchOps::ProgressCallback callback();

    /**
     * @brief Called after each file; prints it and honors --fail-fast.
     */
    BatchOps::ResultCallback resultCallback(bool failFast);

    void reportFile(int index, int total, const BatchOps::FileResult& result);
    void reportSummary(const BatchOps::BatchResult& result, bool dryRun);

    void reportError(const QString& message);
    void reportWarning(const QString& message);

    /// "850 ms", "12.4 s" or "3m 5s".
    static QString formatDuration(qint64 ms);

private:
    QString statusText(const BatchOps::FileResult& result) const;
    void writeJson(QTextStream& stream, const QJsonObject& object);

    static QString statusName(BatchOps::FileStatus status);
    static QString errorKindName(BatchOps::ErrorKind kind);

    OutputMode m_mode;
    QTextStream m_out;
    QTextStream m_err;
};

} // namespace Cli

#endif // CLIPROGRESS_H
