#include "AnnotationStore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QDebug>

// ============================================================================
// Mutation
// ============================================================================

bool AnnotationStore::append(const QString& imageId, const Annotation& annotation,
                             QSize imageSize, QString* reason)
{
    auto reject = [reason](const QString& msg) {
        if (reason) {
            *reason = msg;
        }
        return false;
    };

    if (imageId.isEmpty()) {
        return reject(QStringLiteral("no image selected"));
    }
    if (annotation.label.trimmed().isEmpty()) {
        return reject(QStringLiteral("annotation has no label"));
    }
    if (!annotation.hasValidArity()) {
        return reject(QStringLiteral("%1 has %2 point(s)")
                          .arg(Annotation::typeToString(annotation.type))
                          .arg(annotation.points.size()));
    }
    if (annotation.isDegenerate()) {
        return reject(QStringLiteral("%1 is smaller than one pixel")
                          .arg(Annotation::typeToString(annotation.type)));
    }

    AnnotationSet& record = m_records[imageId];
    if (!record.originalSize.isValid() && imageSize.isValid()) {
        record.originalSize = imageSize;
    }
    record.annotations.append(annotation);
    m_dirty = true;
    return true;
}

bool AnnotationStore::deleteAt(const QString& imageId, int index)
{
    auto it = m_records.find(imageId);
    if (it == m_records.end()) {
        return false;
    }
    if (index < 0 || index >= it->annotations.size()) {
        return false;
    }
    it->annotations.removeAt(index);
    m_dirty = true;
    return true;
}

bool AnnotationStore::clear(const QString& imageId, QSize imageSize)
{
    if (imageId.isEmpty()) {
        return false;
    }

    auto it = m_records.find(imageId);
    if (it == m_records.end()) {
        // Keep an empty record so the next save removes any stale file
        it = m_records.insert(imageId, AnnotationSet());
    }
    it->annotations.clear();
    if (!it->originalSize.isValid()) {
        it->originalSize = imageSize;
    }
    m_dirty = true;
    return true;
}

void AnnotationStore::reset()
{
    m_records.clear();
    m_dirty = false;
}

// ============================================================================
// Persistence
// ============================================================================

AnnotationStore::SaveResult AnnotationStore::save(const QString& targetDir)
{
    SaveResult result;

    if (!QDir().mkpath(targetDir)) {
        result.errorCount = 1;
        result.errors << QStringLiteral("cannot create directory %1").arg(targetDir);
        qWarning() << "AnnotationStore::save: cannot create" << targetDir;
        return result;
    }

    // Images that differ only by extension share one record file
    QHash<QString, int> nonEmptyByFile;
    for (auto it = m_records.cbegin(); it != m_records.cend(); ++it) {
        if (!it->isEmpty()) {
            nonEmptyByFile[recordFileName(it.key())]++;
        }
    }

    const QDir dir(targetDir);
    QHash<QString, QString> writtenBy;
    for (auto it = m_records.cbegin(); it != m_records.cend(); ++it) {
        const QString fileName = recordFileName(it.key());
        const QString path = dir.filePath(fileName);

        if (it->isEmpty() && nonEmptyByFile.value(fileName) > 0) {
            // The file belongs to another image with annotations
            continue;
        }
        if (!it->isEmpty() && writtenBy.contains(fileName)) {
            result.errorCount++;
            result.errors << QStringLiteral("%1 and %2 share the record file %3; %2 was not saved")
                                 .arg(writtenBy.value(fileName), it.key(), fileName);
            qWarning() << "AnnotationStore::save: record name collision" << it.key() << fileName;
            continue;
        }

        if (it->isEmpty()) {
            // Nothing left for this image: make sure no empty record survives on disk
            if (QFile::exists(path)) {
                if (QFile::remove(path)) {
                    result.deletedCount++;
                } else {
                    result.errorCount++;
                    result.errors << QStringLiteral("cannot remove %1").arg(path);
                    qWarning() << "AnnotationStore::save: cannot remove" << path;
                }
            }
            continue;
        }

        QString err;
        if (it->saveToFile(path, &err)) {
            result.savedCount++;
            writtenBy.insert(fileName, it.key());
        } else {
            result.errorCount++;
            result.errors << err;
            qWarning() << "AnnotationStore::save:" << err;
        }
    }

    if (result.success()) {
        m_dirty = false;
    }

#ifdef QT_DEBUG
    qDebug() << "AnnotationStore::save:" << result.savedCount << "saved,"
             << result.deletedCount << "deleted," << result.errorCount << "errors";
#endif
    return result;
}

AnnotationStore::LoadStatus AnnotationStore::load(const QString& imageId,
                                                  const QString& recordDir,
                                                  QString* errorMessage)
{
    if (m_records.contains(imageId)) {
        return LoadStatus::AlreadyLoaded;
    }

    const QString path = QDir(recordDir).filePath(recordFileName(imageId));
    if (!QFileInfo::exists(path)) {
        return LoadStatus::NotFound;
    }

    AnnotationSet record;
    QVector<AnnotationIssue> issues;
    if (!AnnotationSet::loadFromFile(path, &record, &issues, errorMessage)) {
        qWarning() << "AnnotationStore::load: failed to read" << path;
        return LoadStatus::ParseError;
    }
    for (const AnnotationIssue& issue : issues) {
        qWarning() << "AnnotationStore::load:" << path << issue.toString();
    }

    m_records.insert(imageId, record);
    return LoadStatus::Loaded;
}

// ============================================================================
// Queries
// ============================================================================

QVector<Annotation> AnnotationStore::annotations(const QString& imageId) const
{
    return m_records.value(imageId).annotations;
}

AnnotationSet AnnotationStore::annotationSet(const QString& imageId) const
{
    return m_records.value(imageId);
}

QString AnnotationStore::recordFileName(const QString& imageId)
{
    return QFileInfo(imageId).completeBaseName() + QStringLiteral(".json");
}
