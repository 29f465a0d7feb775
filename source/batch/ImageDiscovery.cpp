#include "ImageDiscovery.h"

#include <QDir>
#include <QFileInfo>

/**
 * @file ImageDiscovery.cpp
 * @brief Implementation of file discovery for labeling and batch conversion.
 *
 * @see ImageDiscovery.h for API documentation
 */

namespace BatchOps {

QStringList labelingImageExtensions()
{
    return { "png", "jpg", "jpeg", "bmp", "gif", "tiff", "tif" };
}

QStringList maskImageExtensions()
{
    return { "png", "bmp", "jpg", "jpeg", "tif", "tiff" };
}

QStringList sourceImageExtensions()
{
    return { "png", "jpg", "jpeg", "bmp", "tiff", "tif" };
}

QStringList discoverFiles(const QString& directory, const QStringList& extensions)
{
    QStringList results;

    QDir dir(directory);
    if (!dir.exists()) {
        return results;
    }

    QStringList filters;
    for (const QString& ext : extensions) {
        filters << QStringLiteral("*.") + ext;
    }
    dir.setNameFilters(filters);

    // Name filters match case-insensitively unless QDir::CaseSensitive is set
    const QFileInfoList entries = dir.entryInfoList(QDir::Files, QDir::Name);
    for (const QFileInfo& info : entries) {
        results << info.absoluteFilePath();
    }
    return results;
}

QString findMatchingImage(const QString& directory, const QString& baseName)
{
    const QDir dir(directory);
    for (const QString& ext : sourceImageExtensions()) {
        for (const QString& candidate : { ext, ext.toUpper() }) {
            const QString path = dir.filePath(baseName + QLatin1Char('.') + candidate);
            if (QFileInfo::exists(path)) {
                return QFileInfo(path).absoluteFilePath();
            }
        }
    }
    return QString();
}

} // namespace BatchOps
