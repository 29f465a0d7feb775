#ifndef IMAGEDISCOVERY_H
#define IMAGEDISCOVERY_H

/**
 * @file ImageDiscovery.h
 * @brief Utilities for finding images, masks and annotation records on disk.
 *
 * Provides functions to:
 * - List the images of a labeling folder
 * - List mask rasters and annotation records for batch conversion
 * - Find the source image that belongs to an annotation record
 */

#include <QString>
#include <QStringList>

namespace BatchOps {

/**
 * @brief Extensions (lower case, no dot) of images that can be labeled.
 */
QStringList labelingImageExtensions();

/**
 * @brief Extensions (lower case, no dot) accepted as mask rasters.
 */
QStringList maskImageExtensions();

/**
 * @brief Extensions tried, in order, when looking for a record's source image.
 */
QStringList sourceImageExtensions();

/**
 * @brief List files in @p directory whose extension is in @p extensions.
 *
 * The match is case-insensitive. Only the directory itself is searched.
 *
 * @return Absolute paths, sorted by file name.
 */
QStringList discoverFiles(const QString& directory, const QStringList& extensions);

/**
 * @brief Find the image named @p baseName in @p directory.
 *
 * Tries each of sourceImageExtensions() in lower and upper case.
 *
 * @return Absolute path, or an empty string if no image matches.
 */
QString findMatchingImage(const QString& directory, const QString& baseName);

} // namespace BatchOps

#endif // IMAGEDISCOVERY_H
