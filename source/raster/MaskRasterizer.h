#ifndef MASKRASTERIZER_H
#define MASKRASTERIZER_H

/**
 * @file MaskRasterizer.h
 * @brief Paints an AnnotationSet into a single-channel class-id raster.
 *
 * Annotations are painted in list order with antialiasing off, so every
 * pixel holds exactly one class id and identical input always gives
 * byte-identical output.
 */

#include "../annotations/AnnotationSet.h"
#include "../annotations/ClassTable.h"

#include <QImage>
#include <QString>
#include <QVector>

namespace MaskRasterizer {

/**
 * @brief Result of rasterizing one record.
 */
struct RasterizeResult {
    bool success = false;
    QImage mask;                        ///< Format_Grayscale8, background 0
    QString errorMessage;               ///< Why the item failed (success == false)
    QVector<AnnotationIssue> issues;    ///< Skipped annotations (warnings)
    int paintedCount = 0;               ///< Annotations actually painted
};

/**
 * @brief Resolve the raster size for a record.
 *
 * Uses the record's original size when valid, otherwise reads the size
 * from @p sourceImagePath (header only; the image is not decoded).
 *
 * @return The size, or an invalid QSize if neither source has one.
 */
QSize resolveSize(const AnnotationSet& set, const QString& sourceImagePath);

/**
 * @brief Paint the record into a class-id raster.
 *
 * - rectangle: filled, covering [min x, max x) x [min y, max y) after rounding
 * - line: stroked segment of @p thickness with round caps
 * - freehand: stroked open polyline of @p thickness (never filled);
 *   a single point becomes a round dot of @p thickness
 *
 * Annotations with a label missing from @p table, or with a point count
 * that does not fit their type, are skipped and listed in issues.
 * The item fails (ImageSizeUnavailable) only when no size can be resolved.
 *
 * @param thickness Stroke width in pixels for lines and freehand (> 0).
 * @param sourceImagePath Image to read the size from when the record has none.
 */
RasterizeResult rasterize(const AnnotationSet& set, const ClassTable& table,
                          int thickness, const QString& sourceImagePath = QString());

/**
 * @brief Map class ids to display intensities (see ClassTable::displayValue()).
 *
 * Values without a class in @p table are left unchanged.
 */
QImage toDisplayMask(const QImage& classMask, const ClassTable& table);

} // namespace MaskRasterizer

#endif // MASKRASTERIZER_H
