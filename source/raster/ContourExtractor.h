#ifndef CONTOUREXTRACTOR_H
#define CONTOUREXTRACTOR_H

/**
 * @file ContourExtractor.h
 * @brief Decomposes a class-id raster into freehand outline annotations.
 *
 * For every class in the table, the pixels equal to its id form a binary
 * mask whose outer contours become freehand annotations labeled with the
 * class. Holes are not represented; tiny contours are discarded as noise.
 */

#include "../annotations/AnnotationSet.h"
#include "../annotations/ClassTable.h"

#include <QImage>
#include <QList>
#include <QPair>
#include <QString>

namespace ContourExtractor {

constexpr double MIN_CONTOUR_AREA = 4.0;

/**
 * @brief Options for extract().
 */
struct ExtractOptions {
    bool includeBackground = false;         ///< Also trace id 0
    double minArea = MIN_CONTOUR_AREA;      ///< Contours with a smaller area are dropped
};

/**
 * @brief Result of extract().
 */
struct ExtractResult {
    AnnotationSet set;                      ///< original_size is the raster size
    QList<QPair<QString, int>> perClass;    ///< (label, contours kept) for classes that had any
    int droppedCount = 0;                   ///< Contours discarded for being too small
};

/**
 * @brief Trace the outer contours of every class in @p table.
 *
 * Classes are visited in table order; within a class contours keep the
 * order in which they were found. A contour reduced to a single point is
 * emitted as a one-point freehand annotation.
 *
 * @param raster Class-id raster; converted to 8-bit grayscale if needed.
 */
ExtractResult extract(const QImage& raster, const ClassTable& table,
                      const ExtractOptions& options = ExtractOptions());

} // namespace ContourExtractor

#endif // CONTOUREXTRACTOR_H
