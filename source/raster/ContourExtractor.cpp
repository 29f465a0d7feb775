#include "ContourExtractor.h"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <QDebug>

#include <vector>

/**
 * @file ContourExtractor.cpp
 * @brief Implementation of per-class contour extraction.
 *
 * @see ContourExtractor.h for API documentation
 */

namespace ContourExtractor {

ExtractResult extract(const QImage& raster, const ClassTable& table,
                      const ExtractOptions& options)
{
    ExtractResult result;

    if (raster.isNull()) {
        return result;
    }

    const QImage gray = raster.format() == QImage::Format_Grayscale8
                        ? raster
                        : raster.convertToFormat(QImage::Format_Grayscale8);
    result.set.originalSize = gray.size();

    // Wrap the QImage rows without copying; gray outlives every use of src
    const cv::Mat src(gray.height(), gray.width(), CV_8UC1,
                      const_cast<uchar*>(gray.constBits()),
                      static_cast<size_t>(gray.bytesPerLine()));

    cv::Mat binary;
    for (const ClassTable::Entry& entry : table.entries()) {
        if (entry.id == ClassTable::BACKGROUND_ID && !options.includeBackground) {
            continue;
        }

        cv::inRange(src, cv::Scalar(entry.id), cv::Scalar(entry.id), binary);
        if (cv::countNonZero(binary) == 0) {
            continue;
        }

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

        int kept = 0;
        for (const std::vector<cv::Point>& contour : contours) {
            if (cv::contourArea(contour) < options.minArea) {
                result.droppedCount++;
                continue;
            }

            QVector<QPointF> points;
            points.reserve(static_cast<int>(contour.size()));
            for (const cv::Point& p : contour) {
                points.append(QPointF(p.x, p.y));
            }
            result.set.annotations.append(Annotation::freehand(entry.label, points));
            kept++;
        }

        if (kept > 0) {
            result.perClass.append(qMakePair(entry.label, kept));
        }
    }

#ifdef QT_DEBUG
    qDebug() << "ContourExtractor::extract:" << result.set.count() << "contours kept,"
             << result.droppedCount << "dropped";
#endif
    return result;
}

} // namespace ContourExtractor
