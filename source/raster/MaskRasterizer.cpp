#include "MaskRasterizer.h"

#include <QColor>
#include <QImageReader>
#include <QPainter>
#include <QPen>
#include <QPolygon>
#include <QDebug>

/**
 * @file MaskRasterizer.cpp
 * @brief Implementation of class-id mask rasterization.
 *
 * Painting happens on an RGB32 canvas with gray colors (r == g == b == id)
 * and the red channel is copied out afterwards. This keeps the ids exact
 * regardless of how the painter converts colors for grayscale targets.
 *
 * @see MaskRasterizer.h for API documentation
 */

namespace MaskRasterizer {

namespace {

QPoint roundedPoint(const QPointF& p)
{
    return QPoint(qRound(p.x()), qRound(p.y()));
}

QImage redChannelToGray(const QImage& rgb)
{
    QImage gray(rgb.size(), QImage::Format_Grayscale8);
    for (int y = 0; y < rgb.height(); ++y) {
        const QRgb* src = reinterpret_cast<const QRgb*>(rgb.constScanLine(y));
        uchar* dst = gray.scanLine(y);
        for (int x = 0; x < rgb.width(); ++x) {
            dst[x] = static_cast<uchar>(qRed(src[x]));
        }
    }
    return gray;
}

} // namespace

QSize resolveSize(const AnnotationSet& set, const QString& sourceImagePath)
{
    if (set.originalSize.isValid() && !set.originalSize.isEmpty()) {
        return set.originalSize;
    }
    if (sourceImagePath.isEmpty()) {
        return QSize();
    }

    QImageReader reader(sourceImagePath);
    QSize size = reader.size();
    if (!size.isValid()) {
        // Some formats only report a size after decoding
        const QImage image = reader.read();
        size = image.size();
    }
    return size.isEmpty() ? QSize() : size;
}

RasterizeResult rasterize(const AnnotationSet& set, const ClassTable& table,
                          int thickness, const QString& sourceImagePath)
{
    RasterizeResult result;

    if (thickness <= 0) {
        result.errorMessage = QStringLiteral("line thickness must be positive, got %1").arg(thickness);
        return result;
    }

    const QSize size = resolveSize(set, sourceImagePath);
    if (!size.isValid()) {
        result.errorMessage = sourceImagePath.isEmpty()
            ? QStringLiteral("record has no original_size and no source image was found")
            : QStringLiteral("record has no original_size and %1 could not be read").arg(sourceImagePath);
        result.issues.append({ AnnotationIssue::Kind::ImageSizeUnavailable, -1, result.errorMessage });
        return result;
    }

    QImage canvas(size, QImage::Format_RGB32);
    canvas.fill(qRgb(0, 0, 0));

    QPainter painter(&canvas);
    painter.setRenderHint(QPainter::Antialiasing, false);

    for (int i = 0; i < set.annotations.size(); ++i) {
        const Annotation& a = set.annotations.at(i);

        const int classId = table.idForLabel(a.label);
        if (classId < 0) {
            result.issues.append({ AnnotationIssue::Kind::UnknownLabel, i,
                                   QStringLiteral("label '%1' is not in the class table").arg(a.label) });
            continue;
        }
        if (!a.hasValidArity()) {
            result.issues.append({ AnnotationIssue::Kind::SchemaError, i,
                                   QStringLiteral("%1 with %2 point(s)")
                                       .arg(Annotation::typeToString(a.type))
                                       .arg(a.points.size()) });
            continue;
        }

        const QColor color(classId, classId, classId);
        QPen pen(color, thickness, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin);

        switch (a.type) {
            case Annotation::Type::Rectangle: {
                const QPoint p1 = roundedPoint(a.points[0]);
                const QPoint p2 = roundedPoint(a.points[1]);
                const int x1 = qMin(p1.x(), p2.x());
                const int x2 = qMax(p1.x(), p2.x());
                const int y1 = qMin(p1.y(), p2.y());
                const int y2 = qMax(p1.y(), p2.y());
                if (x2 <= x1 || y2 <= y1) {
                    result.issues.append({ AnnotationIssue::Kind::DegenerateGeometry, i,
                                           QStringLiteral("rectangle has no area") });
                    continue;
                }
                painter.fillRect(QRect(x1, y1, x2 - x1, y2 - y1), color);
                break;
            }
            case Annotation::Type::Line: {
                const QPoint p1 = roundedPoint(a.points[0]);
                const QPoint p2 = roundedPoint(a.points[1]);
                painter.setPen(pen);
                if (p1 == p2) {
                    painter.drawPoint(p1);
                } else {
                    painter.drawLine(p1, p2);
                }
                break;
            }
            case Annotation::Type::Freehand: {
                QPolygon polyline;
                for (const QPointF& p : a.points) {
                    const QPoint q = roundedPoint(p);
                    if (polyline.isEmpty() || polyline.last() != q) {
                        polyline << q;
                    }
                }
                painter.setPen(pen);
                painter.setBrush(Qt::NoBrush);
                if (polyline.size() == 1) {
                    painter.drawPoint(polyline.first());
                } else {
                    // Open polyline: the stroke is not closed and not filled
                    painter.drawPolyline(polyline);
                }
                break;
            }
        }
        result.paintedCount++;
    }

    painter.end();

    result.mask = redChannelToGray(canvas);
    result.success = true;
    return result;
}

QImage toDisplayMask(const QImage& classMask, const ClassTable& table)
{
    QImage source = classMask.format() == QImage::Format_Grayscale8
                    ? classMask
                    : classMask.convertToFormat(QImage::Format_Grayscale8);

    uchar lut[256];
    for (int v = 0; v < 256; ++v) {
        lut[v] = static_cast<uchar>(table.containsId(v) ? table.displayValue(v) : v);
    }

    QImage display(source.size(), QImage::Format_Grayscale8);
    for (int y = 0; y < source.height(); ++y) {
        const uchar* src = source.constScanLine(y);
        uchar* dst = display.scanLine(y);
        for (int x = 0; x < source.width(); ++x) {
            dst[x] = lut[src[x]];
        }
    }
    return display;
}

} // namespace MaskRasterizer
