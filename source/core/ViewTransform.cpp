#include "ViewTransform.h"

#include <QtMath>
#include <QDebug>

// ============================================================================
// Layout
// ============================================================================

qreal ViewTransform::fitScale(QSize canvasSize) const
{
    const qreal sx = static_cast<qreal>(canvasSize.width()) / m_imageSize.width();
    const qreal sy = static_cast<qreal>(canvasSize.height()) / m_imageSize.height();
    return qMin(sx, sy) * INITIAL_MAGNIFICATION;
}

bool ViewTransform::fitToCanvas(QSize canvasSize, QSize imageSize)
{
    m_canvasSize = canvasSize;
    m_imageSize = imageSize;
    m_zoomLevel = 1.0;
    m_offset = QPointF(0, 0);

    if (!hasImage() || !isUsableCanvas(canvasSize)) {
        // Canvas not laid out yet; the first real resize completes the fit
        m_baseScale = 1.0;
        m_laidOut = false;
        return false;
    }

    m_baseScale = fitScale(canvasSize);
    const qreal scale = effectiveScale();

    // Center the scaled image in the canvas
    m_offset = QPointF((canvasSize.width() - m_imageSize.width() * scale) / 2.0,
                       (canvasSize.height() - m_imageSize.height() * scale) / 2.0);
    m_laidOut = true;

#ifdef QT_DEBUG
    qDebug() << "ViewTransform::fitToCanvas: canvas" << canvasSize << "image" << imageSize
             << "base scale" << m_baseScale << "offset" << m_offset;
#endif
    return true;
}

void ViewTransform::reset()
{
    m_imageSize = QSize();
    m_zoomLevel = 1.0;
    m_baseScale = 1.0;
    m_offset = QPointF(0, 0);
    m_laidOut = false;
}

bool ViewTransform::onCanvasResize(QSize newCanvasSize)
{
    if (!isUsableCanvas(newCanvasSize)) {
        return false;
    }
    if (newCanvasSize == m_canvasSize && m_laidOut) {
        return false;
    }
    if (!hasImage()) {
        m_canvasSize = newCanvasSize;
        return false;
    }
    if (!m_laidOut || !isUsableCanvas(m_canvasSize)) {
        // First real size for this image
        return fitToCanvas(newCanvasSize, m_imageSize);
    }

    // Original point at the OLD canvas center
    const QPointF oldCenter(m_canvasSize.width() / 2.0, m_canvasSize.height() / 2.0);
    const QPointF anchor = continuousViewToOriginal(oldCenter);

    // Base scale follows the canvas; the user's zoom level is kept
    m_canvasSize = newCanvasSize;
    m_baseScale = fitScale(newCanvasSize);

    // Put the same original point at the NEW center
    const QPointF newCenter(newCanvasSize.width() / 2.0, newCanvasSize.height() / 2.0);
    m_offset = newCenter - anchor * effectiveScale();
    return true;
}

// ============================================================================
// Navigation
// ============================================================================

bool ViewTransform::adjustZoom(qreal factor, QPointF pivot)
{
    if (!hasImage() || !m_laidOut) {
        return false;
    }

    const qreal newZoom = qBound(MIN_ZOOM, m_zoomLevel * factor, MAX_ZOOM);
    if (qAbs(newZoom - m_zoomLevel) < ZOOM_EPSILON) {
        return false;
    }

    // Original point under the pivot at the current zoom
    const QPointF anchor = continuousViewToOriginal(pivot);

    m_zoomLevel = newZoom;

    // pivot = anchor * scale + offset  =>  offset = pivot - anchor * scale
    m_offset = pivot - anchor * effectiveScale();
    return true;
}

bool ViewTransform::pan(QPointF delta)
{
    if (!hasImage() || !m_laidOut) {
        return false;
    }
    const QPointF before = m_offset;
    m_offset += delta;
    clampOffset();
    return m_offset != before;
}

void ViewTransform::panBounds(qreal* minX, qreal* maxX, qreal* minY, qreal* maxY) const
{
    const qreal scale = effectiveScale();
    const qreal slackX = m_canvasSize.width() - m_imageSize.width() * scale;
    const qreal slackY = m_canvasSize.height() - m_imageSize.height() * scale;
    *minX = qMin(0.0, slackX);
    *maxX = qMax(0.0, slackX);
    *minY = qMin(0.0, slackY);
    *maxY = qMax(0.0, slackY);
}

void ViewTransform::clampOffset()
{
    qreal minX, maxX, minY, maxY;
    panBounds(&minX, &maxX, &minY, &maxY);
    m_offset.setX(qBound(minX, m_offset.x(), maxX));
    m_offset.setY(qBound(minY, m_offset.y(), maxY));
}

qreal ViewTransform::effectiveScale() const
{
    const qreal scale = m_baseScale * m_zoomLevel;
    if (qAbs(scale) < SCALE_EPSILON) {
        return SCALE_FLOOR;
    }
    return scale;
}

// ============================================================================
// Coordinate maps
// ============================================================================

QRect ViewTransform::cropBox() const
{
    if (!hasImage() || !isUsableCanvas(m_canvasSize)) {
        return QRect();
    }

    const qreal scale = effectiveScale();
    const int imgW = m_imageSize.width();
    const int imgH = m_imageSize.height();

    const int rawX1 = qRound(-m_offset.x() / scale);
    const int rawY1 = qRound(-m_offset.y() / scale);
    const int rawW = qMax(1, qRound(m_canvasSize.width() / scale));
    const int rawH = qMax(1, qRound(m_canvasSize.height() / scale));

    int x1 = qBound(0, rawX1, imgW);
    int y1 = qBound(0, rawY1, imgH);
    int x2 = qBound(0, rawX1 + rawW, imgW);
    int y2 = qBound(0, rawY1 + rawH, imgH);

    // Never let the box collapse: grow to one pixel, then pull back inside
    if (x1 >= x2) {
        x2 = x1 + 1;
    }
    if (y1 >= y2) {
        y2 = y1 + 1;
    }
    x2 = qMin(imgW, x2);
    y2 = qMin(imgH, y2);
    x1 = qMax(0, qMin(x1, x2 - 1));
    y1 = qMax(0, qMin(y1, y2 - 1));

    return QRect(QPoint(x1, y1), QSize(x2 - x1, y2 - y1));
}

QPointF ViewTransform::viewToOriginal(QPointF viewPt) const
{
    const QRect crop = cropBox();
    if (crop.isEmpty()) {
        return continuousViewToOriginal(viewPt);
    }
    const qreal fx = viewPt.x() / m_canvasSize.width();
    const qreal fy = viewPt.y() / m_canvasSize.height();
    return QPointF(crop.x() + fx * crop.width(),
                   crop.y() + fy * crop.height());
}

QPointF ViewTransform::originalToView(QPointF originalPt, bool* visible) const
{
    const QRect crop = cropBox();
    if (crop.isEmpty()) {
        if (visible) {
            *visible = false;
        }
        return continuousOriginalToView(originalPt);
    }

    if (visible) {
        constexpr qreal eps = 1e-9;
        *visible = originalPt.x() >= crop.x() - eps &&
                   originalPt.x() <= crop.x() + crop.width() + eps &&
                   originalPt.y() >= crop.y() - eps &&
                   originalPt.y() <= crop.y() + crop.height() + eps;
    }

    const qreal fx = (originalPt.x() - crop.x()) / crop.width();
    const qreal fy = (originalPt.y() - crop.y()) / crop.height();
    return QPointF(fx * m_canvasSize.width(), fy * m_canvasSize.height());
}

QPointF ViewTransform::continuousViewToOriginal(QPointF viewPt) const
{
    return (viewPt - m_offset) / effectiveScale();
}

QPointF ViewTransform::continuousOriginalToView(QPointF originalPt) const
{
    return originalPt * effectiveScale() + m_offset;
}
