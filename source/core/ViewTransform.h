#pragma once

// ============================================================================
// ViewTransform - Mapping between original-image pixels and view pixels
// ============================================================================
// Pure geometry: no widget, no painting. The canvas queries it for the crop
// box to display, and the drawing layer uses it to convert pointer positions
// into original-image coordinates.
// ============================================================================

#include <QPointF>
#include <QRect>
#include <QSize>

/**
 * @brief Zoom/pan state of one displayed image and the coordinate maps it defines.
 *
 * The effective scale is baseScale * zoomLevel, where baseScale fits the
 * whole image into the canvas. offset is the view position of the image's
 * top-left corner.
 *
 * What is actually shown is the crop box: the visible part of the image,
 * rounded to whole pixels and clamped to the image, stretched to fill the
 * canvas. viewToOriginal() and originalToView() both go through that same
 * crop box, so they agree with what is on screen but are only inverse up to
 * rounding (within about one view pixel).
 */
class ViewTransform {
public:
    // ===== Constants =====
    static constexpr qreal MIN_ZOOM = 0.02;
    static constexpr qreal MAX_ZOOM = 100.0;
    static constexpr qreal INITIAL_MAGNIFICATION = 1.0;
    static constexpr qreal ZOOM_EPSILON = 1e-5;     ///< Smaller zoom changes are ignored
    static constexpr qreal SCALE_EPSILON = 1e-9;    ///< Scales below this are treated as zero
    static constexpr qreal SCALE_FLOOR = 0.01;      ///< Substitute for a vanishing scale

    ViewTransform() = default;

    // ===== Layout =====

    /**
     * @brief Fit the whole image into the canvas, centered, at zoom 1.
     *
     * Used when an image is loaded and for "reset view".
     *
     * @return False if the canvas is not laid out yet (a side of 1 px or less)
     *         or the image is empty. The sizes are still recorded so a later
     *         resize can complete the layout.
     */
    bool fitToCanvas(QSize canvasSize, QSize imageSize);

    /**
     * @brief Re-fit using the current canvas and image sizes.
     */
    bool resetView() { return fitToCanvas(m_canvasSize, m_imageSize); }

    /**
     * @brief Drop the image; the transform becomes inert.
     */
    void reset();

    /**
     * @brief React to a new canvas size.
     *
     * Keeps the original point that was under the canvas center under the
     * new center. The base scale is recomputed for the new canvas; the zoom
     * level is kept. Sizes of 1 px or less are ignored.
     *
     * @return True if the state changed.
     */
    bool onCanvasResize(QSize newCanvasSize);

    // ===== Navigation =====

    /**
     * @brief Multiply the zoom level by @p factor, anchored at @p pivot.
     *
     * The zoom level is clamped to [MIN_ZOOM, MAX_ZOOM]; if the clamped
     * level differs from the current one by less than ZOOM_EPSILON nothing
     * happens. Otherwise the original point under @p pivot stays there.
     *
     * @return True if the zoom level changed.
     */
    bool adjustZoom(qreal factor, QPointF pivot);

    /**
     * @brief Shift the image by @p delta view pixels, clamped to the pan bounds.
     * @return True if the offset changed.
     */
    bool pan(QPointF delta);

    // ===== Coordinate maps =====

    /**
     * @brief Visible part of the image in original pixels.
     *
     * Left/top are rounded, the extent is max(1, round(canvas / scale)),
     * then the box is clamped to the image. A box that collapses to nothing
     * is grown back to one pixel and clamped again.
     */
    QRect cropBox() const;

    /**
     * @brief View position to original-image position through the crop box.
     */
    QPointF viewToOriginal(QPointF viewPt) const;

    /**
     * @brief Original-image position to view position through the crop box.
     * @param visible If given, set to whether the point lies inside the crop box.
     */
    QPointF originalToView(QPointF originalPt, bool* visible = nullptr) const;

    /**
     * @brief Unrounded affine map (viewPt - offset) / scale.
     *
     * This is the continuous model the crop box approximates. Zoom and
     * resize anchoring are computed with it.
     */
    QPointF continuousViewToOriginal(QPointF viewPt) const;
    QPointF continuousOriginalToView(QPointF originalPt) const;

    // ===== State =====

    bool hasImage() const { return !m_imageSize.isEmpty(); }

    /// @return True once fitToCanvas() succeeded for the current image.
    bool isLaidOut() const { return m_laidOut; }

    qreal zoomLevel() const { return m_zoomLevel; }
    qreal baseScale() const { return m_baseScale; }

    /// @return baseScale * zoomLevel, never zero.
    qreal effectiveScale() const;

    QPointF offset() const { return m_offset; }
    QSize canvasSize() const { return m_canvasSize; }
    QSize imageSize() const { return m_imageSize; }

    /**
     * @brief Allowed offset range on one axis.
     *
     * [min(0, canvas - extent), max(0, canvas - extent)] where extent is the
     * scaled image size. When the image is smaller than the canvas this
     * allows it to move anywhere inside the canvas.
     */
    void panBounds(qreal* minX, qreal* maxX, qreal* minY, qreal* maxY) const;

private:
    static bool isUsableCanvas(QSize size) { return size.width() > 1 && size.height() > 1; }
    qreal fitScale(QSize canvasSize) const;
    void clampOffset();

    QSize m_imageSize;
    QSize m_canvasSize;
    qreal m_zoomLevel = 1.0;
    qreal m_baseScale = 1.0;
    QPointF m_offset;
    bool m_laidOut = false;
};
