// ============================================================================
// AnnotationCanvas - Widget surface of a LabelingSession
// ============================================================================
// Paints the visible crop box of the current image stretched over the
// canvas, then overlays the image's annotations and the shape in progress.
//
// All state lives in the session; the canvas only translates Qt events into
// session calls and repaints when the session emits changed(). Resize events
// are routed through a ResizeDebouncer so the view is refit once per burst.
// ============================================================================

#pragma once

#include "../annotations/Annotation.h"
#include "../core/ResizeDebouncer.h"

#include <QWidget>

class LabelingSession;
class QPainter;

class AnnotationCanvas : public QWidget {
    Q_OBJECT

public:
    /**
     * @brief Construct a canvas for @p session (not owned).
     */
    explicit AnnotationCanvas(LabelingSession* session, QWidget* parent = nullptr);

    /**
     * @brief Offer to save unsaved annotations.
     * @return False if the user cancelled or saving failed; the caller
     *         should then abort whatever would discard the annotations.
     */
    bool maybeSave();

    /**
     * @brief Save all records, reporting failures in a message box.
     */
    bool saveAnnotations();

    static QColor colorForType(Annotation::Type type);

    QSize sizeHint() const override { return QSize(800, 600); }

signals:
    /// @brief Records were written (for the status bar).
    void saved(int savedCount, int deletedCount);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private slots:
    void onSessionChanged();
    void onAnnotationClicked(int index);

private:
    void drawAnnotation(QPainter& painter, const Annotation& annotation, bool hovered);
    void drawPreview(QPainter& painter);
    void updateCursor();

    LabelingSession* m_session = nullptr;
    ResizeDebouncer m_resizeDebouncer;
};
