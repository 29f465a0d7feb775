#include "AnnotationCanvas.h"
#include "../core/LabelingSession.h"

#include <QPainter>
#include <QPaintEvent>
#include <QResizeEvent>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QKeyEvent>
#include <QMessageBox>
#include <QDebug>

namespace {

constexpr qreal OUTLINE_WIDTH = 2.0;
constexpr qreal HOVER_WIDTH = 4.0;
const QColor BACKGROUND_COLOR(64, 64, 64);

} // namespace

AnnotationCanvas::AnnotationCanvas(LabelingSession* session, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
{
    setMouseTracking(true);                     // hover highlight in Select mode
    setFocusPolicy(Qt::StrongFocus);
    setContextMenuPolicy(Qt::PreventContextMenu);  // right button pans
    setAttribute(Qt::WA_OpaquePaintEvent);

    connect(m_session, &LabelingSession::changed, this, &AnnotationCanvas::onSessionChanged);
    connect(m_session, &LabelingSession::annotationClicked, this, &AnnotationCanvas::onAnnotationClicked);
    connect(&m_resizeDebouncer, &ResizeDebouncer::resizeSettled,
            m_session, &LabelingSession::canvasResized);

    updateCursor();
}

// ============================================================================
// Saving
// ============================================================================

bool AnnotationCanvas::maybeSave()
{
    if (!m_session->isDirty()) {
        return true;
    }

    const QMessageBox::StandardButton reply = QMessageBox::question(
        this, tr("Unsaved Annotations"),
        tr("There are unsaved annotations. Save them before continuing?"),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
        QMessageBox::Save);

    if (reply == QMessageBox::Cancel) {
        return false;
    }
    if (reply == QMessageBox::Discard) {
        return true;
    }
    return saveAnnotations();
}

bool AnnotationCanvas::saveAnnotations()
{
    const AnnotationStore::SaveResult result = m_session->save();
    if (!result.success()) {
        QMessageBox::warning(this, tr("Save Failed"),
                             tr("%n record(s) could not be saved:", nullptr, result.errorCount)
                             + QStringLiteral("\n\n") + result.errors.join(QLatin1Char('\n')));
        return false;
    }
    emit saved(result.savedCount, result.deletedCount);
    return true;
}

QColor AnnotationCanvas::colorForType(Annotation::Type type)
{
    switch (type) {
        case Annotation::Type::Rectangle: return Qt::red;
        case Annotation::Type::Line:      return Qt::blue;
        case Annotation::Type::Freehand:  return Qt::green;
    }
    return Qt::white;
}

// ============================================================================
// Painting
// ============================================================================

void AnnotationCanvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), BACKGROUND_COLOR);

    const ViewTransform& transform = m_session->transform();
    if (!m_session->hasImage() || !transform.isLaidOut()) {
        painter.setPen(QColor(200, 200, 200));
        painter.drawText(rect(), Qt::AlignCenter,
                         m_session->imageCount() == 0
                             ? tr("Open a folder of images to start labeling")
                             : tr("Loading..."));
        return;
    }

    // The crop box covers the whole canvas the transform was laid out for.
    // Until a pending resize settles the widget may be larger or smaller.
    const QRect crop = transform.cropBox();
    const QRectF target(QPointF(0, 0), QSizeF(transform.canvasSize()));
    if (!crop.isEmpty()) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform, transform.effectiveScale() < 1.0);
        painter.drawImage(target, m_session->currentImage(), QRectF(crop));
    }

    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setClipRect(target);

    const QVector<Annotation> annotations = m_session->currentAnnotations();
    for (int i = 0; i < annotations.size(); ++i) {
        drawAnnotation(painter, annotations.at(i), i == m_session->hoveredIndex());
    }

    drawPreview(painter);
}

void AnnotationCanvas::drawAnnotation(QPainter& painter, const Annotation& annotation, bool hovered)
{
    if (annotation.points.isEmpty()) {
        return;
    }

    const ViewTransform& transform = m_session->transform();
    QVector<QPointF> viewPts;
    viewPts.reserve(annotation.points.size());
    for (const QPointF& pt : annotation.points) {
        viewPts.append(transform.originalToView(pt));
    }

    const QColor color = colorForType(annotation.type);
    QPen pen(color, hovered ? HOVER_WIDTH : OUTLINE_WIDTH);
    pen.setCapStyle(Qt::RoundCap);
    pen.setJoinStyle(Qt::RoundJoin);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);

    switch (annotation.type) {
        case Annotation::Type::Rectangle:
            if (viewPts.size() == 2) {
                painter.drawRect(QRectF(viewPts[0], viewPts[1]).normalized());
            }
            break;
        case Annotation::Type::Line:
            if (viewPts.size() == 2) {
                painter.drawLine(viewPts[0], viewPts[1]);
            }
            break;
        case Annotation::Type::Freehand:
            if (viewPts.size() == 1) {
                painter.drawPoint(viewPts[0]);
            } else {
                // Open stroke, never closed or filled
                painter.drawPolyline(viewPts.constData(), viewPts.size());
            }
            break;
    }

    // Label just above the first point
    QFont font = painter.font();
    font.setBold(hovered);
    painter.setFont(font);
    painter.drawText(viewPts.first() + QPointF(2, -4), annotation.label);
}

void AnnotationCanvas::drawPreview(QPainter& painter)
{
    const DrawingController& drawing = m_session->drawing();
    if (!drawing.isDrawing()) {
        return;
    }
    const QVector<QPointF>& pts = drawing.previewPoints();
    if (pts.isEmpty()) {
        return;
    }

    Annotation::Type type = Annotation::Type::Freehand;
    if (drawing.tool() == ToolType::Rectangle) {
        type = Annotation::Type::Rectangle;
    } else if (drawing.tool() == ToolType::Line) {
        type = Annotation::Type::Line;
    }

    QPen pen(colorForType(type), OUTLINE_WIDTH, Qt::DashLine);
    pen.setCapStyle(Qt::RoundCap);
    painter.setPen(pen);
    painter.setBrush(Qt::NoBrush);

    switch (type) {
        case Annotation::Type::Rectangle:
            painter.drawRect(QRectF(pts.first(), pts.last()).normalized());
            break;
        case Annotation::Type::Line:
            painter.drawLine(pts.first(), pts.last());
            break;
        case Annotation::Type::Freehand:
            painter.setPen(QPen(colorForType(type), OUTLINE_WIDTH, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
            painter.drawPolyline(pts.constData(), pts.size());
            break;
    }
}

// ============================================================================
// Events
// ============================================================================

void AnnotationCanvas::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);

    // First layout of an image is applied at once; later bursts are coalesced
    if (!m_session->transform().isLaidOut()) {
        m_resizeDebouncer.cancel();
        m_session->canvasResized(event->size());
        return;
    }
    m_resizeDebouncer.notify(event->size());
}

void AnnotationCanvas::mousePressEvent(QMouseEvent* event)
{
    // Touch is not a drawing source
    if (event->source() == Qt::MouseEventSynthesizedBySystem) {
        event->ignore();
        return;
    }
    m_session->pointerPressed(event->position(), event->button());
    event->accept();
}

void AnnotationCanvas::mouseMoveEvent(QMouseEvent* event)
{
    if (event->source() == Qt::MouseEventSynthesizedBySystem) {
        event->ignore();
        return;
    }
    m_session->pointerMoved(event->position(), event->buttons());
    event->accept();
}

void AnnotationCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (event->source() == Qt::MouseEventSynthesizedBySystem) {
        event->ignore();
        return;
    }
    m_session->pointerReleased(event->position(), event->button());
    event->accept();
}

void AnnotationCanvas::wheelEvent(QWheelEvent* event)
{
    if (!m_session->hasImage()) {
        event->ignore();
        return;
    }

    const int delta = event->angleDelta().y();
    if (delta != 0) {
        m_session->wheelZoom(delta, event->position());
    }
    event->accept();
}

void AnnotationCanvas::keyPressEvent(QKeyEvent* event)
{
    // Tool switching and navigation shortcuts
    switch (event->key()) {
        case Qt::Key_R:
            m_session->setTool(ToolType::Rectangle);
            break;
        case Qt::Key_L:
            m_session->setTool(ToolType::Line);
            break;
        case Qt::Key_F:
            m_session->setTool(ToolType::Freehand);
            break;
        case Qt::Key_S:
            if (event->modifiers() & Qt::ControlModifier) {
                QWidget::keyPressEvent(event);
                return;
            }
            m_session->setTool(ToolType::Select);
            break;
        case Qt::Key_Left:
        case Qt::Key_PageUp:
            m_session->previousImage();
            break;
        case Qt::Key_Right:
        case Qt::Key_PageDown:
            m_session->nextImage();
            break;
        case Qt::Key_Plus:
        case Qt::Key_Equal:
            m_session->zoomIn();
            break;
        case Qt::Key_Minus:
            m_session->zoomOut();
            break;
        case Qt::Key_0:
            m_session->resetView();
            break;
        default:
            QWidget::keyPressEvent(event);
            return;
    }
    event->accept();
}

// ============================================================================
// Session notifications
// ============================================================================

void AnnotationCanvas::onSessionChanged()
{
    updateCursor();
    update();
}

void AnnotationCanvas::onAnnotationClicked(int index)
{
    const QVector<Annotation> annotations = m_session->currentAnnotations();
    if (index < 0 || index >= annotations.size()) {
        return;
    }
    const Annotation& annotation = annotations.at(index);

    const QMessageBox::StandardButton reply = QMessageBox::question(
        this, tr("Delete Annotation"),
        tr("Delete %1 '%2'?").arg(Annotation::typeToString(annotation.type), annotation.label),
        QMessageBox::Yes | QMessageBox::No, QMessageBox::No);

    if (reply == QMessageBox::Yes && !m_session->deleteAnnotation(index)) {
        qWarning() << "AnnotationCanvas: annotation" << index << "vanished before delete";
    }
}

void AnnotationCanvas::updateCursor()
{
    if (m_session->isPanning()) {
        setCursor(Qt::ClosedHandCursor);
    } else if (m_session->tool() == ToolType::Select) {
        setCursor(m_session->hoveredIndex() >= 0 ? Qt::PointingHandCursor : Qt::ArrowCursor);
    } else {
        setCursor(Qt::CrossCursor);
    }
}
