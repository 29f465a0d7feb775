#include "DrawingController.h"
#include "ViewTransform.h"

#include <QDebug>

bool DrawingController::press(ToolType tool, const QString& label, QPointF viewPt)
{
    if (tool == ToolType::Select) {
        return false;
    }

    m_state = State::Drawing;
    m_tool = tool;
    m_label = label.trimmed();
    m_viewPoints.clear();

    if (tool == ToolType::Freehand) {
        m_viewPoints.append(viewPt);
    } else {
        // Start and current end point
        m_viewPoints.append(viewPt);
        m_viewPoints.append(viewPt);
    }
    return true;
}

void DrawingController::move(QPointF viewPt)
{
    if (m_state != State::Drawing) {
        return;
    }

    if (m_tool == ToolType::Freehand) {
        if (m_viewPoints.isEmpty() || m_viewPoints.last() != viewPt) {
            m_viewPoints.append(viewPt);
        }
    } else {
        m_viewPoints.last() = viewPt;
    }
}

DrawingController::Result DrawingController::release(QPointF viewPt,
                                                      const ViewTransform& transform)
{
    Result result;

    if (m_state != State::Drawing) {
        result.rejection = Rejection::NotDrawing;
        return result;
    }

    move(viewPt);

    const QVector<QPointF> viewPoints = m_viewPoints;
    m_viewPoints.clear();
    m_state = State::Idle;

    if (m_label.isEmpty()) {
        result.rejection = Rejection::NoLabel;
        return result;
    }

    switch (m_tool) {
        case ToolType::Rectangle: {
            const QPointF a = transform.viewToOriginal(viewPoints.first());
            const QPointF b = transform.viewToOriginal(viewPoints.last());
            result.annotation = Annotation::rectangle(m_label, a, b);
            break;
        }
        case ToolType::Line: {
            const QPointF a = transform.viewToOriginal(viewPoints.first());
            const QPointF b = transform.viewToOriginal(viewPoints.last());
            result.annotation = Annotation::line(m_label, a, b);
            break;
        }
        case ToolType::Freehand: {
            if (viewPoints.size() < MIN_FREEHAND_POINTS) {
                result.rejection = Rejection::TooFewPoints;
                return result;
            }
            QVector<QPointF> pts;
            pts.reserve(viewPoints.size());
            for (const QPointF& p : viewPoints) {
                pts.append(transform.viewToOriginal(p));
            }
            result.annotation = Annotation::freehand(m_label, pts);
            break;
        }
        case ToolType::Select:
            result.rejection = Rejection::NotDrawing;
            return result;
    }

    if (result.annotation.isDegenerate()) {
        result.rejection = Rejection::TooSmall;
        return result;
    }

    result.committed = true;
    m_state = State::Committed;
    return result;
}

void DrawingController::cancel()
{
    m_viewPoints.clear();
    m_state = State::Idle;
}

QString DrawingController::rejectionText(Rejection r)
{
    switch (r) {
        case Rejection::None:         return QString();
        case Rejection::NotDrawing:   return QStringLiteral("no shape in progress");
        case Rejection::NoLabel:      return QStringLiteral("select a label first");
        case Rejection::TooSmall:     return QStringLiteral("shape is smaller than one pixel");
        case Rejection::TooFewPoints: return QStringLiteral("freehand stroke needs at least two points");
    }
    return QString();
}
