#pragma once

// ============================================================================
// DrawingController - Pointer-driven state machine for creating annotations
// ============================================================================
// Idle -> Drawing(tool, partial points) -> Committed
//
// Points are collected in view coordinates while the pointer moves, so the
// preview can be drawn directly; they are converted to original-image
// coordinates once, on release, through the ViewTransform in effect.
// ============================================================================

#include "ToolType.h"
#include "../annotations/Annotation.h"

#include <QPointF>
#include <QString>
#include <QVector>

class ViewTransform;

/**
 * @brief Turns press/move/release sequences into validated annotations.
 *
 * Independent of any widget: the canvas (or a test) feeds it view
 * positions and reads back the outcome of each release.
 */
class DrawingController {
public:
    enum class State {
        Idle,       ///< No shape in progress
        Drawing,    ///< Pointer is down, points are being collected
        Committed   ///< Last release produced an annotation (until the next press)
    };

    /**
     * @brief Why a release did not produce an annotation.
     */
    enum class Rejection {
        None,
        NotDrawing,     ///< Release without a matching press
        NoLabel,        ///< No class label selected
        TooSmall,       ///< Rectangle/line under one original pixel
        TooFewPoints    ///< Freehand with fewer than MIN_FREEHAND_POINTS samples
    };

    /**
     * @brief Outcome of release().
     */
    struct Result {
        bool committed = false;
        Annotation annotation;                  ///< Valid when committed
        Rejection rejection = Rejection::None;  ///< Set when not committed
    };

    static constexpr int MIN_FREEHAND_POINTS = 2;

    DrawingController() = default;

    /**
     * @brief Begin a shape. Select is not a drawing tool and is ignored.
     * @return True if a shape was started.
     */
    bool press(ToolType tool, const QString& label, QPointF viewPt);

    /**
     * @brief Track the pointer. Freehand appends, rectangle/line move the end point.
     */
    void move(QPointF viewPt);

    /**
     * @brief Finish the shape, convert it and validate it.
     */
    Result release(QPointF viewPt, const ViewTransform& transform);

    /**
     * @brief Abandon the shape in progress.
     */
    void cancel();

    State state() const { return m_state; }
    bool isDrawing() const { return m_state == State::Drawing; }
    ToolType tool() const { return m_tool; }
    QString label() const { return m_label; }

    /// @return View-space points of the shape in progress (for the preview).
    const QVector<QPointF>& previewPoints() const { return m_viewPoints; }

    static QString rejectionText(Rejection r);

private:
    State m_state = State::Idle;
    ToolType m_tool = ToolType::Rectangle;
    QString m_label;
    QVector<QPointF> m_viewPoints;
};
