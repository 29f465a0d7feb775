#pragma once

// ============================================================================
// ResizeDebouncer - Coalesces bursts of canvas resize notifications
// ============================================================================

#include <QObject>
#include <QSize>
#include <QTimer>

/**
 * @brief Emits the last reported size once resizing has been quiet for a while.
 *
 * Every notify() restarts a single-shot timer, so a newer resize cancels
 * the pending one and only the most recent size is delivered.
 */
class ResizeDebouncer : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_DELAY_MS = 300;

    explicit ResizeDebouncer(QObject* parent = nullptr);

    /**
     * @brief Report a new size; (re)starts the quiet interval.
     */
    void notify(QSize size);

    /**
     * @brief Drop any pending notification.
     */
    void cancel();

    bool isPending() const { return m_timer.isActive(); }

    void setDelay(int ms) { m_timer.setInterval(ms); }
    int delay() const { return m_timer.interval(); }

signals:
    /**
     * @brief Emitted once per burst with the most recent size.
     */
    void resizeSettled(QSize size);

private:
    QTimer m_timer;
    QSize m_pendingSize;
};
