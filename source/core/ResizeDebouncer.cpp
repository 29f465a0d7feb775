#include "ResizeDebouncer.h"

ResizeDebouncer::ResizeDebouncer(QObject* parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    m_timer.setInterval(DEFAULT_DELAY_MS);
    connect(&m_timer, &QTimer::timeout, this, [this]() {
        emit resizeSettled(m_pendingSize);
    });
}

void ResizeDebouncer::notify(QSize size)
{
    m_pendingSize = size;
    m_timer.start();    // restarts if already running
}

void ResizeDebouncer::cancel()
{
    m_timer.stop();
}
