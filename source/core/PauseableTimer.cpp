// ============================================================================
// PauseableTimer - Implementation
// ============================================================================

#include "PauseableTimer.h"

#include <QDebug>

PauseableTimer::PauseableTimer(QObject* parent)
    : QObject(parent)
{
    m_monotonic.start();
    m_clock = [this]() { return m_monotonic.elapsed(); };

    m_ticker.setInterval(DEFAULT_UPDATE_INTERVAL_MS);
    connect(&m_ticker, &QTimer::timeout, this, &PauseableTimer::tick);
}

void PauseableTimer::setClock(Clock clock)
{
    if (m_running) {
        qWarning() << "PauseableTimer: Cannot change clock while running";
        return;
    }
    if (clock) {
        m_clock = std::move(clock);
    }
}

void PauseableTimer::setUpdateInterval(int ms)
{
    if (ms <= 0) {
        qWarning() << "PauseableTimer: Ignoring invalid update interval" << ms;
        return;
    }
    m_ticker.setInterval(ms);
}

qint64 PauseableTimer::elapsedMs() const
{
    if (!m_running) {
        return m_accumulatedMs;
    }
    return m_accumulatedMs + qMax<qint64>(0, now() - m_referenceMs);
}

QString PauseableTimer::formatTime(qint64 ms)
{
    const qint64 totalSeconds = qMax<qint64>(0, ms) / 1000;
    const qint64 minutes = totalSeconds / 60;
    const qint64 seconds = totalSeconds % 60;
    return QStringLiteral("%1:%2")
        .arg(minutes, 2, 10, QLatin1Char('0'))
        .arg(seconds, 2, 10, QLatin1Char('0'));
}

// ===== Slots =====

void PauseableTimer::start()
{
    if (m_running) {
        return;
    }
    m_referenceMs = now();
    m_running = true;
    m_ticker.start();

    emit runningChanged(true);
    tick();
}

void PauseableTimer::stop()
{
    if (!m_running) {
        return;
    }
    m_accumulatedMs += qMax<qint64>(0, now() - m_referenceMs);
    m_running = false;
    m_ticker.stop();

    emit runningChanged(false);
    emit timeChanged(formatTime(m_accumulatedMs));
}

void PauseableTimer::reset()
{
    const bool wasRunning = m_running;
    m_ticker.stop();
    m_running = false;
    m_accumulatedMs = 0;
    m_referenceMs = 0;

    if (wasRunning) {
        emit runningChanged(false);
    }
    emit timeChanged(formatTime(0));
}

void PauseableTimer::tick()
{
    emit timeChanged(elapsedText());
}
