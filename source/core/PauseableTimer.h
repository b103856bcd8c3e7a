#pragma once

// ============================================================================
// PauseableTimer - Presentation stopwatch that can be paused and resumed
// ============================================================================
// Elapsed time is accumulated across start/stop cycles. While running, the
// formatted time ("mm:ss") is pushed through timeChanged() on the UI thread,
// driven by a QTimer.
// ============================================================================

#include <QElapsedTimer>
#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>

class PauseableTimer : public QObject {
    Q_OBJECT

public:
    /// Returns a monotonic timestamp in milliseconds.
    using Clock = std::function<qint64()>;

    static constexpr int DEFAULT_UPDATE_INTERVAL_MS = 500;

    explicit PauseableTimer(QObject* parent = nullptr);

    /**
     * @brief Replace the time source (tests use a simulated clock).
     *
     * Only valid while the timer is stopped.
     */
    void setClock(Clock clock);

    void setUpdateInterval(int ms);
    int updateInterval() const { return m_ticker.interval(); }

    bool isRunning() const { return m_running; }

    /**
     * @brief Total elapsed time, including the running segment.
     */
    qint64 elapsedMs() const;

    QString elapsedText() const { return formatTime(elapsedMs()); }

    /**
     * @brief Format milliseconds as "mm:ss".
     *
     * Seconds are truncated; minutes are zero-padded to two digits and
     * grow beyond 99 if needed.
     */
    static QString formatTime(qint64 ms);

public slots:
    /**
     * @brief Start or resume. Emits the current time immediately.
     */
    void start();

    /**
     * @brief Pause. Folds the running segment into the total and emits it.
     */
    void stop();

    /**
     * @brief Stop and clear the accumulated time.
     */
    void reset();

    /**
     * @brief Emit the current time. Called by the internal ticker.
     */
    void tick();

signals:
    void timeChanged(const QString& text);
    void runningChanged(bool running);

private:
    qint64 now() const { return m_clock(); }

    QTimer m_ticker;
    QElapsedTimer m_monotonic;      ///< Backs the default clock
    Clock m_clock;
    qint64 m_accumulatedMs = 0;     ///< Time from finished segments
    qint64 m_referenceMs = 0;       ///< Clock value when the running segment began
    bool m_running = false;
};
