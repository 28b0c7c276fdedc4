#pragma once

// ============================================================================
// ScheduledTask - Cancellable single-shot task
// ============================================================================
// Used for debouncing: scheduling again replaces the pending callback and
// restarts the delay.
// ============================================================================

#include <QObject>
#include <QTimer>
#include <functional>

class ScheduledTask : public QObject {
    Q_OBJECT

public:
    explicit ScheduledTask(QObject* parent = nullptr);

    /**
     * @brief Run the task after delayMs, replacing any pending one.
     */
    void schedule(int delayMs, std::function<void()> task);

    /**
     * @brief Drop the pending task without running it.
     */
    void cancel();

    /**
     * @brief Run the pending task now, if any.
     */
    void flush();

    bool isPending() const { return m_timer.isActive(); }

private slots:
    void onTimeout();

private:
    QTimer m_timer;
    std::function<void()> m_task;
};
