#include "ScheduledTask.h"

ScheduledTask::ScheduledTask(QObject* parent)
    : QObject(parent)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &ScheduledTask::onTimeout);
}

void ScheduledTask::schedule(int delayMs, std::function<void()> task)
{
    m_task = std::move(task);
    m_timer.start(qMax(0, delayMs));
}

void ScheduledTask::cancel()
{
    m_timer.stop();
    m_task = nullptr;
}

void ScheduledTask::flush()
{
    if (!m_timer.isActive()) {
        return;
    }
    m_timer.stop();
    onTimeout();
}

void ScheduledTask::onTimeout()
{
    // Move out first: the task may schedule again
    std::function<void()> task = std::move(m_task);
    m_task = nullptr;
    if (task) {
        task();
    }
}
