#include <tabshell/logger.hpp>
#include <tabshell/task_scheduler.hpp>

namespace tabshell
{

// ─── QueuedTaskScheduler ─────────────────────────────────────────────────────

TaskId QueuedTaskScheduler::schedule(Duration delay, Task task)
{
    if (delay.count() < 0)
        delay = Duration::zero();

    TaskId    id  = next_id_++;
    TimePoint due = now() + delay;
    queue_.emplace(Key{due, id}, std::move(task));
    due_by_id_.emplace(id, due);
    return id;
}

bool QueuedTaskScheduler::cancel(TaskId id)
{
    auto it = due_by_id_.find(id);
    if (it == due_by_id_.end())
        return false;
    queue_.erase(Key{it->second, id});
    due_by_id_.erase(it);
    return true;
}

size_t QueuedTaskScheduler::run_due(TimePoint until)
{
    size_t ran = 0;
    while (!queue_.empty())
    {
        auto it = queue_.begin();
        if (it->first.first > until)
            break;

        // Unlink before running: the task may schedule or cancel others,
        // and a task never sees itself as pending.
        Task   task = std::move(it->second);
        TaskId id   = it->first.second;
        queue_.erase(it);
        due_by_id_.erase(id);

        if (task)
            task();
        ++ran;
    }
    return ran;
}

// ─── ManualTaskScheduler ─────────────────────────────────────────────────────

size_t ManualTaskScheduler::advance(Duration delta)
{
    if (delta.count() < 0)
        delta = Duration::zero();

    TimePoint target = current_ + delta;
    size_t    ran    = 0;

    // Step the clock task by task so each task observes its own due time
    // through now(), and anything it schedules lands relative to that.
    while (pending() > 0 && next_due() <= target)
    {
        if (next_due() > current_)
            current_ = next_due();
        ran += run_due(current_);
    }
    current_ = target;
    return ran;
}

size_t ManualTaskScheduler::run_all()
{
    size_t ran = 0;
    while (pending() > 0)
    {
        if (next_due() > current_)
            current_ = next_due();
        ran += run_due(current_);
    }
    TABSHELL_LOG_TRACE("scheduler", "run_all ran {} tasks", ran);
    return ran;
}

// ─── SteadyTaskScheduler ─────────────────────────────────────────────────────

SteadyTaskScheduler::Duration SteadyTaskScheduler::time_until_next(Duration idle) const
{
    if (pending() == 0)
        return idle;
    auto now_tp = now();
    auto due    = next_due();
    if (due <= now_tp)
        return Duration::zero();
    return std::chrono::duration_cast<Duration>(due - now_tp);
}

}   // namespace tabshell
