#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <tabshell/fwd.hpp>
#include <utility>

namespace tabshell
{

// Deferred, cancellable work.  The core never blocks: every asynchronous
// step (simulated network, load completion) is a task handed to one of
// these and run later on the shell thread.
class TaskScheduler
{
   public:
    using Task     = std::function<void()>;
    using Duration = std::chrono::milliseconds;

    virtual ~TaskScheduler() = default;

    // Queue `task` to run no earlier than `delay` from now.  Tasks due at
    // the same instant run in scheduling order.
    virtual TaskId schedule(Duration delay, Task task) = 0;

    // Remove a task before it runs.  Returns false if it already ran, was
    // already cancelled, or never existed.
    virtual bool cancel(TaskId id) = 0;

    virtual size_t pending() const = 0;
};

// Shared queue for the two concrete schedulers; only the clock differs.
class QueuedTaskScheduler : public TaskScheduler
{
   public:
    TaskId schedule(Duration delay, Task task) override;
    bool   cancel(TaskId id) override;
    size_t pending() const override { return queue_.size(); }

   protected:
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual TimePoint now() const = 0;

    // Run every task due at or before `until`, including tasks those tasks
    // schedule if they also fall due.  Returns the number run.
    size_t run_due(TimePoint until);

    // Due time of the earliest task; only valid when pending() > 0.
    TimePoint next_due() const { return queue_.begin()->first.first; }

   private:
    // Key: (due time, sequence).  The sequence keeps same-instant tasks in
    // scheduling order and doubles as the TaskId.
    using Key = std::pair<TimePoint, TaskId>;

    std::map<Key, Task>           queue_;
    std::map<TaskId, TimePoint>   due_by_id_;
    TaskId                        next_id_ = 1;
};

// Virtual clock for tests and deterministic replay.  Time only moves when
// advance() is called.
class ManualTaskScheduler : public QueuedTaskScheduler
{
   public:
    ManualTaskScheduler() = default;

    ManualTaskScheduler(const ManualTaskScheduler&)            = delete;
    ManualTaskScheduler& operator=(const ManualTaskScheduler&) = delete;

    // Move the clock forward and run what fell due.
    size_t advance(Duration delta);

    // Jump to each pending task in turn until the queue is empty.
    size_t run_all();

    Duration elapsed() const
    {
        return std::chrono::duration_cast<Duration>(current_ - TimePoint{});
    }

   protected:
    TimePoint now() const override { return current_; }

   private:
    TimePoint current_{};
};

// Wall-clock scheduler for a host main loop: call poll() once per loop
// iteration.
class SteadyTaskScheduler : public QueuedTaskScheduler
{
   public:
    SteadyTaskScheduler() = default;

    SteadyTaskScheduler(const SteadyTaskScheduler&)            = delete;
    SteadyTaskScheduler& operator=(const SteadyTaskScheduler&) = delete;

    size_t poll() { return run_due(now()); }

    // Time until the next task is due (zero if overdue), or `idle` when
    // nothing is queued.  Lets a host sleep in its event wait.
    Duration time_until_next(Duration idle) const;

   protected:
    TimePoint now() const override { return std::chrono::steady_clock::now(); }
};

}   // namespace tabshell
