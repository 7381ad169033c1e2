#pragma once

#include <cstddef>
#include <deque>
#include <tabshell/events.hpp>
#include <tabshell/task_scheduler.hpp>
#include <utility>
#include <vector>

namespace tabshell
{

// Ordered outbound event channel.
//
// emit() appends to a FIFO.  The queue is drained when nothing holds the
// bus and no dispatch is already running.  An event emitted from inside a
// handler is therefore delivered after the event being handled has reached
// every subscriber, so all subscribers see one global order that matches
// emission order.
//
// Operations that mutate shell state take a Hold for their whole duration:
// handlers never run in the middle of one, and may freely call back into
// the shell (close the tab they are told about, close its window, ...).
//
// A handler that throws a std::exception is logged and skipped.  Anything
// else ends delivery: the rest of the queue is dropped and the exception
// propagates out of the emit() or Hold release that drained it.
class EventBus
{
   public:
    class Hold
    {
       public:
        explicit Hold(EventBus& bus) : bus_(bus) { bus_.hold(); }
        // Releasing the last hold delivers the queue; see the class comment
        // for what may propagate out of it.
        ~Hold() noexcept(false) { bus_.release(); }

        Hold(const Hold&)            = delete;
        Hold& operator=(const Hold&) = delete;

       private:
        EventBus& bus_;
    };

    EventBus()  = default;
    ~EventBus() = default;

    EventBus(const EventBus&)            = delete;
    EventBus& operator=(const EventBus&) = delete;

    SubscriptionId subscribe(EventHandler handler);

    // Safe to call from inside a handler; the handler is skipped for
    // events not yet delivered.
    void unsubscribe(SubscriptionId id);

    void emit(ShellEvent event);

    // Manual form of Hold.  Every hold() needs one release(); the last
    // release delivers the queue.
    void hold() { ++holds_; }
    void release();

    size_t subscriber_count() const { return subscribers_.size(); }
    size_t queued() const { return queue_.size(); }
    bool   held() const { return holds_ > 0; }

   private:
    void drain();
    void dispatch(const ShellEvent& event);

    std::vector<std::pair<SubscriptionId, EventHandler>> subscribers_;
    std::deque<ShellEvent>                               queue_;
    SubscriptionId                                       next_id_     = 1;
    int                                                  holds_       = 0;
    bool                                                 dispatching_ = false;
};

// Runs every task under a Hold on `bus`, so a scheduled phase delivers
// its events only after it has finished touching the view that owns it.
class HoldingTaskScheduler : public TaskScheduler
{
   public:
    HoldingTaskScheduler(TaskScheduler& inner, EventBus& bus) : inner_(inner), bus_(bus) {}

    TaskId schedule(Duration delay, Task task) override;
    bool   cancel(TaskId id) override { return inner_.cancel(id); }
    size_t pending() const override { return inner_.pending(); }

   private:
    TaskScheduler& inner_;
    EventBus&      bus_;
};

}   // namespace tabshell
