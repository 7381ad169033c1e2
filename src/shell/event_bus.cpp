#include "event_bus.hpp"

#include <algorithm>
#include <exception>
#include <tabshell/logger.hpp>

namespace tabshell
{

SubscriptionId EventBus::subscribe(EventHandler handler)
{
    SubscriptionId id = next_id_++;
    subscribers_.emplace_back(id, std::move(handler));
    return id;
}

void EventBus::unsubscribe(SubscriptionId id)
{
    subscribers_.erase(std::remove_if(subscribers_.begin(),
                                      subscribers_.end(),
                                      [id](const auto& s) { return s.first == id; }),
                       subscribers_.end());
}

void EventBus::emit(ShellEvent event)
{
    queue_.push_back(std::move(event));
    if (holds_ == 0 && !dispatching_)
        drain();
}

void EventBus::release()
{
    if (--holds_ == 0 && !dispatching_)
        drain();
}

void EventBus::drain()
{
    struct DispatchGuard
    {
        bool& flag;
        explicit DispatchGuard(bool& f) : flag(f) { flag = true; }
        ~DispatchGuard() { flag = false; }
    } guard(dispatching_);

    try
    {
        while (!queue_.empty())
        {
            ShellEvent next = std::move(queue_.front());
            queue_.pop_front();
            dispatch(next);
        }
    }
    catch (...)
    {
        // Only non-std exceptions get here; dispatch() handles the rest.
        TABSHELL_LOG_ERROR("events", "subscriber threw a non-std exception; dropping {} events",
                           queue_.size());
        queue_.clear();
        throw;
    }
}

void EventBus::dispatch(const ShellEvent& event)
{
    TABSHELL_LOG_TRACE("events", "{} window={} view={}", event_type_name(event.type),
                       event.window_id, event.view_id);

    // Handlers may subscribe/unsubscribe; iterate over a snapshot of ids
    // and re-check membership before each call.
    std::vector<SubscriptionId> ids;
    ids.reserve(subscribers_.size());
    for (const auto& s : subscribers_)
        ids.push_back(s.first);

    for (SubscriptionId id : ids)
    {
        auto it = std::find_if(subscribers_.begin(),
                               subscribers_.end(),
                               [id](const auto& s) { return s.first == id; });
        if (it == subscribers_.end() || !it->second)
            continue;

        // Copy: the handler may unsubscribe itself.
        EventHandler handler = it->second;
        try
        {
            handler(event);
        }
        catch (const std::exception& e)
        {
            TABSHELL_LOG_ERROR("events", "subscriber {} threw on {}: {}", id,
                               event_type_name(event.type), e.what());
        }
    }
}

// ─── HoldingTaskScheduler ────────────────────────────────────────────────────

TaskId HoldingTaskScheduler::schedule(Duration delay, Task task)
{
    return inner_.schedule(delay,
                           [bus = &bus_, task = std::move(task)]()
                           {
                               EventBus::Hold hold(*bus);
                               task();
                           });
}

}   // namespace tabshell
