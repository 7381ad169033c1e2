#include "drag_coordinator.hpp"

#include <tabshell/logger.hpp>

namespace tabshell
{

std::optional<WindowId> resolve_window_at(const Point& point, const std::vector<WindowBounds>& windows)
{
    for (const auto& w : windows)
    {
        if (w.bounds.contains(point))
            return w.id;
    }
    return std::nullopt;
}

bool DragCoordinator::start(ViewId view_id, WindowId source_window_id, const Point& pointer)
{
    if (sessions_.count(view_id) > 0)
    {
        TABSHELL_LOG_WARN("drag", "view {} is already being dragged", view_id);
        return false;
    }

    Session session;
    session.view_id          = view_id;
    session.source_window_id = source_window_id;
    session.start            = pointer;
    session.sequence         = next_sequence_++;
    sessions_.emplace(view_id, session);

    TABSHELL_LOG_DEBUG("drag", "start view={} window={} at ({}, {})", view_id, source_window_id,
                       pointer.x, pointer.y);
    return true;
}

DropOutcome DragCoordinator::end(const Point& pointer_screen_pos)
{
    if (sessions_.empty())
        return DropOutcome::NoSession;

    auto newest = sessions_.begin();
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it)
    {
        if (it->second.sequence > newest->second.sequence)
            newest = it;
    }
    return end(newest->first, pointer_screen_pos);
}

DropOutcome DragCoordinator::end(ViewId view_id, const Point& pointer_screen_pos)
{
    auto it = sessions_.find(view_id);
    if (it == sessions_.end())
        return DropOutcome::NoSession;

    // Terminal from here on, whatever the drop does.
    Session session = it->second;
    sessions_.erase(it);

    DropOutcome outcome = resolve_drop(session, pointer_screen_pos);
    TABSHELL_LOG_DEBUG("drag", "end view={} at ({}, {}): {}", view_id, pointer_screen_pos.x,
                       pointer_screen_pos.y, drop_outcome_name(outcome));
    return outcome;
}

DropOutcome DragCoordinator::resolve_drop(const Session& session, const Point& pointer)
{
    if (validator_ && !validator_(session))
        return DropOutcome::Cancelled;

    std::vector<WindowBounds> windows;
    if (bounds_provider_)
        windows = bounds_provider_();

    auto target = resolve_window_at(pointer, windows);
    if (!target)
    {
        if (on_drop_outside_)
            on_drop_outside_(session.view_id, pointer);
        return DropOutcome::MovedToNewWindow;
    }
    if (*target == session.source_window_id)
        return DropOutcome::SameWindow;

    if (on_drop_on_window_)
        on_drop_on_window_(session.view_id, *target);
    return DropOutcome::MovedToWindow;
}

bool DragCoordinator::cancel(ViewId view_id)
{
    if (sessions_.erase(view_id) == 0)
        return false;
    TABSHELL_LOG_DEBUG("drag", "cancelled drag of view {}", view_id);
    return true;
}

void DragCoordinator::cancel_all()
{
    sessions_.clear();
}

const DragCoordinator::Session* DragCoordinator::session(ViewId view_id) const
{
    auto it = sessions_.find(view_id);
    return it == sessions_.end() ? nullptr : &it->second;
}

}   // namespace tabshell
