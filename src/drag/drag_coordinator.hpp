#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <tabshell/drag.hpp>
#include <tabshell/fwd.hpp>
#include <tabshell/geometry.hpp>
#include <vector>

namespace tabshell
{

// ─── DragCoordinator ─────────────────────────────────────────────────────────
// Cross-window tab move sessions.  Host-agnostic: the host reports pointer
// positions in screen coordinates and the coordinator resolves the drop
// target with resolve_window_at() against the bounds the owner supplies.
//
// State machine (per dragged view):
//
//   Idle ──start()──► Dragging ──end()/cancel()──► Idle
//
// end() always returns to Idle, whatever the outcome; the session is
// erased before any drop side effect runs, so a failing move cannot leave
// a session behind.

class DragCoordinator
{
   public:
    enum class State
    {
        Idle,
        Dragging,
    };

    struct Session
    {
        ViewId   view_id          = INVALID_VIEW_ID;
        WindowId source_window_id = INVALID_WINDOW_ID;
        Point    start;
        uint64_t sequence = 0;   // start order, newest = highest
    };

    // Current window bounds, top-most first.
    using BoundsProvider = std::function<std::vector<WindowBounds>()>;
    // False if the session's view is gone or left its source window.
    using SessionValidator = std::function<bool(const Session& session)>;
    // Move the dragged view into an existing window.
    using DropOnWindowCallback = std::function<void(ViewId view_id, WindowId target_window_id)>;
    // Dropped outside every window: spawn one near `screen_pos` and move
    // the view there.
    using DropOutsideCallback = std::function<void(ViewId view_id, const Point& screen_pos)>;

    DragCoordinator() = default;

    DragCoordinator(const DragCoordinator&)            = delete;
    DragCoordinator& operator=(const DragCoordinator&) = delete;

    void set_bounds_provider(BoundsProvider cb) { bounds_provider_ = std::move(cb); }
    void set_session_validator(SessionValidator cb) { validator_ = std::move(cb); }
    void set_on_drop_on_window(DropOnWindowCallback cb) { on_drop_on_window_ = std::move(cb); }
    void set_on_drop_outside(DropOutsideCallback cb) { on_drop_outside_ = std::move(cb); }

    // False if `view_id` already has a session.
    bool start(ViewId view_id, WindowId source_window_id, const Point& pointer);

    // Ends the most recently started session.
    DropOutcome end(const Point& pointer_screen_pos);
    DropOutcome end(ViewId view_id, const Point& pointer_screen_pos);

    // Abort without moving anything.  Returns false if there was no session.
    bool cancel(ViewId view_id);
    void cancel_all();

    State          state() const { return sessions_.empty() ? State::Idle : State::Dragging; }
    bool           is_dragging(ViewId view_id) const { return sessions_.count(view_id) > 0; }
    size_t         session_count() const { return sessions_.size(); }
    const Session* session(ViewId view_id) const;

   private:
    DropOutcome resolve_drop(const Session& session, const Point& pointer);

    std::map<ViewId, Session> sessions_;
    uint64_t                  next_sequence_ = 1;

    BoundsProvider       bounds_provider_;
    SessionValidator     validator_;
    DropOnWindowCallback on_drop_on_window_;
    DropOutsideCallback  on_drop_outside_;
};

}   // namespace tabshell
