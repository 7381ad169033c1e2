#pragma once

#include <optional>
#include <tabshell/fwd.hpp>
#include <tabshell/geometry.hpp>
#include <vector>

namespace tabshell
{

struct WindowBounds
{
    WindowId id = INVALID_WINDOW_ID;
    Rect     bounds;
};

// What drag-end did with the dragged tab.
enum class DropOutcome
{
    NoSession,          // nothing was being dragged
    Cancelled,          // view vanished mid-drag, or drag_cancel()
    SameWindow,         // dropped back on the source window: no-op
    MovedToWindow,      // moved into another existing window
    MovedToNewWindow,   // dropped outside every window: spawned one
};

// First window in `windows` whose bounds contain `point`.  Callers order
// the list top-most first.  Pure: no host toolkit involved.
std::optional<WindowId> resolve_window_at(const Point& point, const std::vector<WindowBounds>& windows);

const char* drop_outcome_name(DropOutcome outcome);

}   // namespace tabshell
