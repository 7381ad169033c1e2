#pragma once

#include <cstdint>

namespace tabshell
{

// Stable identifiers handed out by TabWindowManager.  Monotonic, never
// reused within one manager; 0 is never a valid id.
using WindowId = uint64_t;
using ViewId   = uint64_t;
using TaskId   = uint64_t;

inline constexpr WindowId INVALID_WINDOW_ID = 0;
inline constexpr ViewId   INVALID_VIEW_ID   = 0;
inline constexpr TaskId   INVALID_TASK_ID   = 0;

class TabWindowManager;
class DragCoordinator;
class EventBus;
class NavigationHistory;
class ViewLifecycleController;
class ViewRegistry;
class View;
class Window;
class RenderSurface;
class TaskScheduler;
class ManualTaskScheduler;
class SteadyTaskScheduler;
class GlfwWindowHost;

struct ShellConfig;
struct ShellEvent;
struct TabInfo;
struct WindowInfo;
struct WindowOptions;
struct CreateTabOptions;
struct Point;
struct Rect;

}   // namespace tabshell
