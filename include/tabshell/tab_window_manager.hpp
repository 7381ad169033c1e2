#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <tabshell/config.hpp>
#include <tabshell/drag.hpp>
#include <tabshell/events.hpp>
#include <tabshell/fwd.hpp>
#include <tabshell/geometry.hpp>
#include <tabshell/surface.hpp>
#include <vector>

namespace tabshell
{

struct WindowOptions
{
    int         x      = 0;
    int         y      = 0;
    int         width  = 0;   // 0 = ShellConfig default
    int         height = 0;   // 0 = ShellConfig default
    bool        frame  = true;
    std::string title;
};

struct CreateTabOptions
{
    std::optional<size_t> index;              // clamped; appended when unset
    bool                  active    = false;  // first tab is always activated
    bool                  incognito = false;
};

// Point-in-time copy of a view, safe to keep after the view is closed.
struct TabInfo
{
    ViewId      id        = INVALID_VIEW_ID;
    WindowId    window_id = INVALID_WINDOW_ID;
    std::string location;
    std::string title;
    std::string icon;
    bool        is_loading     = false;
    bool        can_go_back    = false;
    bool        can_go_forward = false;
    bool        is_pinned      = false;
    bool        is_incognito   = false;
    size_t      history_index  = 0;
    size_t      history_length = 0;

    std::chrono::system_clock::time_point created_at;
    ResourceMetrics                       metrics;
};

struct WindowInfo
{
    WindowId            id = INVALID_WINDOW_ID;
    Rect                bounds;
    bool                frame = true;
    std::string         title;
    std::vector<ViewId> tabs;   // tab order
    ViewId              active_view = INVALID_VIEW_ID;
};

/**
 * TabWindowManager — single owner of every window and view in the shell.
 *
 * Windows and views live in id-keyed tables here; nothing else holds a
 * pointer to them.  Every command runs to completion on the calling
 * thread; the only deferred work is each view's load phases, which run on
 * the injected TaskScheduler.  Outbound events are delivered in order
 * through subscribe().
 *
 * Commands addressed at an unknown window or view throw NotFoundError,
 * except close_tab() which ignores unknown ids.  Commands that make no
 * sense in the current state (go_back with no history, ...) do nothing.
 */
class TabWindowManager
{
   public:
    explicit TabWindowManager(TaskScheduler& scheduler,
                              SurfaceFactory surface_factory = {},
                              ShellConfig    config          = {});
    ~TabWindowManager();

    TabWindowManager(const TabWindowManager&)            = delete;
    TabWindowManager& operator=(const TabWindowManager&) = delete;

    // ── Events ──────────────────────────────────────────────────────────

    SubscriptionId subscribe(EventHandler handler);
    void           unsubscribe(SubscriptionId id);

    // ── Windows ─────────────────────────────────────────────────────────

    WindowId create_window(const WindowOptions& options = {});

    // Closes every tab in the window, then the window itself.
    void close_window(WindowId window_id);

    // Raise to the top of the z-order used for drop resolution.
    void focus_window(WindowId window_id);

    // Host adapters report where the OS put the window.
    void set_window_bounds(WindowId window_id, const Rect& bounds);
    void set_window_native_handle(WindowId window_id, void* native);

    bool                  has_window(WindowId window_id) const;
    size_t                window_count() const;
    std::vector<WindowId> window_ids() const;   // creation order
    WindowInfo            get_window_info(WindowId window_id) const;

    // ── Tabs ────────────────────────────────────────────────────────────

    // Empty `location` means the blank location.  Throws NotFoundError for
    // an unknown window and ResourceExhaustedError when no surface could
    // be created.
    ViewId create_tab(WindowId                window_id,
                      const std::string&      location = {},
                      const CreateTabOptions& options  = {});

    void close_tab(ViewId view_id);
    void activate_tab(ViewId view_id);

    void navigate(ViewId view_id, const std::string& location);
    void go_back(ViewId view_id);
    void go_forward(ViewId view_id);
    void refresh(ViewId view_id);
    void stop(ViewId view_id);

    void move_tab_to_window(ViewId                view_id,
                            WindowId              target_window_id,
                            std::optional<size_t> index = std::nullopt);

    // New tab at the same location, right after the source, not activated.
    ViewId duplicate_tab(ViewId view_id);

    // Returns false when the view is being dragged.
    bool pin_tab(ViewId view_id);
    void unpin_tab(ViewId view_id);

    void next_tab(WindowId window_id);
    void previous_tab(WindowId window_id);

    ScriptResult  execute_script(ViewId view_id, const std::string& code);
    CapturedImage capture_image(ViewId view_id);

    // ── Drag and drop ───────────────────────────────────────────────────

    // False if the view is already being dragged or does not belong to
    // `window_id`.
    bool drag_start(ViewId view_id, WindowId window_id, const Point& pointer);

    // Ends the most recently started drag.
    DropOutcome drag_end(const Point& pointer_screen_pos);
    DropOutcome drag_end(ViewId view_id, const Point& pointer_screen_pos);
    void        drag_cancel(ViewId view_id);
    bool        is_dragging(ViewId view_id) const;

    // ── Snapshots ───────────────────────────────────────────────────────

    std::optional<TabInfo> get_tab_info(ViewId view_id) const;
    std::vector<TabInfo>   get_window_tabs(WindowId window_id) const;
    std::vector<ViewId>    get_window_views(WindowId window_id) const;
    std::vector<TabInfo>   get_all_tabs() const;
    std::optional<ViewId>  get_active_tab(WindowId window_id) const;
    size_t                 tab_count() const;

    const ShellConfig& config() const { return config_; }

   private:
    // Scope of one state-changing operation: public commands and surface
    // callbacks.  Events queue until the outermost operation ends.
    class Operation;

    // Lookup helpers: throw NotFoundError with `op` in the message.
    Window& require_window(WindowId window_id, const char* op) const;
    View&   require_view(ViewId view_id, const char* op) const;
    Window* find_window(WindowId window_id) const;

    void wire_view(View& view);
    void activate_in_window(Window& window, View& view);
    void detach_from_window(Window& window, View& view);
    void start_load(View& view, const std::string& location);
    void apply_placeholders(View& view, const std::string& location);
    void set_title(View& view, const std::string& title);
    void set_icon(View& view, const std::string& icon);
    void record_page_navigation(ViewId view_id, const std::string& location);

    Rect surface_bounds(const Window& window) const;
    WindowHandle handle_for(const Window& window) const;

    std::vector<WindowBounds> windows_by_z_order() const;
    void                      drop_into_new_window(ViewId view_id, const Point& pointer);

    TabInfo make_tab_info(const View& view) const;
    void    emit(ShellEvent event);

    TaskScheduler&  scheduler_;
    SurfaceFactory  surface_factory_;
    ShellConfig     config_;

    std::unique_ptr<EventBus>        events_;
    std::unique_ptr<TaskScheduler>   view_scheduler_;   // scheduler_ under an event hold
    std::unique_ptr<ViewRegistry>    views_;
    std::unique_ptr<DragCoordinator> drag_;

    std::vector<std::unique_ptr<Window>> windows_;   // creation order
    std::vector<WindowId>                z_order_;   // top-most first
    WindowId                             next_window_id_ = 1;

    // Closed views wait here until no surface callback is on the stack:
    // a handler may close the very tab whose surface is calling in.
    std::vector<std::unique_ptr<View>> retired_views_;
    int                                operation_depth_ = 0;
    int                                surface_calls_   = 0;
};

}   // namespace tabshell
