#include <algorithm>
#include <cmath>
#include <limits>
#include <tabshell/errors.hpp>
#include <tabshell/logger.hpp>
#include <tabshell/tab_window_manager.hpp>
#include <tabshell/task_scheduler.hpp>

#include "core/location.hpp"
#include "drag/drag_coordinator.hpp"
#include "shell/event_bus.hpp"
#include "shell/view.hpp"
#include "shell/view_registry.hpp"
#include "shell/window.hpp"

namespace tabshell
{

namespace
{

std::string missing_window(const char* op, WindowId id)
{
    return std::string(op) + ": unknown window " + std::to_string(id);
}

std::string missing_view(const char* op, ViewId id)
{
    return std::string(op) + ": unknown view " + std::to_string(id);
}

// Pointer coordinate plus offset, saturated to the int range.  Hosts may
// report NaN or far off-screen values mid-drag.
int screen_coord(double pointer, int offset)
{
    constexpr double lo = std::numeric_limits<int>::min();
    constexpr double hi = std::numeric_limits<int>::max();
    if (std::isnan(pointer))
        pointer = 0.0;
    double v = std::clamp(pointer + offset, lo, hi);
    return static_cast<int>(v);
}

}   // anonymous namespace

// ─── Operation scope ─────────────────────────────────────────────────────────

class TabWindowManager::Operation
{
   public:
    enum class Source
    {
        Command,
        Surface
    };

    explicit Operation(TabWindowManager& manager, Source source = Source::Command)
        : manager_(manager), source_(source)
    {
        manager_.events_->hold();
        ++manager_.operation_depth_;
        if (source_ == Source::Surface)
            ++manager_.surface_calls_;
    }

    ~Operation() noexcept(false)
    {
        --manager_.operation_depth_;
        try
        {
            // Delivers queued events when this is the outermost hold.
            manager_.events_->release();
        }
        catch (...)
        {
            leave();
            throw;
        }
        leave();
    }

    Operation(const Operation&)            = delete;
    Operation& operator=(const Operation&) = delete;

   private:
    void leave()
    {
        // A surface that called in is on the stack until its callback
        // returns, so its view is freed by a later command.
        if (source_ == Source::Surface)
            --manager_.surface_calls_;
        else if (manager_.operation_depth_ == 0 && manager_.surface_calls_ == 0)
            manager_.retired_views_.clear();
    }

    TabWindowManager& manager_;
    Source            source_;
};


TabWindowManager::TabWindowManager(TaskScheduler& scheduler,
                                   SurfaceFactory surface_factory,
                                   ShellConfig    config)
    : scheduler_(scheduler),
      surface_factory_(surface_factory ? std::move(surface_factory) : headless_surface_factory()),
      config_(std::move(config)),
      events_(std::make_unique<EventBus>()),
      view_scheduler_(std::make_unique<HoldingTaskScheduler>(scheduler, *events_)),
      views_(std::make_unique<ViewRegistry>()),
      drag_(std::make_unique<DragCoordinator>())
{
    config_.validate();

    drag_->set_bounds_provider([this]() { return windows_by_z_order(); });
    drag_->set_session_validator(
        [this](const DragCoordinator::Session& session)
        {
            View* view = views_->get(session.view_id);
            return view && view->window_id() == session.source_window_id
                   && find_window(session.source_window_id) != nullptr;
        });
    drag_->set_on_drop_on_window([this](ViewId view_id, WindowId target)
                                 { move_tab_to_window(view_id, target); });
    drag_->set_on_drop_outside([this](ViewId view_id, const Point& pointer)
                               { drop_into_new_window(view_id, pointer); });
}

TabWindowManager::~TabWindowManager()
{
    drag_->cancel_all();
    // Views cancel their own pending phases on destruction; do it while
    // the scheduler reference is still known to be alive.
    retired_views_.clear();
    views_->clear();
}

// ─── Events ──────────────────────────────────────────────────────────────────

SubscriptionId TabWindowManager::subscribe(EventHandler handler)
{
    return events_->subscribe(std::move(handler));
}

void TabWindowManager::unsubscribe(SubscriptionId id)
{
    events_->unsubscribe(id);
}

void TabWindowManager::emit(ShellEvent event)
{
    events_->emit(std::move(event));
}

// ─── Lookup ──────────────────────────────────────────────────────────────────

Window* TabWindowManager::find_window(WindowId window_id) const
{
    for (const auto& w : windows_)
    {
        if (w->id() == window_id)
            return w.get();
    }
    return nullptr;
}

Window& TabWindowManager::require_window(WindowId window_id, const char* op) const
{
    Window* window = find_window(window_id);
    if (!window)
    {
        TABSHELL_LOG_WARN("tab_manager", "{}: unknown window {}", op, window_id);
        throw NotFoundError(missing_window(op, window_id));
    }
    return *window;
}

View& TabWindowManager::require_view(ViewId view_id, const char* op) const
{
    View* view = views_->get(view_id);
    if (!view)
    {
        TABSHELL_LOG_WARN("tab_manager", "{}: unknown view {}", op, view_id);
        throw NotFoundError(missing_view(op, view_id));
    }
    return *view;
}

// ─── Windows ─────────────────────────────────────────────────────────────────

WindowId TabWindowManager::create_window(const WindowOptions& options)
{
    Operation op(*this);
    int width  = options.width > 0 ? options.width : config_.default_window_width;
    int height = options.height > 0 ? options.height : config_.default_window_height;
    width      = std::max(width, config_.min_window_width);
    height     = std::max(height, config_.min_window_height);

    WindowId id = next_window_id_++;
    windows_.push_back(std::make_unique<Window>(id,
                                                Rect{options.x, options.y, width, height},
                                                options.frame,
                                                options.title));
    z_order_.insert(z_order_.begin(), id);

    TABSHELL_LOG_DEBUG("tab_manager", "create_window {} at ({}, {}) {}x{}", id, options.x,
                       options.y, width, height);

    ShellEvent ev;
    ev.type      = EventType::WindowCreated;
    ev.window_id = id;
    emit(std::move(ev));
    return id;
}

void TabWindowManager::close_window(WindowId window_id)
{
    Operation op(*this);
    Window& window = require_window(window_id, "close_window");
    TABSHELL_LOG_DEBUG("tab_manager", "close_window {} ({} tabs)", window_id, window.tab_count());

    // Clearing the active view first keeps the cascade from activating
    // each survivor in turn.
    window.set_active_view(INVALID_VIEW_ID);
    const std::vector<ViewId> tabs = window.tabs();
    for (ViewId id : tabs)
        close_tab(id);

    z_order_.erase(std::remove(z_order_.begin(), z_order_.end(), window_id), z_order_.end());
    windows_.erase(std::remove_if(windows_.begin(),
                                  windows_.end(),
                                  [window_id](const std::unique_ptr<Window>& w)
                                  { return w->id() == window_id; }),
                   windows_.end());

    ShellEvent ev;
    ev.type      = EventType::WindowClosed;
    ev.window_id = window_id;
    emit(std::move(ev));
}

void TabWindowManager::focus_window(WindowId window_id)
{
    Operation op(*this);
    require_window(window_id, "focus_window");

    z_order_.erase(std::remove(z_order_.begin(), z_order_.end(), window_id), z_order_.end());
    z_order_.insert(z_order_.begin(), window_id);

    ShellEvent ev;
    ev.type      = EventType::WindowFocused;
    ev.window_id = window_id;
    emit(std::move(ev));
}

void TabWindowManager::set_window_bounds(WindowId window_id, const Rect& bounds)
{
    Operation op(*this);
    Window& window = require_window(window_id, "set_window_bounds");
    window.set_bounds(bounds);

    if (View* active = views_->get(window.active_view()))
        active->surface().set_bounds(surface_bounds(window));
}

void TabWindowManager::set_window_native_handle(WindowId window_id, void* native)
{
    Operation op(*this);
    Window& window = require_window(window_id, "set_window_native_handle");
    window.set_native_handle(native);

    // Re-parent the visible surface onto the new native window.
    if (View* active = views_->get(window.active_view()))
    {
        if (active->surface().is_attached())
            active->surface().detach();
        active->surface().attach(handle_for(window));
        active->surface().set_bounds(surface_bounds(window));
    }
}

bool TabWindowManager::has_window(WindowId window_id) const
{
    return find_window(window_id) != nullptr;
}

size_t TabWindowManager::window_count() const
{
    return windows_.size();
}

std::vector<WindowId> TabWindowManager::window_ids() const
{
    std::vector<WindowId> ids;
    ids.reserve(windows_.size());
    for (const auto& w : windows_)
        ids.push_back(w->id());
    return ids;
}

WindowInfo TabWindowManager::get_window_info(WindowId window_id) const
{
    const Window& window = require_window(window_id, "get_window_info");
    WindowInfo    info;
    info.id          = window.id();
    info.bounds      = window.bounds();
    info.frame       = window.frame();
    info.title       = window.title();
    info.tabs        = window.tabs();
    info.active_view = window.active_view();
    return info;
}

Rect TabWindowManager::surface_bounds(const Window& window) const
{
    const Rect& b = window.bounds();
    return Rect{0, config_.tab_strip_height, b.w, std::max(0, b.h - config_.tab_strip_height)};
}

WindowHandle TabWindowManager::handle_for(const Window& window) const
{
    return WindowHandle{window.id(), window.native_handle()};
}

std::vector<WindowBounds> TabWindowManager::windows_by_z_order() const
{
    std::vector<WindowBounds> out;
    out.reserve(z_order_.size());
    for (WindowId id : z_order_)
    {
        if (const Window* w = find_window(id))
            out.push_back(WindowBounds{id, w->bounds()});
    }
    return out;
}

// ─── Tabs ────────────────────────────────────────────────────────────────────

ViewId TabWindowManager::create_tab(WindowId                window_id,
                                    const std::string&      location,
                                    const CreateTabOptions& options)
{
    Operation op(*this);
    Window& window = require_window(window_id, "create_tab");

    const std::string loc = location.empty() ? config_.blank_location : location;

    SurfaceOptions surface_options;
    surface_options.partition = options.incognito ? "persist:incognito" : "persist:main";
    std::unique_ptr<RenderSurface> surface = surface_factory_(surface_options);
    if (!surface)
    {
        TABSHELL_LOG_ERROR("tab_manager", "create_tab: no surface for window {} ({})", window_id,
                           surface_options.partition);
        throw ResourceExhaustedError("create_tab: rendering surface could not be created");
    }

    ViewLifecycleController::Timing timing;
    timing.network_delay    = std::chrono::milliseconds(config_.network_phase_delay_ms);
    timing.completion_delay = std::chrono::milliseconds(config_.completion_phase_delay_ms);

    auto view = std::make_unique<View>(loc, config_.blank_location, *view_scheduler_, timing,
                                       std::move(surface));
    view->set_window_id(window_id);
    view->set_incognito(options.incognito);

    const bool blank = is_blank(loc, config_.blank_location);
    view->set_title(blank ? config_.new_tab_title : derive_title(loc, config_.new_tab_title));
    view->set_icon(derive_icon(loc));

    ViewId id  = views_->register_view(std::move(view));
    View&  ref = *views_->get(id);
    wire_view(ref);

    size_t pos = window.insert(id, options.index);
    TABSHELL_LOG_DEBUG("tab_manager", "create_tab {} in window {} at {}: {}", id, window_id, pos,
                       loc);

    ShellEvent ev;
    ev.type      = EventType::TabCreated;
    ev.window_id = window_id;
    ev.view_id   = id;
    ev.location  = loc;
    ev.title     = ref.title();
    ev.icon      = ref.icon();
    emit(std::move(ev));

    if (!window.has_active_view() || options.active)
        activate_in_window(window, ref);

    if (!blank)
        start_load(ref, loc);
    return id;
}

void TabWindowManager::close_tab(ViewId view_id)
{
    Operation op(*this);
    View* view = views_->get(view_id);
    if (!view)
    {
        TABSHELL_LOG_DEBUG("tab_manager", "close_tab: view {} already gone", view_id);
        return;
    }
    TABSHELL_LOG_DEBUG("tab_manager", "close_tab {}", view_id);

    drag_->cancel(view_id);

    // Silence the view before tearing it down: a closed tab reports
    // nothing, not even tab-loading false.  Surface callbacks stay wired;
    // they find the id unregistered and do nothing.
    view->lifecycle().set_callbacks({});
    view->lifecycle().cancel();
    if (view->surface().is_attached())
        view->surface().detach();

    const WindowId        window_id  = view->window_id();
    Window*               window     = find_window(window_id);
    bool                  was_active = false;
    std::optional<size_t> removed;
    if (window)
    {
        was_active = window->active_view() == view_id;
        removed    = window->remove(view_id);
        if (was_active)
            window->set_active_view(INVALID_VIEW_ID);
    }

    retired_views_.push_back(views_->release(view_id));

    ShellEvent ev;
    ev.type      = EventType::TabClosed;
    ev.window_id = window_id;
    ev.view_id   = view_id;
    emit(std::move(ev));

    if (window && was_active && removed)
    {
        if (View* next = views_->get(window->successor_for(*removed)))
            activate_in_window(*window, *next);
    }
}

void TabWindowManager::activate_tab(ViewId view_id)
{
    Operation op(*this);
    View&   view   = require_view(view_id, "activate_tab");
    Window& window = require_window(view.window_id(), "activate_tab");
    activate_in_window(window, view);
}

void TabWindowManager::activate_in_window(Window& window, View& view)
{
    const ViewId previous = window.active_view();
    if (previous == view.id())
    {
        if (!view.surface().is_attached())
        {
            view.surface().attach(handle_for(window));
            view.surface().set_bounds(surface_bounds(window));
        }
        return;
    }

    // Detach the old surface before attaching the new one: one visible
    // surface per window at any instant.
    if (View* old = views_->get(previous))
    {
        if (old->surface().is_attached())
            old->surface().detach();
    }

    window.set_active_view(view.id());
    view.surface().attach(handle_for(window));
    view.surface().set_bounds(surface_bounds(window));

    TABSHELL_LOG_DEBUG("tab_manager", "window {}: active tab {} -> {}", window.id(), previous,
                       view.id());

    ShellEvent ev;
    ev.type      = EventType::TabActivated;
    ev.window_id = window.id();
    ev.view_id   = view.id();
    emit(std::move(ev));
}

void TabWindowManager::detach_from_window(Window& window, View& view)
{
    const bool was_active = window.active_view() == view.id();
    auto       removed    = window.remove(view.id());
    if (!was_active)
        return;

    if (view.surface().is_attached())
        view.surface().detach();
    window.set_active_view(INVALID_VIEW_ID);

    if (removed)
    {
        if (View* next = views_->get(window.successor_for(*removed)))
            activate_in_window(window, *next);
    }
}

// ─── Navigation ──────────────────────────────────────────────────────────────

void TabWindowManager::navigate(ViewId view_id, const std::string& location)
{
    Operation op(*this);
    View&             view = require_view(view_id, "navigate");
    const std::string loc  = location.empty() ? config_.blank_location : location;
    TABSHELL_LOG_DEBUG("tab_manager", "navigate {}: {}", view_id, loc);

    apply_placeholders(view, loc);
    view.history().push(loc);
    view.set_location(loc);

    ShellEvent ev;
    ev.type      = EventType::TabNavigated;
    ev.window_id = view.window_id();
    ev.view_id   = view_id;
    ev.location  = loc;
    emit(std::move(ev));

    start_load(view, loc);
}

void TabWindowManager::go_back(ViewId view_id)
{
    Operation op(*this);
    View& view = require_view(view_id, "go_back");
    if (!view.history().back())
    {
        TABSHELL_LOG_DEBUG("tab_manager", "go_back {}: no back history", view_id);
        return;
    }

    const std::string loc = view.history().current();
    view.set_location(loc);
    apply_placeholders(view, loc);

    ShellEvent ev;
    ev.type      = EventType::Navigation;
    ev.window_id = view.window_id();
    ev.view_id   = view_id;
    ev.location  = loc;
    ev.direction = NavigationDirection::Back;
    emit(std::move(ev));

    start_load(view, loc);
}

void TabWindowManager::go_forward(ViewId view_id)
{
    Operation op(*this);
    View& view = require_view(view_id, "go_forward");
    if (!view.history().forward())
    {
        TABSHELL_LOG_DEBUG("tab_manager", "go_forward {}: no forward history", view_id);
        return;
    }

    const std::string loc = view.history().current();
    view.set_location(loc);
    apply_placeholders(view, loc);

    ShellEvent ev;
    ev.type      = EventType::Navigation;
    ev.window_id = view.window_id();
    ev.view_id   = view_id;
    ev.location  = loc;
    ev.direction = NavigationDirection::Forward;
    emit(std::move(ev));

    start_load(view, loc);
}

void TabWindowManager::refresh(ViewId view_id)
{
    Operation op(*this);
    View& view = require_view(view_id, "refresh");
    TABSHELL_LOG_DEBUG("tab_manager", "refresh {}: {}", view_id, view.location());
    start_load(view, view.location());
}

void TabWindowManager::stop(ViewId view_id)
{
    Operation op(*this);
    View& view = require_view(view_id, "stop");
    if (!view.is_loading())
    {
        TABSHELL_LOG_DEBUG("tab_manager", "stop {}: not loading", view_id);
        return;
    }
    view.surface().stop();
    view.lifecycle().stop();
}

void TabWindowManager::start_load(View& view, const std::string& location)
{
    // Lifecycle first: a surface that finishes synchronously inside
    // load_location() must find the epoch already open.
    view.lifecycle().start(location);
    view.surface().load_location(location);
}

void TabWindowManager::apply_placeholders(View& view, const std::string& location)
{
    view.set_has_page_title(false);
    set_title(view, is_blank(location, config_.blank_location)
                        ? config_.new_tab_title
                        : derive_title(location, config_.new_tab_title));
    set_icon(view, derive_icon(location));
}

void TabWindowManager::set_title(View& view, const std::string& title)
{
    if (view.title() == title)
        return;
    view.set_title(title);

    ShellEvent ev;
    ev.type      = EventType::TabTitleUpdated;
    ev.window_id = view.window_id();
    ev.view_id   = view.id();
    ev.title     = title;
    emit(std::move(ev));
}

void TabWindowManager::set_icon(View& view, const std::string& icon)
{
    if (view.icon() == icon)
        return;
    view.set_icon(icon);

    ShellEvent ev;
    ev.type      = EventType::TabFaviconUpdated;
    ev.window_id = view.window_id();
    ev.view_id   = view.id();
    ev.icon      = icon;
    emit(std::move(ev));
}

void TabWindowManager::record_page_navigation(ViewId view_id, const std::string& location)
{
    View* view = views_->get(view_id);
    if (!view || location.empty() || location == view->location())
        return;

    TABSHELL_LOG_DEBUG("tab_manager", "view {} navigated itself to {}", view_id, location);
    apply_placeholders(*view, location);
    view->history().push(location);
    view->set_location(location);

    ShellEvent ev;
    ev.type      = EventType::TabNavigated;
    ev.window_id = view->window_id();
    ev.view_id   = view_id;
    ev.location  = location;
    emit(std::move(ev));
}

// ─── Surface and lifecycle wiring ────────────────────────────────────────────

void TabWindowManager::wire_view(View& view)
{
    const ViewId id = view.id();

    ViewLifecycleController::Callbacks lc;
    lc.on_load_start = [this, id](uint64_t epoch, const std::string& location)
    {
        View* v = views_->get(id);
        if (!v)
            return;
        v->set_has_page_title(false);

        ShellEvent ev;
        ev.type      = EventType::LoadStarted;
        ev.window_id = v->window_id();
        ev.view_id   = id;
        ev.location  = location;
        ev.epoch     = epoch;
        emit(ev);

        ev.type       = EventType::TabLoading;
        ev.is_loading = true;
        emit(std::move(ev));
    };
    lc.on_network = [this, id](uint64_t epoch, const std::string& location)
    {
        View* v = views_->get(id);
        if (!v)
            return;
        ShellEvent ev;
        ev.type      = EventType::NetworkActivity;
        ev.window_id = v->window_id();
        ev.view_id   = id;
        ev.location  = location;
        ev.epoch     = epoch;
        emit(std::move(ev));
    };
    lc.on_load_end = [this, id](uint64_t epoch, const std::string& location, bool failed)
    {
        View* v = views_->get(id);
        if (!v)
            return;

        ShellEvent ev;
        ev.type      = EventType::LoadFinished;
        ev.window_id = v->window_id();
        ev.view_id   = id;
        ev.location  = location;
        ev.epoch     = epoch;
        ev.failed    = failed;
        emit(ev);

        if (failed)
        {
            set_title(*v, config_.failed_load_title);
            set_icon(*v, std::string());
        }
        else
        {
            if (!v->has_page_title())
            {
                set_title(*v, is_blank(location, config_.blank_location)
                                  ? config_.new_tab_title
                                  : derive_title(location, config_.new_tab_title));
            }
            set_icon(*v, derive_icon(location));
        }

        ev            = ShellEvent{};
        ev.type       = EventType::TabLoading;
        ev.window_id  = v->window_id();
        ev.view_id    = id;
        ev.epoch      = epoch;
        ev.is_loading = false;
        emit(std::move(ev));
    };
    lc.on_dom_ready = [this, id](uint64_t epoch)
    {
        View* v = views_->get(id);
        if (!v)
            return;
        ShellEvent ev;
        ev.type      = EventType::DomReady;
        ev.window_id = v->window_id();
        ev.view_id   = id;
        ev.epoch     = epoch;
        emit(std::move(ev));
    };
    lc.on_cancelled = [this, id](uint64_t epoch, bool superseded)
    {
        // A superseded epoch is followed at once by the new load-start;
        // the tab never stops loading from the UI's point of view.
        View* v = views_->get(id);
        if (!v || superseded)
            return;
        ShellEvent ev;
        ev.type       = EventType::TabLoading;
        ev.window_id  = v->window_id();
        ev.view_id    = id;
        ev.epoch      = epoch;
        ev.is_loading = false;
        emit(std::move(ev));
    };
    view.lifecycle().set_callbacks(std::move(lc));

    // Surfaces call in from outside any command; each callback is an
    // operation of its own.
    SurfaceCallbacks sc;
    sc.on_did_start_loading = [id]()
    { TABSHELL_LOG_TRACE("tab_manager", "view {}: surface started loading", id); };
    sc.on_did_stop_loading = [this, id]()
    {
        Operation op(*this, Operation::Source::Surface);
        if (View* v = views_->get(id))
            v->lifecycle().complete_now();
    };
    sc.on_did_fail_load = [this, id](const std::string& error)
    {
        Operation op(*this, Operation::Source::Surface);
        TABSHELL_LOG_WARN("tab_manager", "view {}: load failed: {}", id, error);
        if (View* v = views_->get(id))
            v->lifecycle().fail();
    };
    sc.on_did_navigate = [this, id](const std::string& location)
    {
        Operation op(*this, Operation::Source::Surface);
        record_page_navigation(id, location);
    };
    sc.on_title_updated = [this, id](const std::string& title)
    {
        Operation op(*this, Operation::Source::Surface);
        if (View* v = views_->get(id))
        {
            v->set_has_page_title(true);
            set_title(*v, title);
        }
    };
    sc.on_favicon_updated = [this, id](const std::string& icon)
    {
        Operation op(*this, Operation::Source::Surface);
        if (View* v = views_->get(id))
            set_icon(*v, icon);
    };
    sc.on_new_window_requested = [this, id](const std::string& location)
    {
        Operation op(*this, Operation::Source::Surface);
        View* v = views_->get(id);
        if (!v)
            return;
        CreateTabOptions opts;
        opts.active    = true;
        opts.incognito = v->is_incognito();
        try
        {
            create_tab(v->window_id(), location, opts);
        }
        catch (const ShellError& e)
        {
            // Page-initiated: there is no caller to report to.
            TABSHELL_LOG_ERROR("tab_manager", "view {}: new window for {} refused: {}", id,
                               location, e.what());
        }
    };
    sc.on_download_started = [this, id](const DownloadInfo& download)
    {
        Operation op(*this, Operation::Source::Surface);
        View* v = views_->get(id);
        if (!v)
            return;
        ShellEvent ev;
        ev.type      = EventType::DownloadStarted;
        ev.window_id = v->window_id();
        ev.view_id   = id;
        ev.download  = download;
        emit(std::move(ev));
    };
    view.surface().set_callbacks(std::move(sc));
}

// ─── Reordering ──────────────────────────────────────────────────────────────

void TabWindowManager::move_tab_to_window(ViewId                view_id,
                                          WindowId              target_window_id,
                                          std::optional<size_t> index)
{
    Operation op(*this);
    View&   view   = require_view(view_id, "move_tab_to_window");
    Window& target = require_window(target_window_id, "move_tab_to_window");

    const WindowId from = view.window_id();
    Window*        source = find_window(from);
    if (!source)
        throw NotFoundError(missing_window("move_tab_to_window", from));

    if (drag_->cancel(view_id))
        TABSHELL_LOG_DEBUG("drag", "view {} moved while dragged; session aborted", view_id);

    TABSHELL_LOG_DEBUG("tab_manager", "move_tab_to_window {}: window {} -> {}", view_id, from,
                       target_window_id);

    if (source == &target)
    {
        target.move(view_id, index.value_or(target.tab_count()));
    }
    else
    {
        detach_from_window(*source, view);
        view.set_window_id(target_window_id);
        target.insert(view_id, index);
    }

    ShellEvent ev;
    ev.type           = EventType::TabMoved;
    ev.window_id      = target_window_id;
    ev.view_id        = view_id;
    ev.from_window_id = from;
    ev.to_window_id   = target_window_id;
    emit(std::move(ev));

    activate_in_window(target, view);
}

ViewId TabWindowManager::duplicate_tab(ViewId view_id)
{
    Operation op(*this);
    View&   source = require_view(view_id, "duplicate_tab");
    Window& window = require_window(source.window_id(), "duplicate_tab");

    CreateTabOptions opts;
    opts.index     = window.index_of(view_id).value_or(window.tab_count()) + 1;
    opts.active    = false;
    opts.incognito = source.is_incognito();

    const std::string location = source.location();
    return create_tab(window.id(), location, opts);
}

bool TabWindowManager::pin_tab(ViewId view_id)
{
    Operation op(*this);
    View& view = require_view(view_id, "pin_tab");
    if (drag_->is_dragging(view_id))
    {
        TABSHELL_LOG_WARN("tab_manager", "pin_tab {}: refused while dragged", view_id);
        return false;
    }
    if (view.is_pinned())
        return true;

    Window& window = require_window(view.window_id(), "pin_tab");

    // Front of the window; the other tabs keep their relative order.
    view.set_pinned(true);
    window.move(view_id, 0);
    TABSHELL_LOG_DEBUG("tab_manager", "pin_tab {}", view_id);

    ShellEvent ev;
    ev.type      = EventType::TabPinned;
    ev.window_id = window.id();
    ev.view_id   = view_id;
    emit(std::move(ev));
    return true;
}

void TabWindowManager::unpin_tab(ViewId view_id)
{
    Operation op(*this);
    View& view = require_view(view_id, "unpin_tab");
    if (!view.is_pinned())
        return;
    view.set_pinned(false);
    TABSHELL_LOG_DEBUG("tab_manager", "unpin_tab {}", view_id);

    ShellEvent ev;
    ev.type      = EventType::TabUnpinned;
    ev.window_id = view.window_id();
    ev.view_id   = view_id;
    emit(std::move(ev));
}

void TabWindowManager::next_tab(WindowId window_id)
{
    Operation op(*this);
    Window& window = require_window(window_id, "next_tab");
    if (window.empty())
        return;
    const size_t n   = window.tab_count();
    const size_t cur = window.index_of(window.active_view()).value_or(n - 1);
    if (View* v = views_->get(window.tabs()[(cur + 1) % n]))
        activate_in_window(window, *v);
}

void TabWindowManager::previous_tab(WindowId window_id)
{
    Operation op(*this);
    Window& window = require_window(window_id, "previous_tab");
    if (window.empty())
        return;
    const size_t n   = window.tab_count();
    const size_t cur = window.index_of(window.active_view()).value_or(0);
    if (View* v = views_->get(window.tabs()[(cur + n - 1) % n]))
        activate_in_window(window, *v);
}

ScriptResult TabWindowManager::execute_script(ViewId view_id, const std::string& code)
{
    Operation op(*this);
    return require_view(view_id, "execute_script").surface().execute_script(code);
}

CapturedImage TabWindowManager::capture_image(ViewId view_id)
{
    return require_view(view_id, "capture_image").surface().capture_image();
}

// ─── Drag and drop ───────────────────────────────────────────────────────────

bool TabWindowManager::drag_start(ViewId view_id, WindowId window_id, const Point& pointer)
{
    Operation op(*this);
    require_view(view_id, "drag_start");
    Window& window = require_window(window_id, "drag_start");
    if (!window.contains(view_id))
    {
        TABSHELL_LOG_WARN("drag", "view {} is not in window {}", view_id, window_id);
        return false;
    }
    return drag_->start(view_id, window_id, pointer);
}

DropOutcome TabWindowManager::drag_end(const Point& pointer_screen_pos)
{
    Operation op(*this);
    return drag_->end(pointer_screen_pos);
}

DropOutcome TabWindowManager::drag_end(ViewId view_id, const Point& pointer_screen_pos)
{
    Operation op(*this);
    return drag_->end(view_id, pointer_screen_pos);
}

void TabWindowManager::drag_cancel(ViewId view_id)
{
    Operation op(*this);
    drag_->cancel(view_id);
}

bool TabWindowManager::is_dragging(ViewId view_id) const
{
    return drag_->is_dragging(view_id);
}

void TabWindowManager::drop_into_new_window(ViewId view_id, const Point& pointer)
{
    View&         view   = require_view(view_id, "drag_end");
    const Window* source = find_window(view.window_id());

    WindowOptions opts;
    opts.x = screen_coord(pointer.x, config_.drag_new_window_offset_x);
    opts.y = screen_coord(pointer.y, config_.drag_new_window_offset_y);
    if (source)
    {
        opts.width  = source->bounds().w;
        opts.height = source->bounds().h;
        opts.frame  = source->frame();
        opts.title  = source->title();
    }

    WindowId created = create_window(opts);
    move_tab_to_window(view_id, created);
}

// ─── Snapshots ───────────────────────────────────────────────────────────────

TabInfo TabWindowManager::make_tab_info(const View& view) const
{
    TabInfo info;
    info.id             = view.id();
    info.window_id      = view.window_id();
    info.location       = view.location();
    info.title          = view.title();
    info.icon           = view.icon();
    info.is_loading     = view.is_loading();
    info.can_go_back    = view.can_go_back();
    info.can_go_forward = view.can_go_forward();
    info.is_pinned      = view.is_pinned();
    info.is_incognito   = view.is_incognito();
    info.history_index  = view.history().index();
    info.history_length = view.history().size();
    info.created_at     = view.created_at();
    info.metrics        = view.surface().metrics();
    return info;
}

std::optional<TabInfo> TabWindowManager::get_tab_info(ViewId view_id) const
{
    const View* view = views_->get(view_id);
    if (!view)
        return std::nullopt;
    return make_tab_info(*view);
}

std::vector<TabInfo> TabWindowManager::get_window_tabs(WindowId window_id) const
{
    const Window&        window = require_window(window_id, "get_window_tabs");
    std::vector<TabInfo> out;
    out.reserve(window.tab_count());
    for (ViewId id : window.tabs())
    {
        if (const View* v = views_->get(id))
            out.push_back(make_tab_info(*v));
    }
    return out;
}

std::vector<ViewId> TabWindowManager::get_window_views(WindowId window_id) const
{
    return require_window(window_id, "get_window_views").tabs();
}

std::vector<TabInfo> TabWindowManager::get_all_tabs() const
{
    std::vector<TabInfo> out;
    out.reserve(views_->count());
    for (ViewId id : views_->all_ids())
    {
        if (const View* v = views_->get(id))
            out.push_back(make_tab_info(*v));
    }
    return out;
}

std::optional<ViewId> TabWindowManager::get_active_tab(WindowId window_id) const
{
    const Window* window = find_window(window_id);
    if (!window || !window->has_active_view())
        return std::nullopt;
    return window->active_view();
}

size_t TabWindowManager::tab_count() const
{
    return views_->count();
}

}   // namespace tabshell
