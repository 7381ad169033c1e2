#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <tabshell/fwd.hpp>
#include <tabshell/surface.hpp>

#include "history/navigation_history.hpp"
#include "lifecycle/view_lifecycle_controller.hpp"

namespace tabshell
{

// A navigable surface ("tab").  Owned by ViewRegistry; belongs to exactly
// one window at a time, recorded by id only.
class View
{
   public:
    View(const std::string&             initial_location,
         const std::string&             blank_location,
         TaskScheduler&                 scheduler,
         ViewLifecycleController::Timing timing,
         std::unique_ptr<RenderSurface> surface);
    ~View();

    View(const View&)            = delete;
    View& operator=(const View&) = delete;

    ViewId id() const { return id_; }
    void   set_id(ViewId id) { id_ = id; }

    WindowId window_id() const { return window_id_; }
    void     set_window_id(WindowId id) { window_id_ = id; }

    const std::string& location() const { return location_; }
    void               set_location(const std::string& location) { location_ = location; }

    const std::string& title() const { return title_; }
    void               set_title(const std::string& title) { title_ = title; }

    const std::string& icon() const { return icon_; }
    void               set_icon(const std::string& icon) { icon_ = icon; }

    bool is_pinned() const { return pinned_; }
    void set_pinned(bool pinned) { pinned_ = pinned; }

    bool is_incognito() const { return incognito_; }
    void set_incognito(bool incognito) { incognito_ = incognito; }

    // Set when the surface reported a title for the current epoch; the
    // completion phase then keeps it instead of the derived host title.
    bool has_page_title() const { return page_title_; }
    void set_has_page_title(bool v) { page_title_ = v; }

    bool is_loading() const { return lifecycle_.is_loading(); }
    bool can_go_back() const { return history_.can_go_back(); }
    bool can_go_forward() const { return history_.can_go_forward(); }

    std::chrono::system_clock::time_point created_at() const { return created_at_; }

    NavigationHistory&             history() { return history_; }
    const NavigationHistory&       history() const { return history_; }
    ViewLifecycleController&       lifecycle() { return lifecycle_; }
    const ViewLifecycleController& lifecycle() const { return lifecycle_; }
    RenderSurface&                 surface() { return *surface_; }
    const RenderSurface&           surface() const { return *surface_; }

   private:
    ViewId      id_        = INVALID_VIEW_ID;
    WindowId    window_id_ = INVALID_WINDOW_ID;
    std::string location_;
    std::string title_;
    std::string icon_;
    bool        pinned_     = false;
    bool        incognito_  = false;
    bool        page_title_ = false;

    std::chrono::system_clock::time_point created_at_;

    // Declaration order matters: the lifecycle's pending phases are
    // cancelled (its destructor) before the surface goes away.
    std::unique_ptr<RenderSurface> surface_;
    NavigationHistory              history_;
    ViewLifecycleController        lifecycle_;
};

}   // namespace tabshell
