#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <tabshell/fwd.hpp>
#include <tabshell/geometry.hpp>
#include <vector>

namespace tabshell
{

// A top-level window: ordered tab ids plus the one active tab.  Holds ids
// only; the views themselves live in ViewRegistry.
class Window
{
   public:
    Window(WindowId id, const Rect& bounds, bool frame, std::string title);

    WindowId id() const { return id_; }

    const Rect& bounds() const { return bounds_; }
    void        set_bounds(const Rect& bounds) { bounds_ = bounds; }

    bool               frame() const { return frame_; }
    const std::string& title() const { return title_; }

    void* native_handle() const { return native_; }
    void  set_native_handle(void* native) { native_ = native; }

    // ── Tab order ───────────────────────────────────────────────────────

    const std::vector<ViewId>& tabs() const { return tabs_; }
    size_t                     tab_count() const { return tabs_.size(); }
    bool                       empty() const { return tabs_.empty(); }
    bool                       contains(ViewId view_id) const;
    std::optional<size_t>      index_of(ViewId view_id) const;

    // Insert at `index`, clamped to [0, tab_count()]; appends when unset.
    // Returns the position used.
    size_t insert(ViewId view_id, std::optional<size_t> index = std::nullopt);

    // Returns the position the view had, or nullopt if absent.  Does not
    // touch the active view.
    std::optional<size_t> remove(ViewId view_id);

    // Move an existing tab to `index` (clamped).  Returns false if absent.
    bool move(ViewId view_id, size_t index);

    // ── Activation ──────────────────────────────────────────────────────

    ViewId active_view() const { return active_view_; }
    void   set_active_view(ViewId view_id) { active_view_ = view_id; }
    bool   has_active_view() const { return active_view_ != INVALID_VIEW_ID; }

    // Sibling to activate after the tab at `removed_index` left: the same
    // index, or the nearest lower one.  INVALID_VIEW_ID when empty.
    ViewId successor_for(size_t removed_index) const;

   private:
    WindowId            id_;
    Rect                bounds_;
    bool                frame_ = true;
    std::string         title_;
    void*               native_ = nullptr;
    std::vector<ViewId> tabs_;
    ViewId              active_view_ = INVALID_VIEW_ID;
};

}   // namespace tabshell
