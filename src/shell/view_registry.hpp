#pragma once

#include <cstdint>
#include <memory>
#include <tabshell/fwd.hpp>
#include <unordered_map>
#include <vector>

namespace tabshell
{

class View;

/**
 * ViewRegistry — stable-id ownership of every view in the shell.
 *
 * Monotonic ids, never reused.  Windows reference views by id only, so a
 * view can change windows without any pointer being invalidated.
 *
 * Not thread-safe: owned by TabWindowManager and touched only on the
 * shell thread.
 */
class ViewRegistry
{
   public:
    ViewRegistry();
    ~ViewRegistry();

    ViewRegistry(const ViewRegistry&)            = delete;
    ViewRegistry& operator=(const ViewRegistry&) = delete;

    // Take ownership and assign the next id (also stored on the view).
    ViewId register_view(std::unique_ptr<View> view);

    // Destroy a view.  No-op for unknown ids.
    void unregister_view(ViewId id);

    // nullptr if not found.
    View* get(ViewId id) const;

    bool   contains(ViewId id) const;
    size_t count() const { return views_.size(); }

    // Registration order.
    const std::vector<ViewId>& all_ids() const { return insertion_order_; }

    // Remove without destroying.  nullptr if not found.
    std::unique_ptr<View> release(ViewId id);

    void clear();

   private:
    std::unordered_map<ViewId, std::unique_ptr<View>> views_;
    std::vector<ViewId>                               insertion_order_;
    ViewId                                            next_id_ = 1;
};

}   // namespace tabshell
