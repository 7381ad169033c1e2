#include "view_registry.hpp"

#include <algorithm>

#include "view.hpp"

namespace tabshell
{

ViewRegistry::ViewRegistry()  = default;
ViewRegistry::~ViewRegistry() = default;

ViewId ViewRegistry::register_view(std::unique_ptr<View> view)
{
    ViewId id = next_id_++;
    view->set_id(id);
    views_[id] = std::move(view);
    insertion_order_.push_back(id);
    return id;
}

void ViewRegistry::unregister_view(ViewId id)
{
    auto view = release(id);
    view.reset();
}

View* ViewRegistry::get(ViewId id) const
{
    auto it = views_.find(id);
    return (it != views_.end()) ? it->second.get() : nullptr;
}

bool ViewRegistry::contains(ViewId id) const
{
    return views_.count(id) > 0;
}

std::unique_ptr<View> ViewRegistry::release(ViewId id)
{
    auto it = views_.find(id);
    if (it == views_.end())
        return nullptr;
    auto view = std::move(it->second);
    views_.erase(it);
    insertion_order_.erase(std::remove(insertion_order_.begin(), insertion_order_.end(), id),
                           insertion_order_.end());
    return view;
}

void ViewRegistry::clear()
{
    // Destroy in reverse registration order, newest first.
    while (!insertion_order_.empty())
        unregister_view(insertion_order_.back());
}

}   // namespace tabshell
