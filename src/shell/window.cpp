#include "window.hpp"

#include <algorithm>

namespace tabshell
{

Window::Window(WindowId id, const Rect& bounds, bool frame, std::string title)
    : id_(id), bounds_(bounds), frame_(frame), title_(std::move(title))
{
}

bool Window::contains(ViewId view_id) const
{
    return std::find(tabs_.begin(), tabs_.end(), view_id) != tabs_.end();
}

std::optional<size_t> Window::index_of(ViewId view_id) const
{
    auto it = std::find(tabs_.begin(), tabs_.end(), view_id);
    if (it == tabs_.end())
        return std::nullopt;
    return static_cast<size_t>(it - tabs_.begin());
}

size_t Window::insert(ViewId view_id, std::optional<size_t> index)
{
    size_t pos = index ? std::min(*index, tabs_.size()) : tabs_.size();
    tabs_.insert(tabs_.begin() + static_cast<std::ptrdiff_t>(pos), view_id);
    return pos;
}

std::optional<size_t> Window::remove(ViewId view_id)
{
    auto pos = index_of(view_id);
    if (!pos)
        return std::nullopt;
    tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(*pos));
    return pos;
}

bool Window::move(ViewId view_id, size_t index)
{
    auto from = remove(view_id);
    if (!from)
        return false;
    insert(view_id, index);
    return true;
}

ViewId Window::successor_for(size_t removed_index) const
{
    if (tabs_.empty())
        return INVALID_VIEW_ID;
    return tabs_[std::min(removed_index, tabs_.size() - 1)];
}

}   // namespace tabshell
