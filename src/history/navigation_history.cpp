#include "navigation_history.hpp"

namespace tabshell
{

NavigationHistory::NavigationHistory(std::string initial, std::string blank_location)
{
    if (initial.empty())
        initial = blank_location;
    unvisited_ = (initial == blank_location);
    entries_.push_back(std::move(initial));
}

void NavigationHistory::push(const std::string& location)
{
    if (unvisited_)
    {
        entries_.front() = location;
        index_           = 0;
        unvisited_       = false;
        return;
    }

    entries_.resize(index_ + 1);
    entries_.push_back(location);
    index_ = entries_.size() - 1;
}

bool NavigationHistory::back()
{
    if (!can_go_back())
        return false;
    --index_;
    return true;
}

bool NavigationHistory::forward()
{
    if (!can_go_forward())
        return false;
    ++index_;
    return true;
}

}   // namespace tabshell
