#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tabshell
{

// Back/forward stack for one view.
//
// Invariant: index() < size() whenever the history is non-empty.  The only
// way entries disappear is push(), which drops everything after the
// current index before appending (visiting a new location closes the
// forward branch).
//
// A history seeded with the blank location is "unvisited": the first
// push() replaces the blank entry instead of stacking on top of it, so
// the blank page is never a back target.
class NavigationHistory
{
   public:
    explicit NavigationHistory(std::string initial, std::string blank_location = "about:blank");

    void push(const std::string& location);

    // Move the cursor; return false (and do nothing) at either end.
    bool back();
    bool forward();

    bool can_go_back() const { return index_ > 0; }
    bool can_go_forward() const { return index_ + 1 < entries_.size(); }

    const std::string&              current() const { return entries_[index_]; }
    size_t                          index() const { return index_; }
    size_t                          size() const { return entries_.size(); }
    const std::vector<std::string>& entries() const { return entries_; }

    // True until the first real location is recorded.
    bool is_unvisited() const { return unvisited_; }

   private:
    std::vector<std::string> entries_;
    size_t                   index_     = 0;
    bool                     unvisited_ = false;
};

}   // namespace tabshell
