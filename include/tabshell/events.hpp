#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <tabshell/fwd.hpp>

namespace tabshell
{

// Outbound notifications for the shell/UI layer.  New types may be added
// at the end; subscribers must ignore types they do not know.
enum class EventType
{
    WindowCreated,
    WindowClosed,
    WindowFocused,
    TabCreated,
    TabClosed,
    TabActivated,
    TabNavigated,
    TabLoading,
    TabTitleUpdated,
    TabFaviconUpdated,
    TabPinned,
    TabUnpinned,
    TabMoved,
    DownloadStarted,
    Navigation,
    LoadStarted,
    NetworkActivity,
    LoadFinished,
    DomReady,
};

enum class NavigationDirection
{
    Back,
    Forward,
};

struct DownloadInfo
{
    std::string filename;
    std::string url;
    uint64_t    total_bytes = 0;
};

// One event.  Only the fields relevant to `type` are filled; `view_id` and
// `window_id` are set on every tab event.
struct ShellEvent
{
    EventType type      = EventType::TabCreated;
    WindowId  window_id = INVALID_WINDOW_ID;
    ViewId    view_id   = INVALID_VIEW_ID;

    // TabMoved
    WindowId from_window_id = INVALID_WINDOW_ID;
    WindowId to_window_id   = INVALID_WINDOW_ID;

    std::string location;   // TabCreated, TabNavigated, Load*, NetworkActivity
    std::string title;      // TabTitleUpdated
    std::string icon;       // TabFaviconUpdated

    bool                is_loading = false;   // TabLoading
    bool                failed     = false;   // LoadFinished
    NavigationDirection direction  = NavigationDirection::Back;   // Navigation
    uint64_t            epoch      = 0;       // Load*, NetworkActivity, DomReady
    DownloadInfo        download;             // DownloadStarted
};

// Wire name of an event type ("tab-created", "tab-loading", ...).
const char* event_type_name(EventType type);

using EventHandler   = std::function<void(const ShellEvent&)>;
using SubscriptionId = uint64_t;

}   // namespace tabshell
