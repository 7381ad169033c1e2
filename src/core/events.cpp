#include <tabshell/drag.hpp>
#include <tabshell/events.hpp>

namespace tabshell
{

const char* event_type_name(EventType type)
{
    switch (type)
    {
        case EventType::WindowCreated:
            return "window-created";
        case EventType::WindowClosed:
            return "window-closed";
        case EventType::WindowFocused:
            return "window-focused";
        case EventType::TabCreated:
            return "tab-created";
        case EventType::TabClosed:
            return "tab-closed";
        case EventType::TabActivated:
            return "tab-activated";
        case EventType::TabNavigated:
            return "tab-navigated";
        case EventType::TabLoading:
            return "tab-loading";
        case EventType::TabTitleUpdated:
            return "tab-title-updated";
        case EventType::TabFaviconUpdated:
            return "tab-favicon-updated";
        case EventType::TabPinned:
            return "tab-pinned";
        case EventType::TabUnpinned:
            return "tab-unpinned";
        case EventType::TabMoved:
            return "tab-moved";
        case EventType::DownloadStarted:
            return "download-started";
        case EventType::Navigation:
            return "navigation";
        case EventType::LoadStarted:
            return "load-start";
        case EventType::NetworkActivity:
            return "network";
        case EventType::LoadFinished:
            return "load-end";
        case EventType::DomReady:
            return "dom-ready";
    }
    return "unknown";
}

const char* drop_outcome_name(DropOutcome outcome)
{
    switch (outcome)
    {
        case DropOutcome::NoSession:
            return "no-session";
        case DropOutcome::Cancelled:
            return "cancelled";
        case DropOutcome::SameWindow:
            return "same-window";
        case DropOutcome::MovedToWindow:
            return "moved-to-window";
        case DropOutcome::MovedToNewWindow:
            return "moved-to-new-window";
    }
    return "unknown";
}

}   // namespace tabshell
