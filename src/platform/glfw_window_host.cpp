#ifdef TABSHELL_USE_GLFW

    #include "glfw_window_host.hpp"

    #define GLFW_INCLUDE_NONE
    #include <GLFW/glfw3.h>
    #include <algorithm>
    #include <tabshell/logger.hpp>
    #include <tabshell/tab_window_manager.hpp>

namespace tabshell
{

GlfwWindowHost::GlfwWindowHost(TabWindowManager& manager) : manager_(manager) {}

GlfwWindowHost::~GlfwWindowHost()
{
    shutdown();
}

bool GlfwWindowHost::init()
{
    if (initialized_)
        return true;

    if (!glfwInit())
    {
        TABSHELL_LOG_ERROR("glfw", "failed to initialize GLFW");
        return false;
    }
    initialized_ = true;

    subscription_ = manager_.subscribe([this](const ShellEvent& ev) { on_event(ev); });
    for (WindowId id : manager_.window_ids())
        open_window(id);

    TABSHELL_LOG_INFO("glfw", "host ready ({} windows)", windows_.size());
    return true;
}

void GlfwWindowHost::shutdown()
{
    if (!initialized_)
        return;

    manager_.unsubscribe(subscription_);
    subscription_ = 0;

    for (auto& [id, win] : windows_)
    {
        if (win)
            glfwDestroyWindow(win);
    }
    windows_.clear();
    pending_close_ids_.clear();

    glfwTerminate();
    initialized_ = false;
}

void GlfwWindowHost::poll_events()
{
    glfwPollEvents();
    process_pending_closes();
}

void GlfwWindowHost::wait_events(std::chrono::milliseconds timeout)
{
    glfwWaitEventsTimeout(static_cast<double>(timeout.count()) / 1000.0);
    process_pending_closes();
}

GLFWwindow* GlfwWindowHost::glfw_window(WindowId window_id) const
{
    auto it = windows_.find(window_id);
    return it == windows_.end() ? nullptr : it->second;
}

std::optional<Point> GlfwWindowHost::cursor_screen_pos() const
{
    GLFWwindow* reference = nullptr;
    for (const auto& [id, win] : windows_)
    {
        if (!reference)
            reference = win;
        if (glfwGetWindowAttrib(win, GLFW_FOCUSED))
        {
            reference = win;
            break;
        }
    }
    if (!reference)
        return std::nullopt;

    double cx = 0.0, cy = 0.0;
    int    wx = 0, wy = 0;
    glfwGetCursorPos(reference, &cx, &cy);
    glfwGetWindowPos(reference, &wx, &wy);
    return Point{cx + wx, cy + wy};
}

// ─── Manager events ──────────────────────────────────────────────────────────

void GlfwWindowHost::on_event(const ShellEvent& event)
{
    switch (event.type)
    {
        case EventType::WindowCreated:
            open_window(event.window_id);
            break;
        case EventType::WindowClosed:
            destroy_window(event.window_id);
            break;
        case EventType::WindowFocused:
            if (GLFWwindow* win = glfw_window(event.window_id))
            {
                if (!glfwGetWindowAttrib(win, GLFW_FOCUSED))
                    glfwFocusWindow(win);
            }
            break;
        default:
            break;
    }
}

void GlfwWindowHost::open_window(WindowId window_id)
{
    if (windows_.count(window_id) > 0 || !manager_.has_window(window_id))
        return;

    WindowInfo info = manager_.get_window_info(window_id);

    // Surfaces render on their own; the window needs no client API.
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    glfwWindowHint(GLFW_DECORATED, info.frame ? GLFW_TRUE : GLFW_FALSE);

    const std::string title = info.title.empty() ? "tabshell" : info.title;
    GLFWwindow*       win =
        glfwCreateWindow(info.bounds.w, info.bounds.h, title.c_str(), nullptr, nullptr);
    glfwWindowHint(GLFW_DECORATED, GLFW_TRUE);
    if (!win)
    {
        TABSHELL_LOG_ERROR("glfw", "glfwCreateWindow failed for window {}", window_id);
        return;
    }

    glfwSetWindowPos(win, info.bounds.x, info.bounds.y);
    glfwSetWindowUserPointer(win, this);
    glfwSetWindowPosCallback(win, glfw_window_pos_callback);
    glfwSetWindowSizeCallback(win, glfw_window_size_callback);
    glfwSetWindowFocusCallback(win, glfw_window_focus_callback);
    glfwSetWindowCloseCallback(win, glfw_window_close_callback);

    windows_[window_id] = win;
    manager_.set_window_native_handle(window_id, static_cast<void*>(win));

    TABSHELL_LOG_DEBUG("glfw", "opened window {} ({}x{} at {}, {})", window_id, info.bounds.w,
                       info.bounds.h, info.bounds.x, info.bounds.y);
}

void GlfwWindowHost::destroy_window(WindowId window_id)
{
    auto it = windows_.find(window_id);
    if (it == windows_.end())
        return;
    glfwDestroyWindow(it->second);
    windows_.erase(it);
    pending_close_ids_.erase(
        std::remove(pending_close_ids_.begin(), pending_close_ids_.end(), window_id),
        pending_close_ids_.end());
    TABSHELL_LOG_DEBUG("glfw", "destroyed window {}", window_id);
}

// Closing runs outside the GLFW callback: close_window() cascades into
// surface detach and event delivery, which must not happen mid-poll.
void GlfwWindowHost::process_pending_closes()
{
    if (pending_close_ids_.empty())
        return;

    auto ids = std::move(pending_close_ids_);
    pending_close_ids_.clear();
    for (WindowId id : ids)
    {
        if (manager_.has_window(id))
            manager_.close_window(id);
    }
}

void GlfwWindowHost::report_bounds(GLFWwindow* window)
{
    WindowId id = find_by_glfw_window(window);
    if (id == INVALID_WINDOW_ID || !manager_.has_window(id))
        return;

    int x = 0, y = 0, w = 0, h = 0;
    glfwGetWindowPos(window, &x, &y);
    glfwGetWindowSize(window, &w, &h);
    manager_.set_window_bounds(id, Rect{x, y, w, h});
}

WindowId GlfwWindowHost::find_by_glfw_window(GLFWwindow* window) const
{
    for (const auto& [id, win] : windows_)
    {
        if (win == window)
            return id;
    }
    return INVALID_WINDOW_ID;
}

// ─── Static callback trampolines ─────────────────────────────────────────────

void GlfwWindowHost::glfw_window_pos_callback(GLFWwindow* window, int, int)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (host)
        host->report_bounds(window);
}

void GlfwWindowHost::glfw_window_size_callback(GLFWwindow* window, int, int)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (host)
        host->report_bounds(window);
}

void GlfwWindowHost::glfw_window_focus_callback(GLFWwindow* window, int focused)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (!host || !focused)
        return;
    WindowId id = host->find_by_glfw_window(window);
    if (id != INVALID_WINDOW_ID && host->manager_.has_window(id))
        host->manager_.focus_window(id);
}

void GlfwWindowHost::glfw_window_close_callback(GLFWwindow* window)
{
    auto* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
    if (!host)
        return;
    WindowId id = host->find_by_glfw_window(window);
    if (id == INVALID_WINDOW_ID)
        return;
    // The manager decides; keep the window until close_window() runs.
    glfwSetWindowShouldClose(window, GLFW_FALSE);
    host->pending_close_ids_.push_back(id);
}

}   // namespace tabshell

#endif   // TABSHELL_USE_GLFW
