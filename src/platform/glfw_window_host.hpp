#pragma once

#ifdef TABSHELL_USE_GLFW

    #include <chrono>
    #include <optional>
    #include <tabshell/events.hpp>
    #include <tabshell/fwd.hpp>
    #include <tabshell/geometry.hpp>
    #include <unordered_map>
    #include <vector>

struct GLFWwindow;

namespace tabshell
{

// Mirrors every manager window as a GLFW window and reports what the OS
// does to them (move, resize, focus, close) back to the manager.  The GLFW
// window pointer becomes the window's native handle, so surfaces attach to
// a real top-level window.
//
// All calls, including the GLFW callbacks, happen on the thread that
// called init(), which must be the main thread.
class GlfwWindowHost
{
   public:
    explicit GlfwWindowHost(TabWindowManager& manager);
    ~GlfwWindowHost();

    GlfwWindowHost(const GlfwWindowHost&)            = delete;
    GlfwWindowHost& operator=(const GlfwWindowHost&) = delete;

    // Initialize GLFW and start following manager events.  Windows that
    // already exist are opened too.
    bool init();

    // Destroy every GLFW window and terminate GLFW.
    void shutdown();

    // Pump OS events, then close windows the user asked to close.
    void poll_events();
    void wait_events(std::chrono::milliseconds timeout);

    size_t window_count() const { return windows_.size(); }
    bool   empty() const { return windows_.empty(); }

    // Pointer position in screen coordinates, measured through the focused
    // window (or any window when none has focus).  nullopt without windows.
    std::optional<Point> cursor_screen_pos() const;

    GLFWwindow* glfw_window(WindowId window_id) const;

   private:
    void on_event(const ShellEvent& event);
    void open_window(WindowId window_id);
    void destroy_window(WindowId window_id);
    void process_pending_closes();
    void report_bounds(GLFWwindow* window);

    WindowId find_by_glfw_window(GLFWwindow* window) const;

    static void glfw_window_pos_callback(GLFWwindow* window, int x, int y);
    static void glfw_window_size_callback(GLFWwindow* window, int width, int height);
    static void glfw_window_focus_callback(GLFWwindow* window, int focused);
    static void glfw_window_close_callback(GLFWwindow* window);

    TabWindowManager&                         manager_;
    SubscriptionId                            subscription_ = 0;
    std::unordered_map<WindowId, GLFWwindow*> windows_;
    std::vector<WindowId>                     pending_close_ids_;
    bool                                      initialized_ = false;
};

}   // namespace tabshell

#endif   // TABSHELL_USE_GLFW
