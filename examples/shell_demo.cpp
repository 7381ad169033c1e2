// Browsing-shell demo.
//
// With GLFW: opens one OS window per shell window.  Close every window to
// quit; tabs load on the wall-clock scheduler while the host waits for
// OS events.
//
// Without GLFW: runs a scripted headless session (open, navigate, tear a
// tab off into its own window) and logs every shell event.

#include <chrono>
#include <tabshell/tabshell.hpp>
#include <thread>

#ifdef TABSHELL_USE_GLFW
    #include "platform/glfw_window_host.hpp"
#endif

using namespace tabshell;

static void log_event(const ShellEvent& ev)
{
    TABSHELL_LOG_INFO("demo",
                      "{} window={} view={} {}",
                      event_type_name(ev.type),
                      ev.window_id,
                      ev.view_id,
                      ev.title.empty() ? ev.location : ev.title);
}

#ifndef TABSHELL_USE_GLFW
static void settle(SteadyTaskScheduler& scheduler, const ShellConfig& config)
{
    auto until = std::chrono::steady_clock::now()
                 + std::chrono::milliseconds(config.completion_phase_delay_ms + 50);
    while (std::chrono::steady_clock::now() < until)
    {
        scheduler.poll();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    scheduler.poll();
}
#endif

int main()
{
    ShellConfig config;
    config.load(ShellConfig::default_path());

    Logger::instance().add_sink(sinks::console_sink());
    Logger::instance().set_level(Logger::level_from_string(config.log_level, LogLevel::Info));

    SteadyTaskScheduler scheduler;
    TabWindowManager    manager(scheduler, {}, config);
    manager.subscribe(log_event);

#ifdef TABSHELL_USE_GLFW
    GlfwWindowHost host(manager);
    if (!host.init())
        return 1;

    WindowId main_window = manager.create_window({.x = 100, .y = 100, .title = "tabshell"});
    manager.create_tab(main_window, "https://example.com");
    manager.create_tab(main_window, "https://example.org/docs");

    while (!host.empty())
    {
        auto wait = scheduler.time_until_next(std::chrono::milliseconds(250));
        host.wait_events(wait);
        scheduler.poll();
    }
    host.shutdown();
#else
    WindowId main_window = manager.create_window({.title = "tabshell"});
    ViewId   home        = manager.create_tab(main_window, "https://example.com");
    ViewId   docs        = manager.create_tab(main_window, "https://example.org/docs");
    settle(scheduler, manager.config());

    manager.navigate(home, "https://example.com/news");
    settle(scheduler, manager.config());
    manager.go_back(home);
    settle(scheduler, manager.config());

    manager.pin_tab(docs);

    // Tear the first tab off into its own window.
    if (manager.drag_start(home, main_window, Point{50, 10}))
        manager.drag_end(Point{5000, 5000});

    for (const TabInfo& tab : manager.get_all_tabs())
    {
        TABSHELL_LOG_INFO("demo",
                          "tab {} in window {}: {} ({})",
                          tab.id,
                          tab.window_id,
                          tab.title,
                          tab.location);
    }
#endif

    return 0;
}
