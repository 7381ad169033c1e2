#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <tabshell/events.hpp>
#include <tabshell/fwd.hpp>
#include <tabshell/geometry.hpp>
#include <vector>

namespace tabshell
{

// Identifies the top-level window a surface is shown in.  `native` is the
// host toolkit's window pointer (GLFWwindow*, HWND, ...) or nullptr when
// running headless.
struct WindowHandle
{
    WindowId window_id = INVALID_WINDOW_ID;
    void*    native    = nullptr;
};

struct ScriptResult
{
    bool        success = false;
    std::string value;
    std::string error;
};

// Tightly packed RGBA8 pixels, row-major.
struct CapturedImage
{
    uint32_t             width  = 0;
    uint32_t             height = 0;
    std::vector<uint8_t> rgba;

    bool empty() const { return width == 0 || height == 0; }
};

// Advisory only; a surface that cannot measure reports zeros.
struct ResourceMetrics
{
    uint64_t memory_bytes = 0;
    double   cpu_percent  = 0.0;
    uint32_t process_id   = 0;
};

struct SurfaceOptions
{
    std::string partition = "persist:main";
};

// Notifications a surface raises about its own content.  Any member may be
// left empty.  Surfaces invoke them on the shell thread.
struct SurfaceCallbacks
{
    std::function<void()>                             on_did_start_loading;
    std::function<void()>                             on_did_stop_loading;
    std::function<void(const std::string& error)>     on_did_fail_load;
    std::function<void(const std::string& location)>  on_did_navigate;
    std::function<void(const std::string& title)>     on_title_updated;
    std::function<void(const std::string& icon)>      on_favicon_updated;
    std::function<void(const std::string& location)>  on_new_window_requested;
    std::function<void(const DownloadInfo& download)> on_download_started;
};

// The embedded rendering capability for one view.  Opaque to the core:
// pixels, network and scripting all live behind this interface.
class RenderSurface
{
   public:
    virtual ~RenderSurface() = default;

    virtual void attach(const WindowHandle& window) = 0;
    virtual void detach()                           = 0;
    virtual bool is_attached() const                = 0;

    // Content rectangle, relative to the window's client area.
    virtual void set_bounds(const Rect& bounds) = 0;

    virtual void load_location(const std::string& location) = 0;
    virtual void stop()                                     = 0;
    virtual bool can_go_back() const                        = 0;
    virtual bool can_go_forward() const                     = 0;

    virtual ScriptResult    execute_script(const std::string& code) = 0;
    virtual CapturedImage   capture_image()                         = 0;
    virtual ResourceMetrics metrics() const                         = 0;

    virtual void set_callbacks(SurfaceCallbacks callbacks) = 0;
};

// Returns nullptr when no surface can be created (out of processes,
// GPU memory, ...).
using SurfaceFactory = std::function<std::unique_ptr<RenderSurface>(const SurfaceOptions&)>;

// Surface used when the embedder supplies no factory: tracks attachment and
// the last requested location, draws nothing.
class HeadlessSurface : public RenderSurface
{
   public:
    explicit HeadlessSurface(SurfaceOptions options = {});

    void attach(const WindowHandle& window) override;
    void detach() override;
    bool is_attached() const override { return attached_; }
    void set_bounds(const Rect& bounds) override { bounds_ = bounds; }

    void load_location(const std::string& location) override;
    void stop() override;
    bool can_go_back() const override { return index_ > 0; }
    bool can_go_forward() const override { return index_ + 1 < visited_.size(); }

    ScriptResult    execute_script(const std::string& code) override;
    CapturedImage   capture_image() override;
    ResourceMetrics metrics() const override;

    void set_callbacks(SurfaceCallbacks callbacks) override { callbacks_ = std::move(callbacks); }

    const WindowHandle&   window() const { return window_; }
    const Rect&           bounds() const { return bounds_; }
    const std::string&    last_location() const { return visited_.empty() ? empty_ : visited_[index_]; }
    const SurfaceOptions& options() const { return options_; }

   private:
    SurfaceOptions           options_;
    SurfaceCallbacks         callbacks_;
    WindowHandle             window_;
    Rect                     bounds_;
    bool                     attached_ = false;
    std::vector<std::string> visited_;
    size_t                   index_ = 0;
    std::string              empty_;
};

SurfaceFactory headless_surface_factory();

}   // namespace tabshell
