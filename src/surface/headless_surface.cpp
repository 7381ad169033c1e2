#include <tabshell/logger.hpp>
#include <tabshell/surface.hpp>
#include <unistd.h>

namespace tabshell
{

HeadlessSurface::HeadlessSurface(SurfaceOptions options) : options_(std::move(options)) {}

void HeadlessSurface::attach(const WindowHandle& window)
{
    window_   = window;
    attached_ = true;
}

void HeadlessSurface::detach()
{
    window_   = WindowHandle{};
    attached_ = false;
}

void HeadlessSurface::load_location(const std::string& location)
{
    // Revisiting the entry we are already on (reload, back/forward replay)
    // does not grow the surface's own history.
    if (!visited_.empty() && visited_[index_] == location)
        return;
    if (!visited_.empty())
        visited_.resize(index_ + 1);
    visited_.push_back(location);
    index_ = visited_.size() - 1;
}

void HeadlessSurface::stop() {}

ScriptResult HeadlessSurface::execute_script(const std::string& code)
{
    TABSHELL_LOG_TRACE("surface", "headless execute_script ({} bytes)", code.size());
    return ScriptResult{.success = true, .value = "undefined", .error = {}};
}

CapturedImage HeadlessSurface::capture_image()
{
    CapturedImage image;
    if (bounds_.empty())
        return image;
    image.width  = static_cast<uint32_t>(bounds_.w);
    image.height = static_cast<uint32_t>(bounds_.h);
    image.rgba.assign(static_cast<size_t>(image.width) * image.height * 4, 0);
    return image;
}

ResourceMetrics HeadlessSurface::metrics() const
{
    ResourceMetrics m;
    m.process_id = static_cast<uint32_t>(::getpid());
    return m;
}

SurfaceFactory headless_surface_factory()
{
    return [](const SurfaceOptions& options) -> std::unique_ptr<RenderSurface>
    { return std::make_unique<HeadlessSurface>(options); };
}

}   // namespace tabshell
