#include "view.hpp"

namespace tabshell
{

View::View(const std::string&              initial_location,
           const std::string&              blank_location,
           TaskScheduler&                  scheduler,
           ViewLifecycleController::Timing timing,
           std::unique_ptr<RenderSurface>  surface)
    : location_(initial_location.empty() ? blank_location : initial_location),
      created_at_(std::chrono::system_clock::now()),
      surface_(std::move(surface)),
      history_(location_, blank_location),
      lifecycle_(scheduler, timing)
{
}

View::~View()
{
    lifecycle_.set_callbacks({});
    lifecycle_.cancel();
    surface_->set_callbacks({});
    if (surface_->is_attached())
        surface_->detach();
}

}   // namespace tabshell
