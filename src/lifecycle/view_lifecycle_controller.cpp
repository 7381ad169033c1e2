#include "view_lifecycle_controller.hpp"

#include <tabshell/logger.hpp>
#include <tabshell/task_scheduler.hpp>

namespace tabshell
{

ViewLifecycleController::ViewLifecycleController(TaskScheduler& scheduler, Timing timing)
    : scheduler_(scheduler), timing_(timing)
{
}

ViewLifecycleController::~ViewLifecycleController()
{
    // Phases capture `this`; none may outlive the controller.
    cancel_pending();
}

void ViewLifecycleController::start(const std::string& location)
{
    if (state_ == State::Loading)
    {
        TABSHELL_LOG_DEBUG("lifecycle", "epoch {} superseded before completion", epoch_);
        cancel_pending();
        uint64_t superseded = epoch_;
        state_              = State::Idle;
        if (callbacks_.on_cancelled)
            callbacks_.on_cancelled(superseded, true);
    }
    else
    {
        cancel_pending();
    }

    const uint64_t epoch = ++epoch_;
    location_            = location;
    state_               = State::Loading;

    if (callbacks_.on_load_start)
        callbacks_.on_load_start(epoch, location_);

    // The callback may have started or cancelled a load itself; only
    // schedule phases for the epoch that is still live.
    if (epoch != epoch_ || state_ != State::Loading)
        return;

    network_task_ =
        scheduler_.schedule(timing_.network_delay, [this, epoch]() { run_network_phase(epoch); });
    completion_task_ = scheduler_.schedule(timing_.completion_delay,
                                           [this, epoch]() { run_completion_phase(epoch); });
}

void ViewLifecycleController::cancel()
{
    cancel_pending();
    if (state_ != State::Loading)
    {
        state_ = State::Idle;
        return;
    }

    state_ = State::Idle;
    TABSHELL_LOG_DEBUG("lifecycle", "epoch {} cancelled", epoch_);
    if (callbacks_.on_cancelled)
        callbacks_.on_cancelled(epoch_, false);
}

void ViewLifecycleController::complete_now()
{
    if (state_ != State::Loading)
        return;
    cancel_pending();
    finish(false);
}

void ViewLifecycleController::fail()
{
    if (state_ != State::Loading)
        return;
    cancel_pending();
    finish(true);
}

void ViewLifecycleController::cancel_pending()
{
    if (network_task_ != INVALID_TASK_ID)
        scheduler_.cancel(network_task_);
    if (completion_task_ != INVALID_TASK_ID)
        scheduler_.cancel(completion_task_);
    network_task_    = INVALID_TASK_ID;
    completion_task_ = INVALID_TASK_ID;
}

void ViewLifecycleController::run_network_phase(uint64_t epoch)
{
    if (epoch != epoch_ || state_ != State::Loading)
    {
        TABSHELL_LOG_WARN("lifecycle", "stale network phase for epoch {} ignored", epoch);
        return;
    }
    // The scheduler already unlinked this task.
    network_task_ = INVALID_TASK_ID;
    if (callbacks_.on_network)
        callbacks_.on_network(epoch, location_);
}

void ViewLifecycleController::run_completion_phase(uint64_t epoch)
{
    if (epoch != epoch_ || state_ != State::Loading)
    {
        TABSHELL_LOG_WARN("lifecycle", "stale completion phase for epoch {} ignored", epoch);
        return;
    }
    completion_task_ = INVALID_TASK_ID;
    finish(false);
}

void ViewLifecycleController::finish(bool failed)
{
    const uint64_t epoch = epoch_;
    state_               = State::Loaded;

    if (callbacks_.on_load_end)
        callbacks_.on_load_end(epoch, location_, failed);
    // load-end handlers may start a new epoch; dom-ready belongs to this one.
    if (epoch == epoch_ && callbacks_.on_dom_ready)
        callbacks_.on_dom_ready(epoch);
}

const char* lifecycle_state_name(ViewLifecycleController::State state)
{
    switch (state)
    {
        case ViewLifecycleController::State::Idle:
            return "idle";
        case ViewLifecycleController::State::Loading:
            return "loading";
        case ViewLifecycleController::State::Loaded:
            return "loaded";
    }
    return "unknown";
}

}   // namespace tabshell
