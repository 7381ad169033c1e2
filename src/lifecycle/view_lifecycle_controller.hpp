#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <tabshell/fwd.hpp>

namespace tabshell
{

class TaskScheduler;

// ─── ViewLifecycleController ─────────────────────────────────────────────────
// Load state machine for one view.
//
//   Idle ──start()──► Loading ──network phase──► Loading ──completion──► Loaded
//     ▲                 │  ▲                                               │
//     └──cancel/stop────┘  └──────────────── start() ──────────────────────┘
//
// Each start() opens a new epoch and schedules two ordered, independently
// cancellable phases on the TaskScheduler.  start() while Loading cancels
// every pending phase of the old epoch first, so at most one epoch is live
// and no stale phase can fire against a newer location.  cancel() never
// reports load-end; only completion (or fail()) does.
class ViewLifecycleController
{
   public:
    enum class State
    {
        Idle,
        Loading,
        Loaded,
    };

    struct Timing
    {
        std::chrono::milliseconds network_delay{100};
        std::chrono::milliseconds completion_delay{500};
    };

    struct Callbacks
    {
        std::function<void(uint64_t epoch, const std::string& location)> on_load_start;
        std::function<void(uint64_t epoch, const std::string& location)> on_network;
        // failed = true when the surface reported a load error.
        std::function<void(uint64_t epoch, const std::string& location, bool failed)> on_load_end;
        std::function<void(uint64_t epoch)>                                           on_dom_ready;
        // Loading stopped without load-end.  superseded = true when a new
        // start() replaced the epoch rather than cancel()/stop().
        std::function<void(uint64_t epoch, bool superseded)> on_cancelled;
    };

    ViewLifecycleController(TaskScheduler& scheduler, Timing timing);
    ~ViewLifecycleController();

    ViewLifecycleController(const ViewLifecycleController&)            = delete;
    ViewLifecycleController& operator=(const ViewLifecycleController&) = delete;

    void set_callbacks(Callbacks callbacks) { callbacks_ = std::move(callbacks); }

    void start(const std::string& location);

    // Drop every pending phase and go Idle.  No load-end.
    void cancel();
    void stop() { cancel(); }

    // The surface finished (or failed) on its own before the simulated
    // completion phase: finish the live epoch now.  No-op unless Loading.
    void complete_now();
    void fail();

    State              state() const { return state_; }
    bool               is_loading() const { return state_ == State::Loading; }
    uint64_t           epoch() const { return epoch_; }
    const std::string& location() const { return location_; }
    size_t             pending_phases() const
    {
        return (network_task_ != INVALID_TASK_ID ? 1u : 0u)
               + (completion_task_ != INVALID_TASK_ID ? 1u : 0u);
    }

   private:
    void cancel_pending();
    void run_network_phase(uint64_t epoch);
    void run_completion_phase(uint64_t epoch);
    void finish(bool failed);

    TaskScheduler& scheduler_;
    Timing         timing_;
    Callbacks      callbacks_;
    State          state_ = State::Idle;
    uint64_t       epoch_ = 0;
    std::string    location_;
    TaskId         network_task_    = INVALID_TASK_ID;
    TaskId         completion_task_ = INVALID_TASK_ID;
};

const char* lifecycle_state_name(ViewLifecycleController::State state);

}   // namespace tabshell
