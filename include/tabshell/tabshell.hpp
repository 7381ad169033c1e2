#pragma once

// Umbrella header for the tabshell core.

#include <tabshell/config.hpp>
#include <tabshell/drag.hpp>
#include <tabshell/errors.hpp>
#include <tabshell/events.hpp>
#include <tabshell/fwd.hpp>
#include <tabshell/geometry.hpp>
#include <tabshell/logger.hpp>
#include <tabshell/surface.hpp>
#include <tabshell/tab_window_manager.hpp>
#include <tabshell/task_scheduler.hpp>
