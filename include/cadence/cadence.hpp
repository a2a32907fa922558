#pragma once
#include <cadence/core/error.hpp>
#include <cadence/core/diagnostics.hpp>
#include <cadence/core/clock.hpp>
#include <cadence/core/executor.hpp>
#include <cadence/core/task_queue.hpp>
#include <cadence/core/microtask_queue.hpp>
#include <cadence/core/promise.hpp>
#include <cadence/core/event_loop.hpp>
#include <cadence/core/scoped_timer.hpp>
#include <cadence/core/pipeline.hpp>
#include <cadence/core/async.hpp>

#include <cadence/ops/all.hpp>
#include <cadence/ops/race.hpp>
#include <cadence/ops/all_settled.hpp>
#include <cadence/ops/timer.hpp>
#include <cadence/ops/timeout.hpp>
#include <cadence/ops/from_callback.hpp>
