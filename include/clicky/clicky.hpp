#pragma once

#include <clicky/core/config.hpp>
#include <clicky/core/log.hpp>
#include <clicky/core/scheduler.hpp>
#include <clicky/core/subscription.hpp>
#include <clicky/core/task_error.hpp>
#include <clicky/core/cancel_token.hpp>
#include <clicky/core/task_record.hpp>

#include <clicky/core/delivery_queue.hpp>
#include <clicky/core/dispatcher.hpp>
#include <clicky/core/single_flight.hpp>
#include <clicky/core/pump.hpp>
#include <clicky/core/status_board.hpp>
#include <clicky/core/runtime.hpp>
