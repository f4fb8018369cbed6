#pragma once

#include "statebus/change_detector.hpp"
#include "statebus/channel.hpp"
#include "statebus/describe.hpp"
#include "statebus/error.hpp"
#include "statebus/event_bus.hpp"
#include "statebus/json.hpp"
#include "statebus/log.hpp"
#include "statebus/services.hpp"
#include "statebus/state_change.hpp"
#include "statebus/state_store.hpp"
#include "statebus/subscription_group.hpp"
#include "statebus/task.hpp"
