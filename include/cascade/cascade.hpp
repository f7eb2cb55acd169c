#pragma once

// Umbrella header for the signal graph core.

#include "cascade/common/error.hpp"
#include "cascade/config/graph_config.hpp"
#include "cascade/graph/deferred_scope.hpp"
#include "cascade/graph/graph.hpp"
#include "cascade/signal/bindings.hpp"
#include "cascade/signal/function.hpp"
#include "cascade/signal/node.hpp"
#include "cascade/signal/on_change.hpp"
#include "cascade/signal/signal.hpp"
#include "cascade/signal/value_type.hpp"
#include "cascade/signal/variable.hpp"
