#pragma once

#include "chunkwise/version.hpp"
#include "chunkwise/errors.hpp"
#include "chunkwise/logger.hpp"
#include "chunkwise/options.hpp"
#include "chunkwise/events.hpp"
#include "chunkwise/clock.hpp"
#include "chunkwise/rate_estimator.hpp"
#include "chunkwise/pacing_hook.hpp"
#include "chunkwise/pause_gate.hpp"
#include "chunkwise/lag_source.hpp"
#include "chunkwise/lag_gate.hpp"
#include "chunkwise/chunk_controller.hpp"
#include "chunkwise/controller_builder.hpp"

#ifdef CHUNKWISE_BUILD_CONFIG
    #include "chunkwise/config.hpp"
#endif

#ifdef CHUNKWISE_BUILD_MONITORING
    #include "chunkwise/monitoring/chunk_metrics.hpp"
#endif
