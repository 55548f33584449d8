#pragma once
/**
 * @file trl_service.hpp
 * @brief Layer 2: Service modules built on trl_base.
 *
 * Provides logging, configuration helpers, backoff policies and the shared
 * ZeroMQ context.
 */
#include "trl_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/config_utils.hpp"
#include "utils/logger.hpp"
#include "utils/zmq_context.hpp"
