#pragma once
/**
 * @file trl_relay.hpp
 * @brief Layer 3: Job relay built on trl_service.
 *
 * Wire protocol (chunk codec, events, outcomes), the dispatcher side (Dispatcher,
 * JobRegistry, RelayClient) and the worker side (ConnectionSupervisor and the
 * pieces it drives).
 */
#include "trl_service.hpp"

#include "relay/chunk_codec.hpp"
#include "relay/events.hpp"
#include "relay/outcome.hpp"
#include "relay/request_channel.hpp"
#include "relay/wire.hpp"

#include "dispatch/dispatcher.hpp"
#include "dispatch/dispatcher_config.hpp"
#include "dispatch/job_registry.hpp"
#include "dispatch/relay_client.hpp"

#include "worker/connection_supervisor.hpp"
#include "worker/control_client.hpp"
#include "worker/event_source.hpp"
#include "worker/reassembly_store.hpp"
#include "worker/test_engine.hpp"
#include "worker/worker_config.hpp"
#include "worker/worker_executor.hpp"
