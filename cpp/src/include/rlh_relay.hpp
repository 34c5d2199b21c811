#pragma once
/**
 * @file rlh_relay.hpp
 * @brief Layer 3: The relay channel and its message stores.
 *
 * Include this to open channels, run a store service, or connect to one.
 */
#include "rlh_service.hpp"

#include "utils/message_store.hpp"
#include "utils/key_space.hpp"
#include "utils/in_memory_store.hpp"
#include "utils/zmq_context.hpp"
#include "utils/store_service.hpp"
#include "utils/store_client.hpp"
#include "utils/channel_keys.hpp"
#include "utils/channel_error.hpp"
#include "utils/channel.hpp"
