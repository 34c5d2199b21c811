#pragma once
/**
 * @file rlh_service.hpp
 * @brief Layer 2: Service modules built on rlh_base.
 *
 * Provides lifecycle management, logging and the layered JSON configuration.
 */
#include "rlh_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/relay_config.hpp"
