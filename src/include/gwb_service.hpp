#pragma once
/**
 * @file gwb_service.hpp
 * @brief Layer 2: service modules built on gwb_base.
 *
 * Provides the asynchronous Logger, retry backoff strategies and the bounded
 * Mailbox used as the in-process channel between relay and dispatcher.
 */
#include "gwb_base.hpp"

#include "utils/backoff_strategy.hpp"
#include "utils/logger.hpp"
#include "utils/mailbox.hpp"
