#pragma once
/**
 * @file gwb_base.hpp
 * @brief Layer 1: header-only basics and formatting helpers.
 *
 * Provides format_tools, scope_guard and Result<T, E>. Include this when you
 * need formatting or RAII teardown but no logging.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
