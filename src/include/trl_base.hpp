#pragma once
/**
 * @file trl_base.hpp
 * @brief Layer 1: Basic modules built on trl_platform.
 *
 * Provides format_tools, Result<T, E> and UID generation.
 * Include this when you need formatting or the Result type.
 */
#include "trl_platform.hpp"

// Standard library support required by format_tools and Result
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/uid_utils.hpp"
