#pragma once
/**
 * @file config_utils.hpp
 * @brief Helpers shared by the dispatcher and worker JSON configuration loaders.
 */
#include <cstdint>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "testrelay_core_export.h"

namespace testrelay::config
{

/// Largest accepted duration setting: one week. Keeps "now + setting" far from overflow.
inline constexpr uint64_t kMaxDurationSeconds = 7ULL * 24 * 3600;
inline constexpr uint64_t kMaxDurationMs = kMaxDurationSeconds * 1000;

/**
 * @brief Reads and parses a JSON file.
 * @param what Prefix for error messages, e.g. "Dispatcher config".
 * @throws std::runtime_error if the file cannot be opened or is not valid JSON.
 */
TESTRELAY_CORE_EXPORT nlohmann::json load_json_file(const std::string &path, const std::string &what);

/// Resolve "env:VAR" to the value of $VAR (empty if unset); other strings pass through.
TESTRELAY_CORE_EXPORT std::string resolve_env_value(const std::string &s);

/// j.value(key, fallback) for strings, with "env:VAR" resolution.
TESTRELAY_CORE_EXPORT std::string string_value(const nlohmann::json &j, const char *key,
                                               const std::string &fallback);

/**
 * @brief Reads a non-negative integer field; absent keys yield @p fallback.
 * @throws std::runtime_error if the field is present but not a non-negative integer,
 *         or is larger than @p max_value.
 */
TESTRELAY_CORE_EXPORT uint64_t unsigned_value(const nlohmann::json &j, const char *key,
                                              uint64_t fallback, const std::string &what,
                                              uint64_t max_value = std::numeric_limits<uint64_t>::max());

/// Reads a boolean field; absent keys yield @p fallback. @throws std::runtime_error on a non-boolean.
TESTRELAY_CORE_EXPORT bool bool_value(const nlohmann::json &j, const char *key, bool fallback,
                                      const std::string &what);

/**
 * @brief Applies "log_level" and "log_file" settings to the Logger.
 * @throws std::runtime_error for an unknown level name or an unopenable log file.
 */
TESTRELAY_CORE_EXPORT void apply_logging(const std::string &log_level, const std::string &log_file);

} // namespace testrelay::config
