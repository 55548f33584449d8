#include "utils/config_utils.hpp"
#include "utils/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace testrelay::config
{

nlohmann::json load_json_file(const std::string &path, const std::string &what)
{
    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error(what + ": cannot open file: " + path);

    try
    {
        return nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error(what + ": JSON parse error in '" + path + "': " + e.what());
    }
}

std::string resolve_env_value(const std::string &s)
{
    if (s.size() > 4 && s.substr(0, 4) == "env:")
    {
        const char *val = std::getenv(s.c_str() + 4);
        return (val != nullptr) ? std::string(val) : std::string{};
    }
    return s;
}

std::string string_value(const nlohmann::json &j, const char *key, const std::string &fallback)
{
    if (!j.contains(key))
        return fallback;
    if (!j[key].is_string())
        throw std::runtime_error(std::string("config: '") + key + "' must be a string");
    return resolve_env_value(j[key].get<std::string>());
}

uint64_t unsigned_value(const nlohmann::json &j, const char *key, uint64_t fallback,
                        const std::string &what, uint64_t max_value)
{
    if (!j.contains(key))
        return fallback;
    if (!j[key].is_number_unsigned())
        throw std::runtime_error(what + ": '" + key + "' must be a non-negative integer");
    const auto value = j[key].get<uint64_t>();
    if (value > max_value)
        throw std::runtime_error(what + ": '" + key + "' must not exceed " + std::to_string(max_value));
    return value;
}

bool bool_value(const nlohmann::json &j, const char *key, bool fallback, const std::string &what)
{
    if (!j.contains(key))
        return fallback;
    if (!j[key].is_boolean())
        throw std::runtime_error(what + ": '" + key + "' must be true or false");
    return j[key].get<bool>();
}

void apply_logging(const std::string &log_level, const std::string &log_file)
{
    auto &logger = utils::Logger::instance();
    const auto level = utils::Logger::level_from_string(log_level);
    if (!level)
        throw std::runtime_error("config: invalid log_level '" + log_level +
                                 "' (must be trace, debug, info, warn, error or system)");
    logger.set_level(*level);
    if (!log_file.empty() && !logger.set_logfile(log_file))
        throw std::runtime_error("config: cannot open log file '" + log_file + "'");
}

} // namespace testrelay::config
