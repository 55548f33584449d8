#pragma once
/**
 * @file uid_utils.hpp
 * @brief Utilities for generating and validating testrelay identifiers.
 *
 * ## Formats
 *
 *   Job:    RFC 4122 version-4 UUID, e.g. "3f2b1c9a-7e4d-4c2a-9b1e-0d5f6a7b8c9d"
 *   Worker: WORKER-{NAME}-{SUFFIX}
 *
 * Where:
 *   {NAME}   -- Up to 8 uppercase alphanumeric characters derived from the
 *               human-readable name. Non-alphanumeric runs collapse to a single
 *               "-"; leading/trailing "-" are stripped. Falls back to "NODE".
 *   {SUFFIX} -- 8 uppercase hex digits from a 32-bit random value.
 *
 * Job ids must be globally unique for the lifetime of a dispatcher (late results are
 * matched by id), so they carry 122 random bits rather than the 32-bit worker suffix.
 */

#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <string_view>

namespace testrelay::uid
{

namespace detail
{

/// Derive up to @p max_len uppercase alphanumeric chars from @p name.
/// Returns "NODE" when the result would otherwise be empty.
inline std::string sanitize_name_part(const std::string &name, std::size_t max_len = 8)
{
    std::string out;
    out.reserve(max_len + 1);
    for (unsigned char c : name)
    {
        if (out.size() >= max_len)
        {
            break;
        }
        if (std::isalpha(c) != 0)
        {
            out += static_cast<char>(std::toupper(c));
        }
        else if (std::isdigit(c) != 0)
        {
            out += static_cast<char>(c);
        }
        else if (!out.empty() && out.back() != '-')
        {
            out += '-';
        }
    }
    while (!out.empty() && out.back() == '-')
    {
        out.pop_back();
    }
    return out.empty() ? "NODE" : out;
}

/// Per-thread generator seeded from std::random_device mixed with the clock.
inline std::mt19937_64 &thread_rng()
{
    thread_local std::mt19937_64 rng = [] {
        uint64_t seed = static_cast<uint64_t>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());
        try
        {
            std::random_device rd;
            seed ^= (static_cast<uint64_t>(rd()) << 32U) | rd();
        }
        catch (const std::exception &)
        {
            // No entropy source: the clock-derived seed stands alone.
        }
        return std::mt19937_64(seed);
    }();
    return rng;
}

inline uint32_t random_u32()
{
    return static_cast<uint32_t>(thread_rng()() >> 32U);
}

} // namespace detail

/**
 * @brief Generate a job identifier (UUID version 4, lowercase, hyphenated).
 */
inline std::string generate_job_id()
{
    std::array<uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8)
    {
        uint64_t word = detail::thread_rng()();
        for (std::size_t b = 0; b < 8; ++b)
        {
            bytes[i + b] = static_cast<uint8_t>(word >> (8U * b));
        }
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0FU) | 0x40U); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3FU) | 0x80U); // RFC 4122 variant

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
        {
            out += '-';
        }
        out += kHex[(bytes[i] >> 4U) & 0x0FU];
        out += kHex[bytes[i] & 0x0FU];
    }
    return out;
}

/**
 * @brief Generate a worker UID: @c "WORKER-{NAME}-{8HEX}".
 *
 * @param worker_name Human-readable worker name (e.g. "studio-01").
 */
inline std::string generate_worker_uid(const std::string &worker_name = "")
{
    const auto name_part = detail::sanitize_name_part(worker_name, 8U);
    char suffix[9];
    std::snprintf(suffix, sizeof(suffix), "%08X", detail::random_u32());
    return "WORKER-" + name_part + "-" + suffix;
}

/// True if @p id has the shape of a version-4 UUID produced by generate_job_id().
inline bool is_job_id(std::string_view id) noexcept
{
    if (id.size() != 36U)
    {
        return false;
    }
    for (std::size_t i = 0; i < id.size(); ++i)
    {
        const char c = id[i];
        if (i == 8 || i == 13 || i == 18 || i == 23)
        {
            if (c != '-')
                return false;
        }
        else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
        {
            return false;
        }
    }
    return id[14] == '4';
}

/// True if @p uid starts with @c "WORKER-" and has at least one more character.
inline bool has_worker_prefix(std::string_view uid) noexcept
{
    return uid.size() >= 11U && uid.substr(0, 7) == "WORKER-";
}

} // namespace testrelay::uid
