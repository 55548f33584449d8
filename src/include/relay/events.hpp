#pragma once
/**
 * @file events.hpp
 * @brief The closed set of events the dispatcher pushes to the worker.
 *
 * Event kinds and their JSON headers:
 *   keep_alive  {}
 *   job_start   {"job_id": "...", "total_size": N, "deadline_ms": M}
 *   job_chunk   {"job_id": "...", "size": N}     + one binary frame of N bytes
 *   job_end     {"job_id": "..."}
 *   shutdown    {}
 *
 * "deadline_ms" is the time left before the dispatcher gives up on the job, measured
 * when job_start is sent. It is relative because the two hosts share no clock, and it
 * is optional on decode.
 *
 * decode_event() maps a (kind, header, data) triple back onto the variant; an
 * unrecognised kind is reported as DecodeError::UnknownEventKind so the caller can
 * decide how loudly to complain.
 */
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "testrelay_core_export.h"
#include "utils/result.hpp"

namespace testrelay::relay
{

struct KeepAlive
{
};

struct JobStart
{
    std::string job_id;
    uint64_t total_size{0};
    std::optional<uint64_t> deadline_ms;
};

struct JobChunk
{
    std::string job_id;
    std::vector<uint8_t> data;
};

struct JobEnd
{
    std::string job_id;
};

struct Shutdown
{
};

using Event = std::variant<KeepAlive, JobStart, JobChunk, JobEnd, Shutdown>;

enum class DecodeError : int
{
    Unknown = 0,
    MalformedFrames,   ///< wrong frame count or frame-type byte
    UnknownEventKind,  ///< kind string is not one of the five event kinds
    InvalidHeader,     ///< JSON header missing, unparsable or wrongly typed
    ChunkSizeMismatch, ///< job_chunk "size" disagrees with the data frame
};

TESTRELAY_CORE_EXPORT std::string_view to_string(DecodeError err) noexcept;

namespace event_kind
{
inline constexpr std::string_view kKeepAlive = "keep_alive";
inline constexpr std::string_view kJobStart = "job_start";
inline constexpr std::string_view kJobChunk = "job_chunk";
inline constexpr std::string_view kJobEnd = "job_end";
inline constexpr std::string_view kShutdown = "shutdown";
} // namespace event_kind

/// Kind string of @p ev as it appears on the wire.
[[nodiscard]] TESTRELAY_CORE_EXPORT std::string_view kind_of(const Event &ev) noexcept;

/// JSON header of @p ev (for job_chunk: job_id and size; the bytes travel separately).
[[nodiscard]] TESTRELAY_CORE_EXPORT nlohmann::json header_of(const Event &ev);

/**
 * @brief Rebuilds an event from its wire parts.
 * @param kind   Event kind frame.
 * @param header Raw JSON header frame.
 * @param data   Binary frame; present only for job_chunk.
 */
[[nodiscard]] TESTRELAY_CORE_EXPORT utils::Result<Event, DecodeError>
decode_event(std::string_view kind, std::string_view header,
             std::optional<std::span<const uint8_t>> data);

} // namespace testrelay::relay
