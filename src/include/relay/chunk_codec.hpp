#pragma once
/**
 * @file chunk_codec.hpp
 * @brief Splitting payloads into bounded chunks and the protocol errors of reassembly.
 *
 * A payload travels as job_start (declared total size), zero or more job_chunk
 * frames, and job_end. Chunks carry no sequence number: the event channel is a
 * single ordered ZeroMQ connection, so the receiver concatenates in arrival order.
 *
 * split() returns views into the caller's buffer; the payload must outlive them.
 */
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "testrelay_core_export.h"

namespace testrelay::relay
{

/// Default maximum chunk size in bytes.
inline constexpr std::size_t kDefaultChunkSize = 8192;

/**
 * @brief Protocol violations detected while reassembling a streamed payload.
 */
enum class ProtocolError : int
{
    Unknown = 0,
    LengthMismatch,    ///< job_end arrived with cursor != declared total size
    Overflow,          ///< a chunk would write past the declared total size
    BufferAlreadyOpen, ///< job_start arrived while another job's buffer is open
    NoOpenBuffer,      ///< job_chunk/job_end for a job with no open buffer
    ChunkSizeMismatch, ///< size header of a chunk disagrees with its data frame
};

TESTRELAY_CORE_EXPORT std::string_view to_string(ProtocolError err) noexcept;

/**
 * @brief Splits @p payload into ordered slices of at most @p max_chunk_size bytes.
 *
 * Every slice except possibly the last is exactly @p max_chunk_size bytes long.
 * An empty payload yields no slices.
 *
 * @throws std::invalid_argument if @p max_chunk_size is 0.
 */
[[nodiscard]] TESTRELAY_CORE_EXPORT std::vector<std::span<const uint8_t>>
split(std::span<const uint8_t> payload, std::size_t max_chunk_size);

/// Size announced in job_start so the receiver can preallocate.
[[nodiscard]] inline uint64_t total_size(std::span<const uint8_t> payload) noexcept
{
    return static_cast<uint64_t>(payload.size());
}

/**
 * @brief Number of slices split() produces for a payload of @p total bytes.
 * @throws std::invalid_argument if @p max_chunk_size is 0.
 */
[[nodiscard]] TESTRELAY_CORE_EXPORT std::size_t chunk_count(uint64_t total,
                                                            std::size_t max_chunk_size);

/// Concatenates @p chunks in order (the receiver's reassembly, without bounds).
[[nodiscard]] TESTRELAY_CORE_EXPORT std::vector<uint8_t>
concat(const std::vector<std::span<const uint8_t>> &chunks);

} // namespace testrelay::relay
