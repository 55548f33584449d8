#pragma once
/**
 * @file reassembly_store.hpp
 * @brief Worker-side buffers that rebuild streamed payloads, keyed by job id.
 *
 * Lifecycle of one buffer: open() on job_start, append() on each job_chunk, finish()
 * on job_end, which hands the bytes out and deletes the buffer. At most one buffer is
 * open at a time; a second open() is reported as BufferAlreadyOpen and leaves the
 * store unchanged, so the caller decides what happens to the open job.
 *
 * A failed append() or finish() discards the offending buffer: after a protocol
 * error the job cannot be completed.
 *
 * Not thread-safe; owned by the connection supervisor thread.
 */
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "relay/chunk_codec.hpp"
#include "testrelay_core_export.h"
#include "utils/result.hpp"

namespace testrelay::worker
{

/// Default upper bound for a single reassembled bundle.
inline constexpr std::size_t kDefaultMaxBundleSize = 50U * 1024U * 1024U;

class TESTRELAY_CORE_EXPORT ReassemblyStore
{
  public:
    explicit ReassemblyStore(std::size_t max_total_size = kDefaultMaxBundleSize);

    /**
     * @brief Creates the buffer for @p job_id with capacity @p total_size.
     * @return The declared size, or BufferAlreadyOpen / Overflow (size above the bound).
     */
    [[nodiscard]] utils::Result<std::size_t, relay::ProtocolError> open(const std::string &job_id,
                                                                        uint64_t total_size);

    /**
     * @brief Copies @p data at the buffer's cursor.
     * @return Bytes received so far, or NoOpenBuffer / Overflow.
     */
    [[nodiscard]] utils::Result<std::size_t, relay::ProtocolError>
    append(const std::string &job_id, std::span<const uint8_t> data);

    /**
     * @brief Removes the buffer and returns its bytes.
     * @return The payload, or NoOpenBuffer / LengthMismatch (cursor != declared size).
     */
    [[nodiscard]] utils::Result<std::vector<uint8_t>, relay::ProtocolError>
    finish(const std::string &job_id);

    /// Deletes the buffer of @p job_id if present. @return true if one was deleted.
    bool discard(const std::string &job_id);

    /// Deletes every buffer (used when the event connection is re-established).
    void clear() noexcept;

    /// Job id of the open buffer, if any.
    [[nodiscard]] std::optional<std::string> open_job() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_buffers.size(); }
    [[nodiscard]] std::size_t max_total_size() const noexcept { return m_max_total_size; }

  private:
    struct Buffer
    {
        std::vector<uint8_t> data;
        std::size_t expected{0};
    };

    std::size_t m_max_total_size;
    std::map<std::string, Buffer> m_buffers;
};

} // namespace testrelay::worker
