#include "relay/chunk_codec.hpp"

#include <algorithm>
#include <stdexcept>

namespace testrelay::relay
{

std::string_view to_string(ProtocolError err) noexcept
{
    switch (err)
    {
    case ProtocolError::LengthMismatch:
        return "length mismatch";
    case ProtocolError::Overflow:
        return "chunk overflows declared size";
    case ProtocolError::BufferAlreadyOpen:
        return "job_start while a buffer is open";
    case ProtocolError::NoOpenBuffer:
        return "no open buffer for job";
    case ProtocolError::ChunkSizeMismatch:
        return "chunk size header disagrees with data";
    case ProtocolError::Unknown:
        break;
    }
    return "unknown protocol error";
}

std::vector<std::span<const uint8_t>> split(std::span<const uint8_t> payload,
                                            std::size_t max_chunk_size)
{
    if (max_chunk_size == 0)
    {
        throw std::invalid_argument("chunk_codec::split: max_chunk_size must be positive");
    }
    std::vector<std::span<const uint8_t>> chunks;
    chunks.reserve(chunk_count(payload.size(), max_chunk_size));
    for (std::size_t offset = 0; offset < payload.size(); offset += max_chunk_size)
    {
        const std::size_t len = std::min(max_chunk_size, payload.size() - offset);
        chunks.push_back(payload.subspan(offset, len));
    }
    return chunks;
}

std::size_t chunk_count(uint64_t total, std::size_t max_chunk_size)
{
    if (max_chunk_size == 0)
    {
        throw std::invalid_argument("chunk_codec::chunk_count: max_chunk_size must be positive");
    }
    return static_cast<std::size_t>((total + max_chunk_size - 1) / max_chunk_size);
}

std::vector<uint8_t> concat(const std::vector<std::span<const uint8_t>> &chunks)
{
    std::size_t total = 0;
    for (const auto &c : chunks)
    {
        total += c.size();
    }
    std::vector<uint8_t> out;
    out.reserve(total);
    for (const auto &c : chunks)
    {
        out.insert(out.end(), c.begin(), c.end());
    }
    return out;
}

} // namespace testrelay::relay
