#include "worker/reassembly_store.hpp"

#include "utils/logger.hpp"

namespace testrelay::worker
{

using relay::ProtocolError;

ReassemblyStore::ReassemblyStore(std::size_t max_total_size) : m_max_total_size(max_total_size) {}

utils::Result<std::size_t, ProtocolError> ReassemblyStore::open(const std::string &job_id,
                                                                uint64_t total_size)
{
    using R = utils::Result<std::size_t, ProtocolError>;
    if (!m_buffers.empty())
    {
        return R::error(ProtocolError::BufferAlreadyOpen);
    }
    if (total_size > m_max_total_size)
    {
        LOGGER_WARN("ReassemblyStore: job {} announces {} bytes, limit is {}", job_id, total_size,
                    m_max_total_size);
        return R::error(ProtocolError::Overflow, static_cast<long long>(total_size));
    }

    Buffer buf;
    buf.expected = static_cast<std::size_t>(total_size);
    buf.data.reserve(buf.expected);
    m_buffers.emplace(job_id, std::move(buf));
    LOGGER_DEBUG("ReassemblyStore: opened buffer for job {} ({} bytes)", job_id, total_size);
    return R::ok(static_cast<std::size_t>(total_size));
}

utils::Result<std::size_t, ProtocolError> ReassemblyStore::append(const std::string &job_id,
                                                                  std::span<const uint8_t> data)
{
    using R = utils::Result<std::size_t, ProtocolError>;
    const auto it = m_buffers.find(job_id);
    if (it == m_buffers.end())
    {
        return R::error(ProtocolError::NoOpenBuffer);
    }
    Buffer &buf = it->second;
    if (data.size() > buf.expected - buf.data.size())
    {
        const long long would_be = static_cast<long long>(buf.data.size() + data.size());
        m_buffers.erase(it);
        return R::error(ProtocolError::Overflow, would_be);
    }
    buf.data.insert(buf.data.end(), data.begin(), data.end());
    return R::ok(buf.data.size());
}

utils::Result<std::vector<uint8_t>, ProtocolError> ReassemblyStore::finish(const std::string &job_id)
{
    using R = utils::Result<std::vector<uint8_t>, ProtocolError>;
    auto node = m_buffers.extract(job_id);
    if (node.empty())
    {
        return R::error(ProtocolError::NoOpenBuffer);
    }
    Buffer &buf = node.mapped();
    if (buf.data.size() != buf.expected)
    {
        return R::error(ProtocolError::LengthMismatch, static_cast<long long>(buf.data.size()));
    }
    return R::ok(std::move(buf.data));
}

bool ReassemblyStore::discard(const std::string &job_id)
{
    return m_buffers.erase(job_id) != 0;
}

void ReassemblyStore::clear() noexcept
{
    m_buffers.clear();
}

std::optional<std::string> ReassemblyStore::open_job() const
{
    if (m_buffers.empty())
    {
        return std::nullopt;
    }
    return m_buffers.begin()->first;
}

} // namespace testrelay::worker
