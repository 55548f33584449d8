#include "relay/events.hpp"

namespace testrelay::relay
{

namespace
{
template <class... Ts> struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

using DecodeResult = utils::Result<Event, DecodeError>;

bool has_string(const nlohmann::json &j, const char *key)
{
    return j.contains(key) && j[key].is_string() && !j[key].get_ref<const std::string &>().empty();
}

bool has_unsigned(const nlohmann::json &j, const char *key)
{
    return j.contains(key) && j[key].is_number_unsigned();
}
} // namespace

std::string_view to_string(DecodeError err) noexcept
{
    switch (err)
    {
    case DecodeError::MalformedFrames:
        return "malformed frames";
    case DecodeError::UnknownEventKind:
        return "unknown event kind";
    case DecodeError::InvalidHeader:
        return "invalid event header";
    case DecodeError::ChunkSizeMismatch:
        return "chunk size mismatch";
    case DecodeError::Unknown:
        break;
    }
    return "unknown decode error";
}

std::string_view kind_of(const Event &ev) noexcept
{
    return std::visit(overloaded{
                          [](const KeepAlive &) { return event_kind::kKeepAlive; },
                          [](const JobStart &) { return event_kind::kJobStart; },
                          [](const JobChunk &) { return event_kind::kJobChunk; },
                          [](const JobEnd &) { return event_kind::kJobEnd; },
                          [](const Shutdown &) { return event_kind::kShutdown; },
                      },
                      ev);
}

nlohmann::json header_of(const Event &ev)
{
    return std::visit(
        overloaded{
            [](const KeepAlive &) { return nlohmann::json::object(); },
            [](const JobStart &e) {
                nlohmann::json j{{"job_id", e.job_id}, {"total_size", e.total_size}};
                if (e.deadline_ms)
                {
                    j["deadline_ms"] = *e.deadline_ms;
                }
                return j;
            },
            [](const JobChunk &e) {
                return nlohmann::json{{"job_id", e.job_id}, {"size", e.data.size()}};
            },
            [](const JobEnd &e) { return nlohmann::json{{"job_id", e.job_id}}; },
            [](const Shutdown &) { return nlohmann::json::object(); },
        },
        ev);
}

utils::Result<Event, DecodeError> decode_event(std::string_view kind, std::string_view header,
                                               std::optional<std::span<const uint8_t>> data)
{
    const bool is_chunk = kind == event_kind::kJobChunk;
    if (kind != event_kind::kKeepAlive && kind != event_kind::kJobStart && !is_chunk &&
        kind != event_kind::kJobEnd && kind != event_kind::kShutdown)
    {
        return DecodeResult::error(DecodeError::UnknownEventKind);
    }
    if (is_chunk != data.has_value())
    {
        return DecodeResult::error(DecodeError::MalformedFrames);
    }

    nlohmann::json j;
    try
    {
        j = header.empty() ? nlohmann::json::object() : nlohmann::json::parse(header);
    }
    catch (const nlohmann::json::parse_error &)
    {
        return DecodeResult::error(DecodeError::InvalidHeader);
    }
    if (!j.is_object())
    {
        return DecodeResult::error(DecodeError::InvalidHeader);
    }

    if (kind == event_kind::kKeepAlive)
    {
        return DecodeResult::ok(KeepAlive{});
    }
    if (kind == event_kind::kShutdown)
    {
        return DecodeResult::ok(Shutdown{});
    }
    if (!has_string(j, "job_id"))
    {
        return DecodeResult::error(DecodeError::InvalidHeader);
    }
    auto job_id = j["job_id"].get<std::string>();

    if (kind == event_kind::kJobStart)
    {
        if (!has_unsigned(j, "total_size"))
        {
            return DecodeResult::error(DecodeError::InvalidHeader);
        }
        std::optional<uint64_t> deadline_ms;
        if (j.contains("deadline_ms"))
        {
            if (!j["deadline_ms"].is_number_unsigned())
            {
                return DecodeResult::error(DecodeError::InvalidHeader);
            }
            deadline_ms = j["deadline_ms"].get<uint64_t>();
        }
        return DecodeResult::ok(
            JobStart{std::move(job_id), j["total_size"].get<uint64_t>(), deadline_ms});
    }
    if (kind == event_kind::kJobEnd)
    {
        return DecodeResult::ok(JobEnd{std::move(job_id)});
    }

    // job_chunk
    if (!has_unsigned(j, "size"))
    {
        return DecodeResult::error(DecodeError::InvalidHeader);
    }
    const uint64_t declared = j["size"].get<uint64_t>();
    if (declared != data->size())
    {
        return DecodeResult::error(DecodeError::ChunkSizeMismatch,
                                   static_cast<long long>(data->size()));
    }
    return DecodeResult::ok(JobChunk{std::move(job_id), {data->begin(), data->end()}});
}

} // namespace testrelay::relay
