#include "relay/wire.hpp"

namespace testrelay::relay::wire
{

namespace
{
bool send_frames(zmq::socket_t &socket, const zmq::message_t *identity,
                 std::vector<zmq::const_buffer> &frames)
{
    if (identity != nullptr)
    {
        frames.insert(frames.begin(), zmq::buffer(identity->data(), identity->size()));
    }
    return zmq::send_multipart(socket, frames).has_value();
}
} // namespace

bool send_control(zmq::socket_t &socket, const zmq::message_t *identity, std::string_view type,
                  const nlohmann::json &body, std::span<const uint8_t> payload, bool with_payload)
{
    const std::string body_str = body.dump();
    std::vector<zmq::const_buffer> frames = {zmq::buffer(&kFrameTypeControl, 1),
                                             zmq::buffer(type.data(), type.size()),
                                             zmq::buffer(body_str)};
    if (with_payload)
    {
        frames.push_back(zmq::buffer(payload.data(), payload.size()));
    }
    return send_frames(socket, identity, frames);
}

utils::Result<ControlMessage, DecodeError> decode_control(std::vector<zmq::message_t> &frames,
                                                          std::size_t offset)
{
    using R = utils::Result<ControlMessage, DecodeError>;
    if (frames.size() < offset + 3 || frames.size() > offset + 4)
    {
        return R::error(DecodeError::MalformedFrames, static_cast<long long>(frames.size()));
    }
    const auto &ft = frames[offset];
    if (ft.size() != 1 || *static_cast<const char *>(ft.data()) != kFrameTypeControl)
    {
        return R::error(DecodeError::MalformedFrames);
    }

    ControlMessage msg;
    msg.type = frames[offset + 1].to_string();
    const auto body_sv = frames[offset + 2].to_string_view();
    try
    {
        msg.body = body_sv.empty() ? nlohmann::json::object() : nlohmann::json::parse(body_sv);
    }
    catch (const nlohmann::json::parse_error &)
    {
        return R::error(DecodeError::InvalidHeader);
    }
    if (!msg.body.is_object())
    {
        return R::error(DecodeError::InvalidHeader);
    }
    if (frames.size() == offset + 4)
    {
        msg.payload = std::move(frames[offset + 3]);
    }
    return R::ok(std::move(msg));
}

bool send_event(zmq::socket_t &socket, const zmq::message_t &identity, const Event &ev)
{
    if (const auto *chunk = std::get_if<JobChunk>(&ev))
    {
        return send_chunk(socket, identity, chunk->job_id, chunk->data);
    }
    const auto kind = kind_of(ev);
    const std::string header = header_of(ev).dump();
    std::vector<zmq::const_buffer> frames = {zmq::buffer(&kFrameTypeEvent, 1),
                                             zmq::buffer(kind.data(), kind.size()),
                                             zmq::buffer(header)};
    return send_frames(socket, &identity, frames);
}

bool send_chunk(zmq::socket_t &socket, const zmq::message_t &identity, std::string_view job_id,
                std::span<const uint8_t> data)
{
    const std::string header = nlohmann::json{{"job_id", std::string(job_id)}, {"size", data.size()}}.dump();
    std::vector<zmq::const_buffer> frames = {
        zmq::buffer(&kFrameTypeEvent, 1),
        zmq::buffer(event_kind::kJobChunk.data(), event_kind::kJobChunk.size()),
        zmq::buffer(header), zmq::buffer(data.data(), data.size())};
    return send_frames(socket, &identity, frames);
}

utils::Result<Event, DecodeError> decode_event_frames(const std::vector<zmq::message_t> &frames,
                                                      std::size_t offset)
{
    using R = utils::Result<Event, DecodeError>;
    if (frames.size() < offset + 3 || frames.size() > offset + 4)
    {
        return R::error(DecodeError::MalformedFrames, static_cast<long long>(frames.size()));
    }
    const auto &ft = frames[offset];
    if (ft.size() != 1 || *static_cast<const char *>(ft.data()) != kFrameTypeEvent)
    {
        return R::error(DecodeError::MalformedFrames);
    }
    std::optional<std::span<const uint8_t>> data;
    if (frames.size() == offset + 4)
    {
        const auto &d = frames[offset + 3];
        data = std::span<const uint8_t>(static_cast<const uint8_t *>(d.data()), d.size());
    }
    return decode_event(frames[offset + 1].to_string_view(), frames[offset + 2].to_string_view(),
                        data);
}

std::optional<std::string> string_field(const nlohmann::json &body, const char *key)
{
    if (!body.is_object() || !body.contains(key))
    {
        return std::string{};
    }
    const auto &v = body[key];
    if (!v.is_string())
    {
        return std::nullopt;
    }
    return v.get<std::string>();
}

nlohmann::json make_error(std::string_view correlation_id, std::string_view error_code,
                          std::string_view message)
{
    nlohmann::json body{{"status", "error"},
                        {"error_code", std::string(error_code)},
                        {"message", std::string(message)}};
    if (!correlation_id.empty())
    {
        body["correlation_id"] = std::string(correlation_id);
    }
    return body;
}

} // namespace testrelay::relay::wire
