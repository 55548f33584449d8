#include "worker/control_client.hpp"

#include "relay/wire.hpp"
#include "utils/logger.hpp"

namespace testrelay::worker
{

namespace wire = relay::wire;

ControlClient::ControlClient(std::string control_endpoint, std::string worker_uid,
                             std::chrono::milliseconds report_timeout)
    : m_channel(std::move(control_endpoint), worker_uid), m_uid(std::move(worker_uid)),
      m_report_timeout(report_timeout)
{
}

bool ControlClient::report(const std::string &job_id, const relay::Outcome &outcome)
{
    try
    {
        auto reply = m_channel.request(wire::msg::kResultReq,
                                       {{"job_id", job_id}, {"worker_uid", m_uid}, {"outcome", outcome.to_json()}},
                                       wire::msg::kResultAck, m_report_timeout);
        if (!reply)
        {
            LOGGER_WARN("ControlClient: no RESULT_ACK for job {} within {} ms", job_id,
                        m_report_timeout.count());
            return false;
        }
        if (reply->type == wire::msg::kError)
        {
            LOGGER_WARN("ControlClient: dispatcher rejected result for job {}: {}", job_id,
                        reply->body.value("message", std::string{}));
            return false;
        }
        if (reply->body.value("status", std::string{}) != "accepted")
        {
            LOGGER_WARN("ControlClient: dispatcher discarded result for job {} ({})", job_id,
                        reply->body.value("reason", std::string{"no reason"}));
        }
        return true;
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("ControlClient: RESULT_REQ for job {} failed: {}", job_id, e.what());
        m_channel.reset();
        return false;
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_WARN("ControlClient: malformed RESULT_ACK for job {}: {}", job_id, e.what());
        return false;
    }
}

bool ControlClient::send_heartbeat()
{
    try
    {
        return m_channel.post(wire::msg::kHeartbeatReq, {{"worker_uid", m_uid}});
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_WARN("ControlClient: heartbeat failed: {}", e.what());
        m_channel.reset();
        return false;
    }
}

std::optional<nlohmann::json> ControlClient::health(std::chrono::milliseconds timeout)
{
    try
    {
        auto reply = m_channel.request(wire::msg::kHealthReq, nlohmann::json::object(),
                                       wire::msg::kHealthAck, timeout);
        if (!reply || reply->type != wire::msg::kHealthAck)
        {
            return std::nullopt;
        }
        return std::move(reply->body);
    }
    catch (const zmq::error_t &e)
    {
        LOGGER_DEBUG("ControlClient: HEALTH_REQ failed: {}", e.what());
        m_channel.reset();
        return std::nullopt;
    }
}

} // namespace testrelay::worker
