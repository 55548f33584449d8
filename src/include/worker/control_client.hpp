#pragma once
/**
 * @file control_client.hpp
 * @brief Worker end of the request channel: results, heartbeats and health checks.
 *
 * One instance per thread (the underlying DEALER socket is single-threaded). The
 * supervisor thread reports results and polls health; the heartbeat thread owns
 * a second instance.
 */
#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "relay/request_channel.hpp"
#include "testrelay_core_export.h"
#include "worker/worker_executor.hpp"

namespace testrelay::worker
{

class TESTRELAY_CORE_EXPORT ControlClient : public ResultReporter
{
  public:
    ControlClient(std::string control_endpoint, std::string worker_uid,
                  std::chrono::milliseconds report_timeout);

    /**
     * @brief RESULT_REQ for @p job_id.
     * @return true when the dispatcher answered RESULT_ACK, whether it accepted the
     *         result or discarded it as late; false on timeout or ERROR.
     */
    bool report(const std::string &job_id, const relay::Outcome &outcome) override;

    /// HEARTBEAT_REQ (no reply). @return false if the message could not be queued.
    bool send_heartbeat();

    /// HEALTH_ACK body, or nullopt if the dispatcher did not answer within @p timeout.
    std::optional<nlohmann::json> health(std::chrono::milliseconds timeout);

    [[nodiscard]] const std::string &worker_uid() const noexcept { return m_uid; }

  private:
    relay::RequestChannel m_channel;
    std::string m_uid;
    std::chrono::milliseconds m_report_timeout;
};

} // namespace testrelay::worker
