#ifndef MCPGUARD_GUARD_PROXY_HPP
#define MCPGUARD_GUARD_PROXY_HPP

#include <mcpguard/filter.hpp>
#include <mcpguard/gate.hpp>
#include <mcpguard/logger.hpp>
#include <mcpguard/options.hpp>
#include <mcpguard/policy.hpp>
#include <mcpguard/transport.hpp>
#include <mcpguard/types.hpp>

#include <vector>

namespace mcpguard
{

/**
 * One guard session: a single client stream proxied to a single child.
 *
 * Requests are handled strictly one at a time. Each forwarded request is
 * answered by the next message the child writes; reply ids are not used for
 * matching (a mismatch is only logged). The one exception is a request whose
 * reply failed to decode: a later child message carrying that request's id is
 * a late reply and is dropped instead of answering the current request.
 * Notifications from the client are consumed without being forwarded or
 * answered.
 *
 * Both transports must already be connected and must outlive the session.
 */
class GuardSession
{
  public:
    GuardSession(Policy policy, Logger& logger, Transport& client, Transport& child);

    GuardSession(const GuardSession&) = delete;
    GuardSession& operator=(const GuardSession&) = delete;

    /**
     * Run until the client closes its stream.
     * @throws ProtocolDecodeError when the client sends malformed input
     * @throws ChildUnavailableError when the child goes away mid-request
     */
    void run();

    /**
     * Handle one client message.
     * @return false once the client has disconnected
     */
    bool step();

    /// id of the most recent client message (null before the first one)
    const json& last_id() const
    {
        return last_id_;
    }

    const Policy& policy() const
    {
        return policy_;
    }

  private:
    std::optional<Request> read_request();
    void forward(const Request& request);
    bool is_late_reply(const json& response, const Request& request);
    void send_response(const json& response);
    void send_error(const std::string& message);

    Policy policy_;
    Logger& logger_;
    Transport& client_;
    Transport& child_;
    RequestGate gate_;
    ResponseFilter filter_;
    json last_id_;

    // ids answered with a decode error, oldest first
    std::vector<json> unanswered_ids_;
};

/**
 * Start the child described by options, run a session over this process's
 * stdin/stdout and tear everything down.
 * @return 0 after a clean client disconnect, 1 on any fatal error
 */
int run_guard(const GuardOptions& options);

} // namespace mcpguard

#endif // MCPGUARD_GUARD_PROXY_HPP
