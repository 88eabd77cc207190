#ifndef MCPGUARD_GATE_HPP
#define MCPGUARD_GATE_HPP

#include <mcpguard/errors.hpp>
#include <mcpguard/policy.hpp>
#include <mcpguard/types.hpp>
#include <optional>
#include <string>

namespace mcpguard
{

/**
 * Request-time check for tools/call, resources/read and prompts/get.
 *
 * Other methods, and recognized methods whose params carry no usable target,
 * always pass.
 */
class RequestGate
{
  public:
    explicit RequestGate(const Policy& policy);

    /// The violation to report when the request must not reach the child.
    /// A blocked resources/read names the derived resource name (see
    /// resource_name), not the full URI: "resource not found: secret.env".
    std::optional<PolicyViolation> check(const Request& request) const;

    /**
     * Name a resource URI is matched by: the text after the last ':' or '/'.
     * The whole URI is used when it has no separator or ends with one.
     */
    static std::string resource_name(const std::string& uri);

  private:
    const Policy& policy_;
};

} // namespace mcpguard

#endif // MCPGUARD_GATE_HPP
