#ifndef MCPGUARD_FILTER_HPP
#define MCPGUARD_FILTER_HPP

#include <mcpguard/policy.hpp>
#include <mcpguard/types.hpp>

namespace mcpguard
{

class Logger;

/**
 * Removes denied entities from tools/list, prompts/list and resources/list
 * results.
 *
 * The entity array at result.<tools|prompts|resources> is replaced in place by
 * the entries whose "name" passes the policy, in their original order. Entries
 * that are not objects or have no string "name" are dropped. Everything else
 * in the response is left alone; a response without that array (an error, or
 * a malformed result) passes through untouched.
 */
class ResponseFilter
{
  public:
    explicit ResponseFilter(const Policy& policy, Logger* logger = nullptr);

    /// Filter response in place, returns the number of entries removed
    size_t apply(EntityType type, json& response) const;

    /// "tools", "prompts" or "resources"
    static const char* collection_key(EntityType type);

  private:
    const Policy& policy_;
    Logger* logger_;
};

} // namespace mcpguard

#endif // MCPGUARD_FILTER_HPP
