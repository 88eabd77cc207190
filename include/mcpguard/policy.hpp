#ifndef MCPGUARD_POLICY_HPP
#define MCPGUARD_POLICY_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcpguard
{

/// Kinds of entities a tool server exposes
enum class EntityType
{
    Tool,
    Prompt,
    Resource
};

/// Canonical name used in pattern maps and messages ("tool", "prompt", "resource")
const char* entity_type_name(EntityType type);

/// Parse "tool"/"tools", "prompt"/"prompts", "resource"/"resources"/"res" (case-insensitive)
std::optional<EntityType> parse_entity_type(const std::string& text);

/// Entity type name -> ordered glob patterns
using PatternMap = std::map<std::string, std::vector<std::string>>;

/// Shell-glob match of name against pattern ('*', '?', '[...]' with
/// negation and ranges, '\' escapes; '*' also matches '/').
/// A malformed pattern (unclosed or empty '[', dangling range, trailing '\')
/// never matches.
bool glob_match(const std::string& pattern, const std::string& name);

/**
 * Allow/deny decision over entity names.
 *
 * A type without allow patterns is allow-all. With allow patterns a name must
 * match one of them, and any matching deny pattern overrides the result.
 * Immutable once constructed.
 */
class Policy
{
  public:
    Policy() = default;
    Policy(PatternMap allow, PatternMap deny);

    bool is_allowed(const std::string& entity_type, const std::string& name) const;
    bool is_allowed(EntityType type, const std::string& name) const
    {
        return is_allowed(entity_type_name(type), name);
    }

    const PatternMap& allow_patterns() const
    {
        return allow_;
    }

    const PatternMap& deny_patterns() const
    {
        return deny_;
    }

  private:
    const std::vector<std::string>& patterns_for(const PatternMap& map,
                                                 const std::string& entity_type) const;

    PatternMap allow_;
    PatternMap deny_;
};

} // namespace mcpguard

#endif // MCPGUARD_POLICY_HPP
