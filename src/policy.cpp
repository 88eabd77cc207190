#include <mcpguard/policy.hpp>

#include <algorithm>
#include <cctype>
#include <fnmatch.h>
#include <utility>

namespace mcpguard
{

const char* entity_type_name(EntityType type)
{
    switch (type)
    {
    case EntityType::Tool:
        return "tool";
    case EntityType::Prompt:
        return "prompt";
    case EntityType::Resource:
        return "resource";
    }
    return "tool";
}

std::optional<EntityType> parse_entity_type(const std::string& text)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "tool" || lower == "tools")
        return EntityType::Tool;
    if (lower == "prompt" || lower == "prompts")
        return EntityType::Prompt;
    if (lower == "resource" || lower == "resources" || lower == "res")
        return EntityType::Resource;
    return std::nullopt;
}

namespace
{
// One character of a bracket expression, backslash escapes included. A '-' or
// ']' in this position, or the end of the pattern, is a syntax error.
bool skip_class_char(const std::string& pattern, size_t& i)
{
    if (i >= pattern.size() || pattern[i] == '-' || pattern[i] == ']')
        return false;
    if (pattern[i] == '\\' && ++i >= pattern.size())
        return false;
    ++i;
    return true;
}

// fnmatch quietly treats an unclosed '[' as a literal, so the syntax is
// checked up front: bracket expressions need a closing ']' after at least one
// element, ranges need both ends and a trailing backslash is an error.
bool is_well_formed(const std::string& pattern)
{
    size_t i = 0;
    while (i < pattern.size())
    {
        char c = pattern[i++];
        if (c == '\\')
        {
            if (i >= pattern.size())
                return false;
            ++i;
            continue;
        }
        if (c != '[')
            continue;

        if (i < pattern.size() && pattern[i] == '^')
            ++i;
        size_t elements = 0;
        while (true)
        {
            if (elements > 0 && i < pattern.size() && pattern[i] == ']')
            {
                ++i;
                break;
            }
            if (!skip_class_char(pattern, i))
                return false;
            if (i < pattern.size() && pattern[i] == '-')
            {
                ++i;
                if (!skip_class_char(pattern, i))
                    return false;
            }
            ++elements;
        }
    }
    return true;
}
} // namespace

bool glob_match(const std::string& pattern, const std::string& name)
{
    if (!is_well_formed(pattern))
        return false;
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

Policy::Policy(PatternMap allow, PatternMap deny) : allow_(std::move(allow)), deny_(std::move(deny))
{
}

const std::vector<std::string>& Policy::patterns_for(const PatternMap& map,
                                                     const std::string& entity_type) const
{
    static const std::vector<std::string> none;
    auto it = map.find(entity_type);
    return it == map.end() ? none : it->second;
}

bool Policy::is_allowed(const std::string& entity_type, const std::string& name) const
{
    const auto& allow = patterns_for(allow_, entity_type);
    const auto& deny = patterns_for(deny_, entity_type);

    bool allowed = allow.empty();
    for (const auto& pattern : allow)
    {
        if (glob_match(pattern, name))
        {
            allowed = true;
            break;
        }
    }

    // Deny overrides any allow match
    for (const auto& pattern : deny)
        if (glob_match(pattern, name))
            return false;

    return allowed;
}

} // namespace mcpguard
