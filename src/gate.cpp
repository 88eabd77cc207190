#include <mcpguard/gate.hpp>

#include <type_traits>

namespace mcpguard
{

RequestGate::RequestGate(const Policy& policy) : policy_(policy) {}

std::string RequestGate::resource_name(const std::string& uri)
{
    size_t idx = uri.find_last_of(":/");
    if (idx != std::string::npos && idx < uri.size() - 1)
        return uri.substr(idx + 1);
    return uri;
}

std::optional<PolicyViolation> RequestGate::check(const Request& request) const
{
    return std::visit(
        [this](const auto& params) -> std::optional<PolicyViolation>
        {
            using T = std::decay_t<decltype(params)>;

            if constexpr (std::is_same_v<T, ToolCallParams>)
            {
                if (!policy_.is_allowed(EntityType::Tool, params.name))
                    return PolicyViolation("tool", params.name);
            }
            else if constexpr (std::is_same_v<T, ResourceReadParams>)
            {
                std::string name = resource_name(params.uri);
                if (!policy_.is_allowed(EntityType::Resource, name))
                    return PolicyViolation("resource", name);
            }
            else if constexpr (std::is_same_v<T, PromptGetParams>)
            {
                if (!policy_.is_allowed(EntityType::Prompt, params.name))
                    return PolicyViolation("prompt", params.name);
            }
            return std::nullopt;
        },
        request.params);
}

} // namespace mcpguard
