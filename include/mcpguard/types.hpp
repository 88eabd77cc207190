#ifndef MCPGUARD_TYPES_HPP
#define MCPGUARD_TYPES_HPP

#include <mcpguard/policy.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace mcpguard
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

// ============================================================================
// Protocol constants
// ============================================================================

namespace methods
{
constexpr const char* TOOLS_LIST = "tools/list";
constexpr const char* TOOLS_CALL = "tools/call";
constexpr const char* PROMPTS_LIST = "prompts/list";
constexpr const char* PROMPTS_GET = "prompts/get";
constexpr const char* RESOURCES_LIST = "resources/list";
constexpr const char* RESOURCES_READ = "resources/read";
constexpr const char* NOTIFICATION_PREFIX = "notifications/";
} // namespace methods

namespace error_codes
{
constexpr int SERVER_ERROR = -32000;
} // namespace error_codes

constexpr const char* JSONRPC_VERSION = "2.0";

// ============================================================================
// Request parameters (selected by method)
// ============================================================================

/// tools/call
struct ToolCallParams
{
    std::string name;
    json arguments = json::object();
};

/// resources/read
struct ResourceReadParams
{
    std::string uri;
};

/// prompts/get
struct PromptGetParams
{
    std::string name;
    json arguments = json::object();
};

/// Any other method, or a recognized method whose params lack the expected fields
struct OpaqueParams
{
    json value;
};

using RequestParams = std::variant<ToolCallParams, ResourceReadParams, PromptGetParams, OpaqueParams>;

/// Client request as decoded by the proxy. raw_json holds the message exactly as
/// received and is what gets forwarded.
struct Request
{
    std::string jsonrpc;
    json id;            // null when absent
    bool has_id = false;
    std::string method; // empty when absent
    RequestParams params = OpaqueParams{};
    json raw_json;

    // No id, or a notifications/* method
    bool is_notification() const;

    // List method -> entity type being listed
    std::optional<EntityType> listed_entity() const;
};

/// Decode a client message. Throws ProtocolDecodeError when it is not an object.
Request parse_request(const json& message);

/// {"jsonrpc":"2.0","id":id,"error":{"code":code,"message":message}}
json make_error_response(const json& id, int code, const std::string& message);

} // namespace mcpguard

#endif // MCPGUARD_TYPES_HPP
