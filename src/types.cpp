#include <mcpguard/errors.hpp>
#include <mcpguard/types.hpp>

namespace mcpguard
{

namespace
{
std::optional<std::string> string_field(const json& object, const char* key)
{
    if (!object.is_object())
        return std::nullopt;
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

RequestParams parse_params(const std::string& method, const json& params)
{
    if (method == methods::TOOLS_CALL)
    {
        if (auto name = string_field(params, "name"))
            return ToolCallParams{*name, params.value("arguments", json::object())};
    }
    else if (method == methods::RESOURCES_READ)
    {
        if (auto uri = string_field(params, "uri"))
            return ResourceReadParams{*uri};
    }
    else if (method == methods::PROMPTS_GET)
    {
        if (auto name = string_field(params, "name"))
            return PromptGetParams{*name, params.value("arguments", json::object())};
    }
    return OpaqueParams{params};
}
} // namespace

bool Request::is_notification() const
{
    return !has_id || method.rfind(methods::NOTIFICATION_PREFIX, 0) == 0;
}

std::optional<EntityType> Request::listed_entity() const
{
    if (method == methods::TOOLS_LIST)
        return EntityType::Tool;
    if (method == methods::PROMPTS_LIST)
        return EntityType::Prompt;
    if (method == methods::RESOURCES_LIST)
        return EntityType::Resource;
    return std::nullopt;
}

Request parse_request(const json& message)
{
    if (!message.is_object())
        throw ProtocolDecodeError("Request must be a JSON object, got " +
                                  std::string(message.type_name()));

    Request request;
    request.raw_json = message;
    request.jsonrpc = string_field(message, "jsonrpc").value_or("");
    request.method = string_field(message, "method").value_or("");

    if (auto it = message.find("id"); it != message.end())
    {
        request.id = *it;
        request.has_id = true;
    }

    json params = message.contains("params") ? message["params"] : json();
    request.params = parse_params(request.method, params);
    return request;
}

json make_error_response(const json& id, int code, const std::string& message)
{
    return json{
        {"jsonrpc", JSONRPC_VERSION}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

} // namespace mcpguard
