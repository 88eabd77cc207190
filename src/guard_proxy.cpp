#include <mcpguard/errors.hpp>
#include <mcpguard/guard_proxy.hpp>

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

namespace mcpguard
{

namespace
{
constexpr size_t MAX_UNANSWERED_IDS = 64;

std::string join(const std::vector<std::string>& parts, const std::string& separator)
{
    std::ostringstream oss;
    for (size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
            oss << separator;
        oss << parts[i];
    }
    return oss.str();
}

void print_filtering(const GuardOptions& options)
{
    std::cerr << "Guard proxy with filtering:" << std::endl;
    for (auto type : {EntityType::Tool, EntityType::Prompt, EntityType::Resource})
    {
        const char* name = entity_type_name(type);
        auto allow = options.allow_patterns.find(name);
        if (allow != options.allow_patterns.end() && !allow->second.empty())
            std::cerr << "- Allowing " << name << " matching: " << join(allow->second, ", ")
                      << std::endl;
        auto deny = options.deny_patterns.find(name);
        if (deny != options.deny_patterns.end() && !deny->second.empty())
            std::cerr << "- Denying " << name << " matching: " << join(deny->second, ", ")
                      << std::endl;
    }
}
} // namespace

// ============================================================================
// GuardSession
// ============================================================================

GuardSession::GuardSession(Policy policy, Logger& logger, Transport& client, Transport& child)
    : policy_(std::move(policy)), logger_(logger), client_(client), child_(child), gate_(policy_),
      filter_(policy_, &logger_)
{
}

void GuardSession::run()
{
    while (step())
    {
    }
}

std::optional<Request> GuardSession::read_request()
{
    std::cerr << "Waiting for request..." << std::endl;

    try
    {
        auto message = client_.read_message();
        if (!message)
            return std::nullopt;
        return parse_request(*message);
    }
    catch (const GuardError& e)
    {
        // No way to resynchronize the client stream
        logger_.log(std::string("Error decoding request: ") + e.what());
        std::cerr << "Error decoding request: " << e.what() << std::endl;
        throw;
    }
}

bool GuardSession::step()
{
    auto request = read_request();
    if (!request)
    {
        logger_.log("Client disconnected (EOF)");
        return false;
    }

    logger_.log_json("Received request", request->raw_json);
    std::cerr << "Received request: " << request->method << " (ID: " << request->id.dump() << ")"
              << std::endl;
    last_id_ = request->id;

    if (request->method.empty())
    {
        logger_.log("Ignoring client message without a method");
        return true;
    }

    if (request->is_notification())
    {
        logger_.log("Received notification: " + request->method);
        std::cerr << "Received notification: " << request->method << std::endl;
        return true;
    }

    if (auto violation = gate_.check(*request))
    {
        logger_.log("Blocked " + request->method + " of filtered " + violation->entity_kind() +
                    ": " + violation->name());
        send_error(violation->what());
        return true;
    }

    forward(*request);
    return true;
}

void GuardSession::forward(const Request& request)
{
    try
    {
        child_.write_message(request.raw_json);
    }
    catch (const GuardError& e)
    {
        logger_.log(std::string("Error forwarding request to child: ") + e.what());
        send_error(std::string("error forwarding request: ") + e.what());
        return;
    }

    std::optional<json> response;
    do
    {
        try
        {
            response = child_.read_message();
        }
        catch (const ProtocolDecodeError& e)
        {
            logger_.log(std::string("Error reading response from child: ") + e.what());
            unanswered_ids_.push_back(request.id);
            if (unanswered_ids_.size() > MAX_UNANSWERED_IDS)
                unanswered_ids_.erase(unanswered_ids_.begin());
            send_error(std::string("error reading response: ") + e.what());
            return;
        }
        catch (const ChildUnavailableError& e)
        {
            logger_.log(std::string("Error reading response from child: ") + e.what());
            throw;
        }

        if (!response)
        {
            auto code = child_.exit_code();
            logger_.log("Child process disconnected (EOF)" +
                        (code ? " with exit code " + std::to_string(*code) : std::string()));
            throw ChildUnavailableError("child process disconnected unexpectedly",
                                        code.value_or(-1));
        }
    } while (is_late_reply(*response, request));

    if (response->is_object())
    {
        auto reply_id = response->find("id");
        if (reply_id != response->end() && *reply_id != request.id)
            logger_.log("Warning: child reply id " + reply_id->dump() +
                        " does not match request id " + request.id.dump());
    }

    if (auto type = request.listed_entity())
        filter_.apply(*type, *response);

    logger_.log_json("Sending response", *response);
    send_response(*response);
}

bool GuardSession::is_late_reply(const json& response, const Request& request)
{
    if (!response.is_object())
        return false;
    auto reply_id = response.find("id");
    if (reply_id == response.end() || *reply_id == request.id)
        return false;

    auto it = std::find(unanswered_ids_.begin(), unanswered_ids_.end(), *reply_id);
    if (it == unanswered_ids_.end())
        return false;

    unanswered_ids_.erase(it);
    logger_.log("Dropping late child reply for already answered request " + reply_id->dump());
    return true;
}

void GuardSession::send_response(const json& response)
{
    try
    {
        client_.write_message(response);
    }
    catch (const GuardError& e)
    {
        logger_.log(std::string("Error sending response to client: ") + e.what());
        std::cerr << "Error sending response to client: " << e.what() << std::endl;
    }
}

void GuardSession::send_error(const std::string& message)
{
    json response = make_error_response(last_id_, error_codes::SERVER_ERROR, message);
    logger_.log_json("Sending error response", response);
    send_response(response);
}

// ============================================================================
// run_guard
// ============================================================================

int run_guard(const GuardOptions& options)
{
    std::unique_ptr<Logger> logger;
    try
    {
        logger = std::make_unique<Logger>(options.log_file ? *options.log_file
                                                            : Logger::default_path());
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    std::cerr << "Logging to " << logger->path() << std::endl;

    print_filtering(options);
    logger->log("Starting guard proxy for command: " + join(options.command, " "));

    auto child = create_child_transport(options);
    try
    {
        child->connect();
    }
    catch (const ChildUnavailableError& e)
    {
        logger->log(std::string("Error starting child process: ") + e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    auto client = create_stdio_transport(STDIN_FILENO, STDOUT_FILENO, options.max_message_size);
    GuardSession session(Policy(options.allow_patterns, options.deny_patterns), *logger, *client,
                         *child);

    logger->log("Guard proxy started, waiting for requests...");
    std::cerr << "Guard proxy started, waiting for requests..." << std::endl;

    int status = 0;
    try
    {
        session.run();
    }
    catch (const GuardError& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        status = 1;
    }

    child->close();
    if (auto code = child->exit_code())
        logger->log("Child process exited with code " + std::to_string(*code));
    return status;
}

} // namespace mcpguard
