#include <mcpguard/errors.hpp>
#include <mcpguard/options.hpp>

#include <cstdlib>
#include <sstream>

namespace mcpguard
{

namespace
{
constexpr const char* FLAG_ALLOW = "--allow";
constexpr const char* FLAG_ALLOW_SHORT = "-a";
constexpr const char* FLAG_DENY = "--deny";
constexpr const char* FLAG_DENY_SHORT = "-d";
constexpr const char* FLAG_HELP = "--help";
constexpr const char* FLAG_HELP_SHORT = "-h";

std::string trim(const std::string& text)
{
    const char* whitespace = " \t\r\n";
    size_t start = text.find_first_not_of(whitespace);
    if (start == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& text, char separator)
{
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(text);
    while (std::getline(stream, part, separator))
        parts.push_back(part);
    return parts;
}

void ensure_entity_types(PatternMap& patterns)
{
    for (auto type : {EntityType::Tool, EntityType::Prompt, EntityType::Resource})
        patterns[entity_type_name(type)];
}
} // namespace

void add_patterns(const std::string& pattern_list, PatternMap& patterns)
{
    auto& tools = patterns[entity_type_name(EntityType::Tool)];

    for (const auto& raw : split(pattern_list, ','))
    {
        std::string item = trim(raw);
        if (item.empty())
            continue;

        size_t colon = item.find(':');
        if (colon == std::string::npos)
        {
            tools.push_back(item);
            continue;
        }

        auto type = parse_entity_type(item.substr(0, colon));
        if (!type)
        {
            // Unknown prefix: the whole item is a tool pattern
            tools.push_back(item);
            continue;
        }

        patterns[entity_type_name(*type)].push_back(item.substr(colon + 1));
    }
}

GuardOptions parse_guard_args(const std::vector<std::string>& args)
{
    GuardOptions options;
    ensure_entity_types(options.allow_patterns);
    ensure_entity_types(options.deny_patterns);

    if (args.size() == 1 && (args[0] == FLAG_HELP || args[0] == FLAG_HELP_SHORT))
    {
        options.show_help = true;
        return options;
    }

    size_t i = 0;
    while (i < args.size())
    {
        const std::string& arg = args[i];
        const bool has_value = i + 1 < args.size();

        if ((arg == FLAG_ALLOW || arg == FLAG_ALLOW_SHORT) && has_value)
        {
            add_patterns(args[i + 1], options.allow_patterns);
            i += 2;
        }
        else if ((arg == FLAG_DENY || arg == FLAG_DENY_SHORT) && has_value)
        {
            add_patterns(args[i + 1], options.deny_patterns);
            i += 2;
        }
        else
        {
            options.command.push_back(arg);
            ++i;
        }
    }

    if (options.command.empty())
        throw ConfigError("command to execute is required");

    return options;
}

void apply_environment(GuardOptions& options)
{
    if (const char* log_file = std::getenv("MCPGUARD_LOG_FILE"); log_file && log_file[0] != '\0')
        options.log_file = std::string(log_file);
}

std::string usage_text(const std::string& program)
{
    std::ostringstream oss;
    oss << "Filter tools, prompts, and resources using allow and deny patterns.\n"
        << "\n"
        << "Usage:\n"
        << "  " << program << " [--allow type:pattern] [--deny type:pattern] command args...\n"
        << "\n"
        << "Examples:\n"
        << "  " << program
        << " --allow tools:read_* --deny edit_*,write_*,create_* npx -y "
           "@modelcontextprotocol/server-filesystem ~\n"
        << "  " << program
        << " --allow prompts:system_* --deny tools:execute_* npx -y "
           "@modelcontextprotocol/server-filesystem ~\n"
        << "\n"
        << "Patterns can include wildcards:\n"
        << "  * matches any sequence of characters\n"
        << "\n"
        << "Entity types:\n"
        << "  tools: filter available tools\n"
        << "  prompts: filter available prompts\n"
        << "  resources: filter available resources\n"
        << "\n"
        << "Environment:\n"
        << "  MCPGUARD_LOG_FILE  log file (default ~/.mcpt/logs/guard.log)\n";
    return oss.str();
}

} // namespace mcpguard
