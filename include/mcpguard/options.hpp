#ifndef MCPGUARD_OPTIONS_HPP
#define MCPGUARD_OPTIONS_HPP

#include <mcpguard/policy.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mcpguard
{

// Largest single message buffered from either stream (16MB)
constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 16 * 1024 * 1024;

/// Everything needed to run one guard session
struct GuardOptions
{
    PatternMap allow_patterns;
    PatternMap deny_patterns;

    // Child program and its arguments, command[0] is looked up on PATH
    std::vector<std::string> command;

    // Log file override; default is $HOME/.mcpt/logs/guard.log
    std::optional<std::string> log_file = std::nullopt;

    size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE;

    bool show_help = false;
};

/**
 * Parse guard command-line arguments (without the program name).
 *
 * --allow/-a and --deny/-d take a comma-separated list of "type:pattern"
 * items and may appear anywhere; every other argument is part of the child
 * command, in order. A flag with no value after it is kept as a command
 * argument. A lone -h/--help sets show_help.
 *
 * @throws ConfigError when no child command remains
 */
GuardOptions parse_guard_args(const std::vector<std::string>& args);

/// Add the items of a comma-separated pattern list to patterns.
/// Items without a known "type:" prefix are tool patterns.
void add_patterns(const std::string& pattern_list, PatternMap& patterns);

/// Apply MCPGUARD_LOG_FILE when it is set and non-empty
void apply_environment(GuardOptions& options);

/// Help text for the guard command
std::string usage_text(const std::string& program = "mcpguard");

} // namespace mcpguard

#endif // MCPGUARD_OPTIONS_HPP
