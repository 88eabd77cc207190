/**
 * mcpguard - policy-enforcing proxy for stdio tool servers
 *
 * Runs the given command as a child process and relays messages between it
 * and this process's stdin/stdout, hiding and blocking the tools, prompts and
 * resources excluded by --allow/--deny patterns.
 */

#include <csignal>
#include <iostream>
#include <mcpguard/mcpguard.hpp>
#include <string>
#include <vector>

int main(int argc, char* argv[])
{
    // A vanished child or client must surface as EPIPE, not kill the proxy
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.size() == 1 && args[0] == "--version")
    {
        std::cout << "mcpguard " << mcpguard::version_string() << std::endl;
        return 0;
    }

    mcpguard::GuardOptions options;
    try
    {
        options = mcpguard::parse_guard_args(args);
    }
    catch (const mcpguard::ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Example: mcpguard --allow tools:read_* npx -y "
                     "@modelcontextprotocol/server-filesystem ~"
                  << std::endl;
        return 1;
    }

    if (options.show_help)
    {
        std::cout << mcpguard::usage_text();
        return 0;
    }

    mcpguard::apply_environment(options);

    std::cerr << "Running command with filtered environment: ";
    for (size_t i = 0; i < options.command.size(); ++i)
        std::cerr << (i > 0 ? " " : "") << options.command[i];
    std::cerr << std::endl;

    return mcpguard::run_guard(options);
}
