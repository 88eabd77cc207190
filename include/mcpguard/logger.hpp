#ifndef MCPGUARD_LOGGER_HPP
#define MCPGUARD_LOGGER_HPP

#include <chrono>
#include <fstream>
#include <mcpguard/types.hpp>
#include <ostream>
#include <string>

namespace mcpguard
{

/**
 * Append-only session log.
 *
 * Every entry is one line: "[<RFC3339 timestamp>] <message>". JSON payloads
 * are written compact so an entry never spans lines. The file is opened in
 * append mode and never rotated or truncated.
 */
class Logger
{
  public:
    /**
     * Open (creating if needed) the log file at path. Missing parent
     * directories are created with mode 0750 and a new file gets mode 0600.
     * @throws ConfigError if the file cannot be opened
     */
    explicit Logger(const std::string& path);

    /// Log to an existing stream (not owned)
    explicit Logger(std::ostream& stream);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(const std::string& message);

    /// "<label>: <compact json>"
    void log_json(const std::string& label, const json& value);

    /// Empty for stream loggers
    const std::string& path() const
    {
        return path_;
    }

    /**
     * $HOME/.mcpt/logs/guard.log, falling back to USERPROFILE.
     * @throws ConfigError when neither variable is set
     */
    static std::string default_path();

    /// RFC3339 local time with numeric offset, "Z" for UTC
    static std::string format_timestamp(std::chrono::system_clock::time_point time);

  private:
    std::ofstream file_;
    std::ostream* out_;
    std::string path_;
};

} // namespace mcpguard

#endif // MCPGUARD_LOGGER_HPP
