#include <mcpguard/errors.hpp>
#include <mcpguard/logger.hpp>

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace mcpguard
{

Logger::Logger(const std::string& path) : out_(&file_), path_(path)
{
    std::error_code ec;
    fs::path log_path(path);
    fs::path dir = log_path.parent_path();

    if (!dir.empty() && !fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec) && ec)
            throw ConfigError("Error creating log directory " + dir.string() + ": " + ec.message());
        fs::permissions(dir, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                        ec);
    }

    const bool created = !fs::exists(log_path, ec);

    file_.open(log_path, std::ios::out | std::ios::app);
    if (!file_.is_open())
        throw ConfigError("Error opening log file: " + path);

    if (created)
        fs::permissions(log_path, fs::perms::owner_read | fs::perms::owner_write, ec);
}

Logger::Logger(std::ostream& stream) : out_(&stream) {}

void Logger::log(const std::string& message)
{
    *out_ << "[" << format_timestamp(std::chrono::system_clock::now()) << "] " << message << "\n";
    out_->flush();
}

void Logger::log_json(const std::string& label, const json& value)
{
    log(label + ": " + value.dump(-1, ' ', false, json::error_handler_t::replace));
}

std::string Logger::default_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0')
        home = std::getenv("USERPROFILE");
    if (home == nullptr || home[0] == '\0')
        throw ConfigError("HOME environment variable not set and USERPROFILE not found");

    return (fs::path(home) / ".mcpt" / "logs" / "guard.log").string();
}

std::string Logger::format_timestamp(std::chrono::system_clock::time_point time)
{
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");

    // %z gives +hhmm; RFC3339 wants +hh:mm or Z
    char offset[8] = {0};
    std::strftime(offset, sizeof(offset), "%z", &local);
    std::string zone(offset);
    if (zone == "+0000" || zone.size() != 5)
        ss << "Z";
    else
        ss << zone.substr(0, 3) << ":" << zone.substr(3);

    return ss.str();
}

} // namespace mcpguard
