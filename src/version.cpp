#include <mcpguard/version.hpp>
#include <sstream>

namespace mcpguard
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

} // namespace mcpguard
