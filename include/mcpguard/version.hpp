#ifndef MCPGUARD_VERSION_HPP
#define MCPGUARD_VERSION_HPP

#include <string>

namespace mcpguard
{

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

std::string version_string();

} // namespace mcpguard

#endif // MCPGUARD_VERSION_HPP
