#ifndef MCPGUARD_ERRORS_HPP
#define MCPGUARD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace mcpguard
{

// Base exception
class GuardError : public std::runtime_error
{
  public:
    explicit GuardError(const std::string& message) : std::runtime_error(message) {}
};

// Unusable configuration (no state directory, bad arguments, unwritable log)
class ConfigError : public GuardError
{
  public:
    explicit ConfigError(const std::string& message) : GuardError(message) {}
};

// Child process could not be started or kept alive
class ChildUnavailableError : public GuardError
{
  public:
    explicit ChildUnavailableError(const std::string& message, int exit_code = -1)
        : GuardError(message), exit_code_(exit_code)
    {
    }

    // Exit code of the child when it is known, -1 otherwise
    int exit_code() const
    {
        return exit_code_;
    }

  private:
    int exit_code_;
};

// Malformed message on either side of the proxy
class ProtocolDecodeError : public GuardError
{
  public:
    explicit ProtocolDecodeError(const std::string& message) : GuardError(message) {}
};

// Request targets an entity the policy filters out
class PolicyViolation : public GuardError
{
  public:
    PolicyViolation(const std::string& entity_kind, const std::string& name)
        : GuardError(entity_kind + " not found: " + name), entity_kind_(entity_kind), name_(name)
    {
    }

    const std::string& entity_kind() const
    {
        return entity_kind_;
    }

    const std::string& name() const
    {
        return name_;
    }

  private:
    std::string entity_kind_;
    std::string name_;
};

} // namespace mcpguard

#endif // MCPGUARD_ERRORS_HPP
