#ifndef MCPGUARD_HPP
#define MCPGUARD_HPP

// Main header that includes everything

#include <mcpguard/errors.hpp>
#include <mcpguard/filter.hpp>
#include <mcpguard/gate.hpp>
#include <mcpguard/guard_proxy.hpp>
#include <mcpguard/logger.hpp>
#include <mcpguard/options.hpp>
#include <mcpguard/policy.hpp>
#include <mcpguard/transport.hpp>
#include <mcpguard/types.hpp>
#include <mcpguard/version.hpp>

#endif // MCPGUARD_HPP
