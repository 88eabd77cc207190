#include "stdio_transport.hpp"

#include <cerrno>
#include <cstring>
#include <mcpguard/errors.hpp>
#include <unistd.h>

namespace mcpguard
{
namespace internal
{

StdioTransport::StdioTransport(int input_fd, int output_fd, size_t max_message_size)
    : input_fd_(input_fd), output_fd_(output_fd), reader_(max_message_size)
{
}

void StdioTransport::connect()
{
    // Standard streams are open from the start
}

size_t StdioTransport::read_some(char* buffer, size_t size)
{
    while (true)
    {
        ssize_t n = ::read(input_fd_, buffer, size);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno == EINTR)
            continue;
        throw GuardError(std::string("Failed to read client input: ") + std::strerror(errno));
    }
}

std::optional<json> StdioTransport::read_message()
{
    if (closed_ || eof_)
        return std::nullopt;

    auto message = reader_.read_message([this](char* buffer, size_t size)
                                        { return read_some(buffer, size); });
    if (!message)
        eof_ = true;
    return message;
}

void StdioTransport::write_message(const json& message)
{
    if (closed_)
        throw GuardError("Client stream is closed");

    std::string data = message.dump(-1, ' ', false, json::error_handler_t::replace);
    data.push_back('\n');

    size_t total = 0;
    while (total < data.size())
    {
        ssize_t n = ::write(output_fd_, data.data() + total, data.size() - total);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            throw GuardError(std::string("Failed to write client output: ") + std::strerror(errno));
        }
        total += static_cast<size_t>(n);
    }
}

void StdioTransport::close()
{
    closed_ = true;
}

bool StdioTransport::is_running() const
{
    return !closed_ && !eof_;
}

} // namespace internal

std::unique_ptr<Transport> create_stdio_transport(int input_fd, int output_fd,
                                                  size_t max_message_size)
{
    return std::make_unique<internal::StdioTransport>(input_fd, output_fd, max_message_size);
}

} // namespace mcpguard
