#ifndef MCPGUARD_INTERNAL_STDIO_TRANSPORT_HPP
#define MCPGUARD_INTERNAL_STDIO_TRANSPORT_HPP

#include "../message_reader.hpp"

#include <mcpguard/transport.hpp>

namespace mcpguard
{
namespace internal
{

/**
 * Upstream side of the proxy: JSON values read from one file descriptor and
 * written to another (stdin/stdout in production, pipes in tests).
 * The descriptors are borrowed and never closed.
 */
class StdioTransport : public Transport
{
  public:
    StdioTransport(int input_fd, int output_fd, size_t max_message_size);

    void connect() override;
    std::optional<json> read_message() override;
    void write_message(const json& message) override;
    void close() override;
    bool is_running() const override;

  private:
    size_t read_some(char* buffer, size_t size);

    int input_fd_;
    int output_fd_;
    bool eof_ = false;
    bool closed_ = false;
    protocol::MessageReader reader_;
};

} // namespace internal
} // namespace mcpguard

#endif // MCPGUARD_INTERNAL_STDIO_TRANSPORT_HPP
