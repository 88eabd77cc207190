#ifndef MCPGUARD_TRANSPORT_HPP
#define MCPGUARD_TRANSPORT_HPP

#include <mcpguard/options.hpp>
#include <mcpguard/types.hpp>
#include <memory>
#include <optional>
#include <unistd.h>

namespace mcpguard
{

/**
 * Message stream on one side of the proxy.
 *
 * Both sides carry back-to-back JSON values. Implementations:
 * - StdioTransport: the proxy's own stdin/stdout (upstream client)
 * - ChildTransport: pipes to the wrapped tool-server process
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Prepare for communication. For the child transport this spawns the
     * process.
     * @throws ChildUnavailableError when the child cannot be started
     */
    virtual void connect() = 0;

    /**
     * Block until one complete message is read.
     * @return std::nullopt on a clean end of stream
     * @throws ProtocolDecodeError when the bytes are not valid JSON
     */
    virtual std::optional<json> read_message() = 0;

    /**
     * Write one message followed by a newline.
     */
    virtual void write_message(const json& message) = 0;

    /**
     * Release the stream. For the child transport this kills the process.
     */
    virtual void close() = 0;

    virtual bool is_running() const = 0;

    /**
     * Exit code of the remote process once it has exited.
     */
    virtual std::optional<int> exit_code()
    {
        return std::nullopt;
    }

    /**
     * Process ID for subprocess transports, 0 otherwise.
     */
    virtual long get_pid() const
    {
        return 0;
    }
};

// Factory functions for creating transports
std::unique_ptr<Transport> create_stdio_transport(int input_fd = STDIN_FILENO,
                                                  int output_fd = STDOUT_FILENO,
                                                  size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);
std::unique_ptr<Transport> create_child_transport(const GuardOptions& options,
                                                  int diagnostic_fd = STDERR_FILENO);

} // namespace mcpguard

#endif // MCPGUARD_TRANSPORT_HPP
