#ifndef MCPGUARD_INTERNAL_CHILD_TRANSPORT_HPP
#define MCPGUARD_INTERNAL_CHILD_TRANSPORT_HPP

#include "../message_reader.hpp"
#include "../subprocess/process.hpp"

#include <atomic>
#include <mcpguard/transport.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace mcpguard
{
namespace internal
{

/**
 * Supervises the wrapped tool-server process.
 *
 * connect() resolves the executable on PATH, then spawns it with its
 * stdin, stdout and stderr on pipes. A single background thread copies the
 * child's stderr to diagnostic_fd as raw bytes until the pipe closes. close()
 * kills the child outright, reaps it and joins that thread.
 */
class ChildTransport : public Transport
{
  public:
    ChildTransport(const GuardOptions& options, int diagnostic_fd);
    ~ChildTransport() override;

    // Transport interface
    void connect() override;
    std::optional<json> read_message() override;
    void write_message(const json& message) override;
    void close() override;
    bool is_running() const override;
    std::optional<int> exit_code() override;
    long get_pid() const override;

  private:
    // Resolve command[0] on PATH
    std::string resolve_executable() const;

    // Background stderr pump
    void stderr_pump_loop();
    void start_stderr_pump();
    void stop_stderr_pump();

    std::vector<std::string> command_;
    int diagnostic_fd_;

    std::unique_ptr<subprocess::Process> process_;
    protocol::MessageReader reader_;
    std::optional<int> exit_code_;

    std::thread stderr_pump_thread_;
    std::atomic<bool> stderr_running_{false};
};

} // namespace internal
} // namespace mcpguard

#endif // MCPGUARD_INTERNAL_CHILD_TRANSPORT_HPP
