#include "child_transport.hpp"

#include <cerrno>
#include <iostream>
#include <mcpguard/errors.hpp>
#include <unistd.h>

namespace mcpguard
{
namespace internal
{

namespace
{
// Copy a chunk to the diagnostic descriptor; a failing sink ends the pump
bool write_all(int fd, const char* data, size_t size)
{
    size_t total = 0;
    while (total < size)
    {
        ssize_t n = ::write(fd, data + total, size - total);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            return false;
        }
        total += static_cast<size_t>(n);
    }
    return true;
}
} // namespace

ChildTransport::ChildTransport(const GuardOptions& options, int diagnostic_fd)
    : command_(options.command), diagnostic_fd_(diagnostic_fd),
      reader_(options.max_message_size)
{
}

ChildTransport::~ChildTransport()
{
    close();
}

std::string ChildTransport::resolve_executable() const
{
    if (command_.empty())
        throw ChildUnavailableError("No command to execute");

    auto resolved = subprocess::find_executable(command_[0]);
    if (!resolved)
        throw ChildUnavailableError("Executable not found: " + command_[0]);

    return *resolved;
}

void ChildTransport::connect()
{
    if (process_ && process_->is_running())
        return; // Already connected

    std::string executable = resolve_executable();
    std::vector<std::string> args(command_.begin() + 1, command_.end());

    subprocess::SpawnOptions spawn_options;
    spawn_options.pipe_stderr = true;

    auto process = std::make_unique<subprocess::Process>();
    try
    {
        process->spawn(executable, args, spawn_options);
    }
    catch (const std::runtime_error& e)
    {
        throw ChildUnavailableError(std::string("Error starting child process: ") + e.what());
    }

    process_ = std::move(process);
    exit_code_.reset();
    reader_.clear_buffer();

    start_stderr_pump();
}

std::optional<json> ChildTransport::read_message()
{
    if (!process_)
        throw ChildUnavailableError("Child process is not running");

    auto& pipe = process_->stdout_pipe();
    try
    {
        return reader_.read_message([&pipe](char* buffer, size_t size)
                                    { return pipe.read(buffer, size); });
    }
    catch (const ProtocolDecodeError&)
    {
        throw;
    }
    catch (const std::runtime_error& e)
    {
        throw ChildUnavailableError(std::string("Error reading from child process: ") + e.what());
    }
}

void ChildTransport::write_message(const json& message)
{
    if (!process_)
        throw ChildUnavailableError("Child process is not running");

    std::string data = message.dump(-1, ' ', false, json::error_handler_t::replace);
    data.push_back('\n');

    try
    {
        process_->stdin_pipe().write(data);
    }
    catch (const std::runtime_error& e)
    {
        throw ChildUnavailableError(std::string("Error writing to child process: ") + e.what());
    }
}

void ChildTransport::close()
{
    if (!process_)
    {
        stop_stderr_pump();
        return;
    }

    // No graceful shutdown: the wrapped server is killed outright
    process_->kill();
    try
    {
        exit_code_ = process_->wait();
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "Warning: failed to reap child process: " << e.what() << std::endl;
    }

    // Killing the child closes the write end of its stderr, so the pump sees EOF
    stop_stderr_pump();

    process_.reset();
}

bool ChildTransport::is_running() const
{
    return process_ && process_->is_running();
}

std::optional<int> ChildTransport::exit_code()
{
    if (exit_code_)
        return exit_code_;
    if (!process_)
        return std::nullopt;

    try
    {
        exit_code_ = process_->try_wait();
    }
    catch (const std::runtime_error&)
    {
        return std::nullopt;
    }
    return exit_code_;
}

long ChildTransport::get_pid() const
{
    if (process_)
        return static_cast<long>(process_->pid());
    return 0;
}

void ChildTransport::stderr_pump_loop()
{
    try
    {
        auto& pipe = process_->stderr_pipe();
        char buffer[4096];
        while (stderr_running_)
        {
            // Poll so stop_stderr_pump() is noticed even if the pipe stays open
            if (!pipe.has_data(100))
                continue;

            size_t n = pipe.read(buffer, sizeof(buffer));
            if (n == 0)
                break; // Child closed stderr

            if (!write_all(diagnostic_fd_, buffer, n))
                break;
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Warning: child stderr passthrough stopped: " << e.what() << std::endl;
    }
}

void ChildTransport::start_stderr_pump()
{
    stderr_running_ = true;
    stderr_pump_thread_ = std::thread(&ChildTransport::stderr_pump_loop, this);
}

void ChildTransport::stop_stderr_pump()
{
    stderr_running_ = false;
    if (stderr_pump_thread_.joinable())
        stderr_pump_thread_.join();
}

} // namespace internal

std::unique_ptr<Transport> create_child_transport(const GuardOptions& options, int diagnostic_fd)
{
    return std::make_unique<internal::ChildTransport>(options, diagnostic_fd);
}

} // namespace mcpguard
