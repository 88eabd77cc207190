// POSIX process spawning for the wrapped tool server

#include "process.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

namespace mcpguard
{
namespace subprocess
{

namespace
{

std::string errno_text(int error = errno)
{
    return std::strerror(error);
}

// Both ends are close-on-exec; the child dup2()s the ends it needs, which
// clears the flag on the copy
struct PipePair
{
    int read_end = -1;
    int write_end = -1;

    void open(const char* what)
    {
        int fds[2];
        if (::pipe(fds) != 0)
            throw std::runtime_error(std::string("Failed to create ") + what +
                                     " pipe: " + errno_text());
        read_end = fds[0];
        write_end = fds[1];
        for (int fd : fds)
        {
            int flags = ::fcntl(fd, F_GETFD);
            if (flags == -1 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1)
            {
                std::string reason = errno_text();
                close();
                throw std::runtime_error(std::string("Failed to configure ") + what +
                                         " pipe: " + reason);
            }
        }
    }

    void close()
    {
        if (read_end >= 0)
            ::close(read_end);
        if (write_end >= 0)
            ::close(write_end);
        read_end = write_end = -1;
    }

    bool is_open() const
    {
        return read_end >= 0;
    }
};

int exit_code_from_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Runs in the forked child. Only async-signal-safe calls from here on.
[[noreturn]] void exec_child(const char* executable, char* const argv[], PipePair& in,
                             PipePair& out, PipePair& err, int status_fd)
{
    if (in.is_open() && ::dup2(in.read_end, STDIN_FILENO) < 0)
        _exit(127);
    if (out.is_open() && ::dup2(out.write_end, STDOUT_FILENO) < 0)
        _exit(127);
    if (err.is_open() && ::dup2(err.write_end, STDERR_FILENO) < 0)
        _exit(127);

    // The guard ignores SIGPIPE; the wrapped program gets the default back
    std::signal(SIGPIPE, SIG_DFL);

    ::execvp(executable, argv);

    int exec_errno = errno;
    ssize_t ignored = ::write(status_fd, &exec_errno, sizeof(exec_errno));
    (void)ignored;
    _exit(127);
}

} // namespace

// ============================================================================
// Pipes
// ============================================================================

PipeEnd::~PipeEnd()
{
    close();
}

PipeEnd::PipeEnd(PipeEnd&& other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

PipeEnd& PipeEnd::operator=(PipeEnd&& other) noexcept
{
    if (this != &other)
    {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void PipeEnd::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    ssize_t n;
    do
    {
        n = ::read(fd(), buffer, size);
    } while (n < 0 && errno == EINTR);

    if (n < 0)
        throw std::runtime_error("Read failed: " + errno_text());
    return static_cast<size_t>(n);
}

std::string ReadPipe::read_line(size_t max_size)
{
    std::string line;
    char c;
    while (line.size() < max_size && read(&c, 1) == 1)
    {
        line.push_back(c);
        if (c == '\n')
            break;
    }
    return line;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    fd_set readable;
    FD_ZERO(&readable);
    FD_SET(fd(), &readable);

    timeval timeout{};
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int ready = ::select(fd() + 1, &readable, nullptr, nullptr, &timeout);
    if (ready < 0)
    {
        if (errno == EINTR)
            return false;
        throw std::runtime_error("select failed: " + errno_text());
    }
    return ready > 0;
}

size_t WritePipe::write(const char* data, size_t size)
{
    if (!is_open())
        throw std::runtime_error("Pipe is not open");

    size_t written = 0;
    while (written < size)
    {
        ssize_t n = ::write(fd(), data + written, size - written);
        if (n >= 0)
        {
            written += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR)
            continue;
        if (errno == EPIPE)
            throw std::runtime_error("Broken pipe (process closed stdin)");
        throw std::runtime_error("Write failed: " + errno_text());
    }
    return written;
}

size_t WritePipe::write(const std::string& data)
{
    return write(data.data(), data.size());
}

// ============================================================================
// Process
// ============================================================================

Process::~Process()
{
    if (!running_)
        return;
    try
    {
        kill();
        wait();
    }
    catch (const std::exception&)
    {
        // Already reaped
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const SpawnOptions& options)
{
    if (running_)
        throw std::runtime_error("Process already running (pid " + std::to_string(pid_) + ")");

    PipePair in, out, err, status;
    try
    {
        if (options.pipe_stdin)
            in.open("stdin");
        if (options.pipe_stdout)
            out.open("stdout");
        if (options.pipe_stderr)
            err.open("stderr");
        // Carries errno of a failed exec; closes unread on success
        status.open("exec status");
    }
    catch (const std::runtime_error&)
    {
        in.close();
        out.close();
        err.close();
        status.close();
        throw;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid == 0)
        exec_child(executable.c_str(), argv.data(), in, out, err, status.write_end);

    if (pid < 0)
    {
        std::string reason = errno_text();
        in.close();
        out.close();
        err.close();
        status.close();
        throw std::runtime_error("Failed to fork process: " + reason);
    }

    ::close(status.write_end);
    status.write_end = -1;

    int exec_errno = 0;
    ssize_t n;
    do
    {
        n = ::read(status.read_end, &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    status.close();

    if (n == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        int wait_status;
        ::waitpid(pid, &wait_status, 0);
        in.close();
        out.close();
        err.close();
        throw std::runtime_error("Failed to execute '" + executable + "': " +
                                 errno_text(exec_errno));
    }

    // Keep the parent's ends, drop the child's
    if (in.is_open())
    {
        ::close(in.read_end);
        stdin_ = WritePipe(in.write_end);
    }
    if (out.is_open())
    {
        ::close(out.write_end);
        stdout_ = ReadPipe(out.read_end);
    }
    if (err.is_open())
    {
        ::close(err.write_end);
        stderr_ = ReadPipe(err.read_end);
    }

    pid_ = pid;
    running_ = true;
    exit_code_ = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_.is_open())
        throw std::runtime_error("stdin not piped");
    return stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_.is_open())
        throw std::runtime_error("stdout not piped");
    return stdout_;
}

ReadPipe& Process::stderr_pipe()
{
    if (!stderr_.is_open())
        throw std::runtime_error("stderr not piped");
    return stderr_;
}

bool Process::is_running() const
{
    if (!running_)
        return false;
    // Signal 0 probes for existence; an unreaped zombie still counts
    return ::kill(pid_, 0) == 0 || errno != ESRCH;
}

std::optional<int> Process::reap(bool block)
{
    if (pid_ == 0)
        return -1;
    if (!running_)
        return exit_code_;

    int status;
    pid_t result;
    do
    {
        result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0)
        return std::nullopt;
    if (result != pid_)
        throw std::runtime_error("waitpid failed: " + errno_text());

    exit_code_ = exit_code_from_status(status);
    running_ = false;
    return exit_code_;
}

std::optional<int> Process::try_wait()
{
    return reap(false);
}

int Process::wait()
{
    return *reap(true);
}

void Process::send_signal(int signal_number)
{
    if (running_ && pid_ > 0)
        ::kill(pid_, signal_number);
}

void Process::terminate()
{
    send_signal(SIGTERM);
}

void Process::kill()
{
    send_signal(SIGKILL);
}

// ============================================================================
// PATH lookup
// ============================================================================

namespace
{
bool is_executable_file(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}
} // namespace

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    if (name.find('/') != std::string::npos)
    {
        if (!is_executable_file(name))
            return std::nullopt;
        return fs::path(name).is_absolute() ? name : fs::absolute(name).string();
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/bin:/bin";

    size_t start = 0;
    while (start <= search.size())
    {
        size_t end = search.find(':', start);
        if (end == std::string::npos)
            end = search.size();

        // An empty PATH entry means the current directory
        fs::path dir = end > start ? fs::path(search.substr(start, end - start)) : fs::path(".");
        fs::path candidate = dir / name;
        if (is_executable_file(candidate))
            return fs::absolute(candidate).string();

        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace mcpguard
