#ifndef MCPGUARD_SUBPROCESS_PROCESS_HPP
#define MCPGUARD_SUBPROCESS_PROCESS_HPP

#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace mcpguard
{
namespace subprocess
{

/**
 * Owned end of a pipe. Closed on destruction; move-only.
 */
class PipeEnd
{
  public:
    PipeEnd() = default;
    explicit PipeEnd(int fd) : fd_(fd) {}
    ~PipeEnd();

    PipeEnd(const PipeEnd&) = delete;
    PipeEnd& operator=(const PipeEnd&) = delete;
    PipeEnd(PipeEnd&& other) noexcept;
    PipeEnd& operator=(PipeEnd&& other) noexcept;

    int fd() const
    {
        return fd_;
    }

    bool is_open() const
    {
        return fd_ >= 0;
    }

    void close();

  private:
    int fd_ = -1;
};

// Parent's end of the child's stdout or stderr
class ReadPipe : public PipeEnd
{
  public:
    using PipeEnd::PipeEnd;

    // Up to size bytes; 0 means EOF. Throws std::runtime_error on failure.
    size_t read(char* buffer, size_t size);

    // Bytes up to and including the next newline, or until EOF or max_size
    std::string read_line(size_t max_size = 4096);

    // Wait up to timeout_ms for data or EOF
    bool has_data(int timeout_ms = 0);
};

// Parent's end of the child's stdin
class WritePipe : public PipeEnd
{
  public:
    using PipeEnd::PipeEnd;

    // Writes everything or throws std::runtime_error ("Broken pipe ..." once
    // the child has closed its stdin)
    size_t write(const char* data, size_t size);
    size_t write(const std::string& data);
};

struct SpawnOptions
{
    bool pipe_stdin = true;
    bool pipe_stdout = true;
    bool pipe_stderr = false;
};

/**
 * A spawned child process.
 *
 * The child inherits the environment and any standard stream that is not
 * piped. A child still running when the Process is destroyed is killed and
 * reaped. Exit codes are the exit status, or 128 + signal number for a child
 * killed by a signal.
 */
class Process
{
  public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /**
     * fork and execvp executable with args.
     * @throws std::runtime_error when a pipe, the fork or the exec fails
     */
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const SpawnOptions& options = {});

    // Throw std::runtime_error when the stream was not piped
    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();
    ReadPipe& stderr_pipe();

    bool is_running() const;

    /// Exit code if the child has exited, without blocking
    std::optional<int> try_wait();

    /// Block until the child exits
    int wait();

    void terminate(); // SIGTERM
    void kill();      // SIGKILL

    int pid() const
    {
        return static_cast<int>(pid_);
    }

  private:
    std::optional<int> reap(bool block);
    void send_signal(int signal_number);

    pid_t pid_ = 0;
    bool running_ = false;
    int exit_code_ = -1;

    WritePipe stdin_;
    ReadPipe stdout_;
    ReadPipe stderr_;
};

/// Resolve name the way execvp would: paths containing '/' as given, bare
/// names on PATH. Only existing executable files are returned.
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace mcpguard

#endif // MCPGUARD_SUBPROCESS_PROCESS_HPP
