// Subprocess management behind client::StdioTransport (POSIX)

#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace weathermcp::process
{

struct PipeHandle;

/// Exception thrown when process operations fail
class ProcessError : public std::runtime_error
{
  public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// Parent's end of the child's stdout
class ReadPipe
{
  public:
    ReadPipe();
    ~ReadPipe();

    ReadPipe(const ReadPipe&) = delete;
    ReadPipe& operator=(const ReadPipe&) = delete;
    ReadPipe(ReadPipe&&) noexcept;
    ReadPipe& operator=(ReadPipe&&) noexcept;

    /// @return Number of bytes read, 0 on EOF
    size_t read(char* buffer, size_t size);

    /// Next line without its terminator; std::nullopt on EOF before any byte.
    /// Bytes read past the newline are kept for the next call.
    std::optional<std::string> read_line(size_t max_size = 1 << 20);

    /// Wait up to timeout_ms for readable data. A complete buffered line (or
    /// end of stream) counts; a partial line does not.
    /// A negative timeout waits indefinitely.
    bool has_data(int timeout_ms = 0);

    /// One blocking read into the line buffer; returns 0 at end of stream.
    size_t fill(size_t max_size = 1 << 20);

    /// True when read_line() can return without touching the pipe
    bool has_line() const;

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
    std::string buffer_;
    bool eof_{false};
};

/// Parent's end of the child's stdin
class WritePipe
{
  public:
    WritePipe();
    ~WritePipe();

    WritePipe(const WritePipe&) = delete;
    WritePipe& operator=(const WritePipe&) = delete;
    WritePipe(WritePipe&&) noexcept;
    WritePipe& operator=(WritePipe&&) noexcept;

    /// Writes everything or throws; EPIPE becomes "Broken pipe".
    size_t write(const std::string& data);

    void close();
    bool is_open() const;

  private:
    friend class Process;
    std::unique_ptr<PipeHandle> handle_;
};

struct ProcessOptions
{
    /// Append the child's stderr to this file instead of inheriting ours
    std::optional<std::string> stderr_file;
};

/// Child process with piped stdin/stdout. The destructor closes both pipes,
/// gives the child a short grace period, then terminates and reaps it.
class Process
{
  public:
    Process();
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Throws ProcessError when the pipes cannot be created or exec fails.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    WritePipe& stdin_pipe();
    ReadPipe& stdout_pipe();

    bool is_running();

    /// Exit code if the child has exited, std::nullopt otherwise
    std::optional<int> try_wait();

    /// Blocking wait; returns the exit code (128 + signal when killed)
    int wait();

    /// Close stdin and wait up to grace_ms for the child to exit on its own,
    /// then SIGTERM, then SIGKILL. Returns the exit code.
    int shutdown(int grace_ms = 2000);

    void terminate();
    void kill();

    int pid() const;

  private:
    int pid_ = 0;
    bool running_ = false;
    int exit_code_ = -1;
    WritePipe stdin_;
    ReadPipe stdout_;
};

} // namespace weathermcp::process
