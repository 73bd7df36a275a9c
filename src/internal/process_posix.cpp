// POSIX implementation of subprocess management

#include "process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace weathermcp::process
{

struct PipeHandle
{
    int fd = -1;

    ~PipeHandle()
    {
        if (fd >= 0)
            ::close(fd);
    }
};

namespace
{

std::string errno_message(int err = errno)
{
    return std::strerror(err);
}

void set_cloexec(int fd)
{
    int flags = fcntl(fd, F_GETFD);
    if (flags >= 0)
        fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

/// pipe(2) pair closed on scope exit unless released
class PipePair
{
  public:
    explicit PipePair(const char* what)
    {
        if (::pipe(fds_) != 0)
            throw ProcessError(std::string("Failed to create ") + what +
                               " pipe: " + errno_message());
        set_cloexec(fds_[0]);
        set_cloexec(fds_[1]);
    }
    ~PipePair()
    {
        close_read();
        close_write();
    }
    PipePair(const PipePair&) = delete;
    PipePair& operator=(const PipePair&) = delete;

    int read_end() const
    {
        return fds_[0];
    }
    int write_end() const
    {
        return fds_[1];
    }
    int release_read()
    {
        int fd = fds_[0];
        fds_[0] = -1;
        return fd;
    }
    int release_write()
    {
        int fd = fds_[1];
        fds_[1] = -1;
        return fd;
    }
    void close_read()
    {
        if (fds_[0] >= 0)
            ::close(fds_[0]);
        fds_[0] = -1;
    }
    void close_write()
    {
        if (fds_[1] >= 0)
            ::close(fds_[1]);
        fds_[1] = -1;
    }

  private:
    int fds_[2] = {-1, -1};
};

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

// =============================================================================
// ReadPipe
// =============================================================================

ReadPipe::ReadPipe() : handle_(std::make_unique<PipeHandle>()) {}

ReadPipe::~ReadPipe()
{
    close();
}

ReadPipe::ReadPipe(ReadPipe&&) noexcept = default;
ReadPipe& ReadPipe::operator=(ReadPipe&&) noexcept = default;

size_t ReadPipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    for (;;)
    {
        ssize_t n = ::read(handle_->fd, buffer, size);
        if (n >= 0)
            return static_cast<size_t>(n);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ProcessError("Read failed: " + errno_message());
    }
}

size_t ReadPipe::fill(size_t max_size)
{
    if (buffer_.size() >= max_size)
        throw ProcessError("Line exceeds " + std::to_string(max_size) + " bytes");

    char chunk[4096];
    size_t n = read(chunk, sizeof(chunk));
    if (n == 0)
        eof_ = true;
    buffer_.append(chunk, n);
    return n;
}

bool ReadPipe::has_line() const
{
    return eof_ || buffer_.find('\n') != std::string::npos;
}

std::optional<std::string> ReadPipe::read_line(size_t max_size)
{
    while (!has_line())
        fill(max_size);

    auto nl = buffer_.find('\n');
    if (nl == std::string::npos)
    {
        // End of stream: hand out what is left, then nothing
        if (buffer_.empty())
            return std::nullopt;
        std::string rest;
        rest.swap(buffer_);
        return rest;
    }

    std::string line = buffer_.substr(0, nl);
    buffer_.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

bool ReadPipe::has_data(int timeout_ms)
{
    if (has_line())
        return true;
    if (!is_open())
        return false;

    fd_set read_fds;
    FD_ZERO(&read_fds);
    FD_SET(handle_->fd, &read_fds);

    struct timeval timeout;
    timeout.tv_sec = timeout_ms / 1000;
    timeout.tv_usec = (timeout_ms % 1000) * 1000;

    int result = select(handle_->fd + 1, &read_fds, nullptr, nullptr,
                        timeout_ms < 0 ? nullptr : &timeout);
    if (result < 0)
    {
        if (errno == EINTR)
            throw ProcessError("Interrupted while waiting for the child process");
        throw ProcessError("select failed: " + errno_message());
    }

    return result > 0 && FD_ISSET(handle_->fd, &read_fds);
}

void ReadPipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool ReadPipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// WritePipe
// =============================================================================

WritePipe::WritePipe() : handle_(std::make_unique<PipeHandle>()) {}

WritePipe::~WritePipe()
{
    close();
}

WritePipe::WritePipe(WritePipe&&) noexcept = default;
WritePipe& WritePipe::operator=(WritePipe&&) noexcept = default;

size_t WritePipe::write(const std::string& data)
{
    if (!is_open())
        throw ProcessError("Pipe is not open");

    size_t total = 0;
    while (total < data.size())
    {
        ssize_t n = ::write(handle_->fd, data.data() + total, data.size() - total);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
                throw ProcessError("Broken pipe (process closed stdin)");
            throw ProcessError("Write failed: " + errno_message());
        }
        total += static_cast<size_t>(n);
    }
    return total;
}

void WritePipe::close()
{
    if (handle_ && handle_->fd >= 0)
    {
        ::close(handle_->fd);
        handle_->fd = -1;
    }
}

bool WritePipe::is_open() const
{
    return handle_ && handle_->fd >= 0;
}

// =============================================================================
// Process
// =============================================================================

Process::Process() = default;

Process::~Process()
{
    if (running_)
        shutdown(500);
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    if (running_)
        throw ProcessError("Process already running");

    // A child that exits early must surface as EPIPE on write, not kill us
    static const bool sigpipe_ignored = []
    {
        std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    (void)sigpipe_ignored;

    PipePair in("stdin");
    PipePair out("stdout");
    PipePair exec_report("exec status");

    int stderr_fd = -1;
    if (options.stderr_file)
    {
        stderr_fd = ::open(options.stderr_file->c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (stderr_fd < 0)
            throw ProcessError("Failed to open stderr log '" + *options.stderr_file +
                               "': " + errno_message());
        set_cloexec(stderr_fd);
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        if (stderr_fd >= 0)
            ::close(stderr_fd);
        throw ProcessError("Failed to fork process: " + errno_message(err));
    }

    if (pid == 0)
    {
        // Child: only async-signal-safe calls until exec
        auto fail = [&]()
        {
            int err = errno;
            (void)::write(exec_report.write_end(), &err, sizeof(err));
            _exit(127);
        };

        if (dup2(in.read_end(), STDIN_FILENO) < 0)
            fail();
        if (dup2(out.write_end(), STDOUT_FILENO) < 0)
            fail();
        if (stderr_fd >= 0 && dup2(stderr_fd, STDERR_FILENO) < 0)
            fail();
        ::signal(SIGPIPE, SIG_DFL);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args)
            argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        execvp(executable.c_str(), argv.data());
        fail();
    }

    // Parent
    if (stderr_fd >= 0)
        ::close(stderr_fd);
    exec_report.close_write();
    in.close_read();
    out.close_write();

    int child_errno = 0;
    ssize_t report_bytes;
    do
    {
        report_bytes = ::read(exec_report.read_end(), &child_errno, sizeof(child_errno));
    } while (report_bytes < 0 && errno == EINTR);

    if (report_bytes > 0)
    {
        waitpid(pid, nullptr, 0);
        throw ProcessError("Failed to execute '" + executable + "': " + errno_message(child_errno));
    }

    stdin_.handle_->fd = in.release_write();
    stdout_.handle_->fd = out.release_read();
    stdout_.buffer_.clear();
    stdout_.eof_ = false;

    pid_ = pid;
    running_ = true;
    exit_code_ = -1;
}

WritePipe& Process::stdin_pipe()
{
    if (!stdin_.is_open())
        throw ProcessError("stdin pipe not available");
    return stdin_;
}

ReadPipe& Process::stdout_pipe()
{
    if (!stdout_.is_open())
        throw ProcessError("stdout pipe not available");
    return stdout_;
}

bool Process::is_running()
{
    return running_ && !try_wait().has_value();
}

std::optional<int> Process::try_wait()
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == 0)
        return std::nullopt;
    if (result == pid_)
        exit_code_ = decode_status(status);
    // result < 0: the child is gone (ECHILD); keep the unknown exit code
    running_ = false;
    return exit_code_;
}

int Process::wait()
{
    if (!running_)
        return exit_code_;

    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result == pid_)
        exit_code_ = decode_status(status);
    running_ = false;
    return exit_code_;
}

int Process::shutdown(int grace_ms)
{
    stdin_.close();

    auto wait_for_exit = [this](int ms)
    {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (try_wait().has_value())
                return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return try_wait().has_value();
    };

    if (running_ && !wait_for_exit(grace_ms))
    {
        terminate();
        if (!wait_for_exit(500))
        {
            kill();
            wait();
        }
    }

    stdout_.close();
    return exit_code_;
}

void Process::terminate()
{
    if (pid_ > 0 && running_)
        ::kill(pid_, SIGTERM);
}

void Process::kill()
{
    if (pid_ > 0 && running_)
        ::kill(pid_, SIGKILL);
}

int Process::pid() const
{
    return pid_;
}

} // namespace weathermcp::process
