/**
 * @file process_runner.cpp
 */
#include "deltatest/execution/process_runner.hpp"

#include "deltatest/common/errors.hpp"
#include "deltatest/common/log.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

namespace deltatest
{

namespace
{

/// Owns one file descriptor.
class ScopedFd
{
public:
    ScopedFd() = default;

    explicit ScopedFd(int fd)
        : m_fd(fd)
    {
    }

    ~ScopedFd()
    {
        reset();
    }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const noexcept
    {
        return m_fd;
    }

    bool valid() const noexcept
    {
        return m_fd >= 0;
    }

    void reset(int fd = -1) noexcept
    {
        if (m_fd >= 0)
        {
            ::close(m_fd);
        }
        m_fd = fd;
    }

private:
    int m_fd = -1;
};

/// Reported by the child through the status pipe when it cannot exec.
struct ChildFailure
{
    int stage;  ///< 0: chdir, 1: stdin redirect, 2: exec
    int error;
};

void make_pipe(ScopedFd& read_end, ScopedFd& write_end, const char* what)
{
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0)
    {
        throw InvocationError(InvocationErrorCode::SpawnFailed,
                              std::string("Failed to create ") + what + " pipe: " +
                                  std::strerror(errno));
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
}

[[noreturn]] void child_fail(int status_fd, int stage)
{
    ChildFailure failure{stage, errno};
    ssize_t ignored = ::write(status_fd, &failure, sizeof(failure));
    (void)ignored;
    ::_exit(127);
}

/// Runs in the forked child; never returns.
[[noreturn]] void exec_child(const std::vector<std::string>& argv,
                             const ProcessOptions& options,
                             int stdout_fd,
                             int stderr_fd,
                             int status_fd)
{
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::dup2(stderr_fd, STDERR_FILENO);

    int null_fd = ::open("/dev/null", O_RDONLY);
    if (null_fd < 0 || ::dup2(null_fd, STDIN_FILENO) < 0)
    {
        child_fail(status_fd, 1);
    }
    if (null_fd != STDIN_FILENO)
    {
        ::close(null_fd);
    }

    if (!options.working_directory.empty() && ::chdir(options.working_directory.c_str()) != 0)
    {
        child_fail(status_fd, 0);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv)
    {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    ::execvp(args[0], args.data());
    child_fail(status_fd, 2);
}

/// Read what is available; returns false once the pipe reached EOF.
bool drain(int fd, std::string& sink, const std::function<void(const std::string&)>& on_output)
{
    char buffer[4096];
    for (;;)
    {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0)
        {
            std::string chunk(buffer, static_cast<size_t>(n));
            if (on_output)
            {
                on_output(chunk);
            }
            sink += chunk;
            return true;
        }
        if (n == 0)
        {
            return false;
        }
        if (errno == EINTR)
        {
            continue;
        }
        throw InvocationError(InvocationErrorCode::IoFailed,
                              std::string("Failed to read child output: ") + std::strerror(errno));
    }
}

int wait_child(pid_t pid)
{
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            throw InvocationError(InvocationErrorCode::IoFailed,
                                  std::string("Failed to wait for child: ") + std::strerror(errno));
        }
    }
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status))
    {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options)
{
    if (argv.empty() || argv.front().empty())
    {
        throw InvocationError(InvocationErrorCode::SpawnFailed, "Cannot execute an empty command");
    }

    DELTATEST_LOG_DEBUG("exec", "running: " << format_command_line(argv));
    auto start_time = std::chrono::steady_clock::now();

    ScopedFd out_read, out_write;
    ScopedFd err_read, err_write;
    ScopedFd status_read, status_write;
    make_pipe(out_read, out_write, "stdout");
    if (!options.merge_stderr)
    {
        make_pipe(err_read, err_write, "stderr");
    }
    make_pipe(status_read, status_write, "status");

    pid_t pid = ::fork();
    if (pid < 0)
    {
        throw InvocationError(InvocationErrorCode::SpawnFailed,
                              std::string("Failed to fork process: ") + std::strerror(errno));
    }
    if (pid == 0)
    {
        exec_child(argv, options, out_write.get(),
                   options.merge_stderr ? out_write.get() : err_write.get(), status_write.get());
    }

    // Parent: the child holds the only write ends now.
    out_write.reset();
    err_write.reset();
    status_write.reset();

    ChildFailure failure{};
    ssize_t status_bytes;
    do
    {
        status_bytes = ::read(status_read.get(), &failure, sizeof(failure));
    } while (status_bytes < 0 && errno == EINTR);

    if (status_bytes == static_cast<ssize_t>(sizeof(failure)))
    {
        wait_child(pid);
        std::string reason = std::strerror(failure.error);
        std::string message;
        switch (failure.stage)
        {
        case 0:
            message = "Failed to enter directory '" + options.working_directory.string() +
                      "': " + reason;
            break;
        case 1:
            message = "Failed to redirect stdin for '" + argv.front() + "': " + reason;
            break;
        default:
            message = "Failed to execute '" + argv.front() + "': " + reason;
            break;
        }
        throw InvocationError(InvocationErrorCode::ExecFailed, message);
    }

    ProcessResult result;
    bool out_open = true;
    bool err_open = err_read.valid();
    try
    {
        while (out_open || err_open)
        {
            fd_set read_fds;
            FD_ZERO(&read_fds);
            int max_fd = -1;
            if (out_open)
            {
                FD_SET(out_read.get(), &read_fds);
                max_fd = std::max(max_fd, out_read.get());
            }
            if (err_open)
            {
                FD_SET(err_read.get(), &read_fds);
                max_fd = std::max(max_fd, err_read.get());
            }

            int ready = ::select(max_fd + 1, &read_fds, nullptr, nullptr, nullptr);
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                throw InvocationError(InvocationErrorCode::IoFailed,
                                      std::string("Failed to poll child output: ") +
                                          std::strerror(errno));
            }
            if (out_open && FD_ISSET(out_read.get(), &read_fds))
            {
                out_open = drain(out_read.get(), result.output, options.on_output);
            }
            if (err_open && FD_ISSET(err_read.get(), &read_fds))
            {
                err_open = drain(err_read.get(), result.error_output, options.on_output);
            }
        }
    }
    catch (...)
    {
        out_read.reset();
        err_read.reset();
        wait_child(pid);
        throw;
    }

    result.exit_code = wait_child(pid);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    DELTATEST_LOG_DEBUG("exec", argv.front() << " exited with " << result.exit_code << " after "
                                             << result.duration.count() << "ms");
    return result;
}

std::string format_command_line(const std::vector<std::string>& argv)
{
    std::string line;
    for (const auto& arg : argv)
    {
        if (!line.empty())
        {
            line += ' ';
        }
        bool needs_quotes = arg.empty() || arg.find_first_of(" \t\"'\\$") != std::string::npos;
        if (needs_quotes)
        {
            line += '\'';
            for (char c : arg)
            {
                if (c == '\'')
                {
                    line += "'\\''";
                }
                else
                {
                    line += c;
                }
            }
            line += '\'';
        }
        else
        {
            line += arg;
        }
    }
    return line;
}

} // namespace deltatest
