#include "process/process_supervisor.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

extern char** environ;

namespace toolwire::process {

using core::errors::ErrorCategory;
using core::errors::ToolwireError;

namespace {

constexpr std::size_t kStderrTailBytes = 4096;
constexpr auto kExitPollInterval = std::chrono::milliseconds(10);
constexpr auto kStdinCloseGrace = std::chrono::milliseconds(200);

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_fd(int& fd) {
    if (fd >= 0) {
        static_cast<void>(close(fd));
        fd = -1;
    }
}

struct PipePair {
    int fds[2] = {-1, -1};

    bool open() { return pipe2(fds, O_CLOEXEC) == 0; }
    int& read_end() { return fds[0]; }
    int& write_end() { return fds[1]; }
    void close_both() {
        close_fd(fds[0]);
        close_fd(fds[1]);
    }
};

// Built before fork(): the child must not allocate.
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> entries;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string value(*entry);
        const auto eq = value.find('=');
        const std::string key = eq == std::string::npos ? value : value.substr(0, eq);
        if (overrides.find(key) == overrides.end()) {
            entries.push_back(value);
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& storage) {
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& item : storage) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

ToolwireError launch_error(const ServerSpec& spec, const std::string& reason) {
    return ToolwireError{ErrorCategory::Launch,
                         "Failed to launch tool server '" + spec.name + "': " + reason,
                         "launch_failed",
                         "Check that '" + spec.command +
                             "' exists, is executable, and that its working directory exists."};
}

}  // namespace

std::string to_string(const ProcessState state) {
    switch (state) {
        case ProcessState::Starting:
            return "starting";
        case ProcessState::Ready:
            return "ready";
        case ProcessState::Degraded:
            return "degraded";
        case ProcessState::Terminated:
            return "terminated";
        default:
            return "unknown";
    }
}

ToolServerProcess::ToolServerProcess(std::string server_name, const pid_t pid,
                                     const int stdin_fd, const int stdout_fd,
                                     const int stderr_fd)
    : server_name_(std::move(server_name)),
      pid_(pid),
      stdin_writer_(stdin_fd),
      stdout_fd_(stdout_fd),
      stderr_fd_(stderr_fd) {}

ToolServerProcess::~ToolServerProcess() {
    terminate();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

ProcessState ToolServerProcess::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ToolServerProcess::mark_ready() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ProcessState::Starting) {
        set_state_locked(ProcessState::Ready, "spawned as pid " + std::to_string(pid_));
    }
}

void ToolServerProcess::mark_degraded(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == ProcessState::Ready) {
        set_state_locked(ProcessState::Degraded, reason);
    }
}

void ToolServerProcess::set_state_locked(const ProcessState next, const std::string& reason) {
    if (state_ == next) {
        return;
    }
    TOOLWIRE_LOG_INFO("ToolServerProcess: " + server_name_ + " transition " +
                      to_string(state_) + " -> " + to_string(next) + " (" + reason + ")");
    state_ = next;
}

bool ToolServerProcess::poll_exit_locked() {
    if (exited_) {
        return true;
    }
    int status = 0;
    const pid_t waited = waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        exited_ = true;
        wait_status_ = status;
    } else if (waited < 0 && errno == ECHILD) {
        exited_ = true;
    }
    if (exited_) {
        set_state_locked(ProcessState::Terminated, exit_description_locked());
    }
    return exited_;
}

bool ToolServerProcess::wait_exit_locked(const std::chrono::milliseconds wait) {
    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (!poll_exit_locked()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(kExitPollInterval);
    }
    return true;
}

bool ToolServerProcess::is_alive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !poll_exit_locked();
}

bool ToolServerProcess::reap(const std::chrono::milliseconds wait) {
    std::lock_guard<std::mutex> lock(mutex_);
    return wait_exit_locked(wait);
}

std::string ToolServerProcess::exit_description() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_description_locked();
}

std::string ToolServerProcess::exit_description_locked() const {
    if (!exited_) {
        return "running";
    }
    if (WIFEXITED(wait_status_)) {
        return "exited with code " + std::to_string(WEXITSTATUS(wait_status_));
    }
    if (WIFSIGNALED(wait_status_)) {
        return "killed by signal " + std::to_string(WTERMSIG(wait_status_));
    }
    return "exited";
}

bool ToolServerProcess::pump_stderr() {
    if (stderr_fd_ < 0) {
        return false;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(stderr_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            std::lock_guard<std::mutex> lock(mutex_);
            stderr_tail_.append(buffer, static_cast<std::size_t>(n));
            if (stderr_tail_.size() > kStderrTailBytes) {
                stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
            }
            stderr_line_.append(buffer, static_cast<std::size_t>(n));
            std::size_t newline = 0;
            while ((newline = stderr_line_.find('\n')) != std::string::npos) {
                TOOLWIRE_LOG_DEBUG("[" + server_name_ + " stderr] " +
                                   stderr_line_.substr(0, newline));
                stderr_line_.erase(0, newline + 1);
            }
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

std::string ToolServerProcess::stderr_tail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stderr_tail_;
}

void ToolServerProcess::terminate(const std::chrono::milliseconds grace) {
    stdin_writer_.close();

    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0) {
        return;
    }
    if (!exited_) {
        // Well-behaved servers exit on stdin EOF.
        if (!wait_exit_locked(kStdinCloseGrace)) {
            static_cast<void>(kill(pid_, SIGTERM));
            if (!wait_exit_locked(grace)) {
                TOOLWIRE_LOG_WARN("ToolServerProcess: " + server_name_ +
                                  " ignored SIGTERM, sending SIGKILL");
                static_cast<void>(kill(pid_, SIGKILL));
                int status = 0;
                while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
                }
                exited_ = true;
                wait_status_ = status;
            }
        }
    }
    set_state_locked(ProcessState::Terminated, exit_description_locked());
}

ProcessSupervisor::ProcessSupervisor() {
    // A dead server must surface as EPIPE on write, not kill the client.
    static std::once_flag ignore_sigpipe;
    std::call_once(ignore_sigpipe, []() { static_cast<void>(std::signal(SIGPIPE, SIG_IGN)); });
}

core::errors::Result<std::shared_ptr<ToolServerProcess>> ProcessSupervisor::start(
    const ServerSpec& spec) {
    if (spec.name.empty()) {
        return ToolwireError{ErrorCategory::Launch, "Server spec has no name.",
                             "invalid_server_spec"};
    }
    if (spec.command.empty()) {
        return ToolwireError{ErrorCategory::Launch,
                             "Server spec '" + spec.name + "' has no command.",
                             "invalid_server_spec"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(spec.working_directory, ec) || ec) {
        return launch_error(spec, "working directory does not exist: " +
                                      spec.working_directory.string());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto existing = live_.find(spec.name);
    if (existing != live_.end()) {
        const auto running = existing->second.lock();
        if (running && running->state() != ProcessState::Terminated && running->is_alive()) {
            return ToolwireError{ErrorCategory::State,
                                 "Tool server '" + spec.name + "' is already running (pid " +
                                     std::to_string(running->pid()) + ").",
                                 "server_already_running",
                                 "Stop the running instance before starting another."};
        }
        live_.erase(existing);
    }

    PipePair stdin_pipe;
    PipePair stdout_pipe;
    PipePair stderr_pipe;
    PipePair status_pipe;
    if (!stdin_pipe.open() || !stdout_pipe.open() || !stderr_pipe.open() ||
        !status_pipe.open()) {
        const std::string reason = std::strerror(errno);
        stdin_pipe.close_both();
        stdout_pipe.close_both();
        stderr_pipe.close_both();
        status_pipe.close_both();
        return ToolwireError{ErrorCategory::Internal,
                             "Failed to create process pipes: " + reason,
                             "pipe_creation_failed"};
    }

    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.command);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv = to_pointer_array(argv_storage);

    std::vector<std::string> env_storage = build_environment(spec.env);
    std::vector<char*> envp = to_pointer_array(env_storage);

    const std::string cwd = spec.working_directory.string();

    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        stdin_pipe.close_both();
        stdout_pipe.close_both();
        stderr_pipe.close_both();
        status_pipe.close_both();
        return ToolwireError{ErrorCategory::Internal, "Failed to fork process: " + reason,
                             "fork_failed"};
    }

    if (pid == 0) {
        static_cast<void>(std::signal(SIGPIPE, SIG_DFL));
        static_cast<void>(dup2(stdin_pipe.read_end(), STDIN_FILENO));
        static_cast<void>(dup2(stdout_pipe.write_end(), STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe.write_end(), STDERR_FILENO));
        if (chdir(cwd.c_str()) != 0) {
            const int child_errno = errno;
            static_cast<void>(write(status_pipe.write_end(), &child_errno, sizeof(child_errno)));
            _exit(126);
        }
        execvpe(argv[0], argv.data(), envp.data());
        const int child_errno = errno;
        static_cast<void>(write(status_pipe.write_end(), &child_errno, sizeof(child_errno)));
        _exit(127);
    }

    close_fd(stdin_pipe.read_end());
    close_fd(stdout_pipe.write_end());
    close_fd(stderr_pipe.write_end());
    close_fd(status_pipe.write_end());

    // The status pipe is close-on-exec: EOF means exec succeeded.
    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = read(status_pipe.read_end(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe.read_end());

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        stdin_pipe.close_both();
        stdout_pipe.close_both();
        stderr_pipe.close_both();
        TOOLWIRE_LOG_ERROR("ProcessSupervisor: launch of " + spec.name + " failed: " +
                           std::strerror(child_errno));
        return launch_error(spec, std::strerror(child_errno));
    }

    // stdin too, so a server that stops reading cannot hold a sender past its deadline.
    set_nonblocking(stdin_pipe.write_end());
    set_nonblocking(stdout_pipe.read_end());
    set_nonblocking(stderr_pipe.read_end());

    auto process = std::make_shared<ToolServerProcess>(
        spec.name, pid, stdin_pipe.write_end(), stdout_pipe.read_end(), stderr_pipe.read_end());
    process->mark_ready();
    live_[spec.name] = process;

    TOOLWIRE_LOG_INFO("ProcessSupervisor: started " + spec.name + " (pid " +
                      std::to_string(pid) + "): " + spec.command);
    return process;
}

void ProcessSupervisor::stop(const std::shared_ptr<ToolServerProcess>& process,
                             const std::chrono::milliseconds grace) {
    if (!process) {
        return;
    }
    process->terminate(grace);

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = live_.find(process->server_name());
    if (it != live_.end() && it->second.lock() == process) {
        live_.erase(it);
    }
    TOOLWIRE_LOG_INFO("ProcessSupervisor: stopped " + process->server_name() + " (" +
                      process->exit_description() + ")");
}

bool ProcessSupervisor::is_alive(const std::shared_ptr<ToolServerProcess>& process) const {
    return process && process->is_alive();
}

std::size_t ProcessSupervisor::live_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [name, weak] : live_) {
        const auto process = weak.lock();
        if (process && process->state() != ProcessState::Terminated) {
            ++count;
        }
    }
    return count;
}

}  // namespace toolwire::process
