#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <unordered_map>
#include <vector>
#include "core/errors/toolwire_errors.hpp"
#include "transport/frame_writer.hpp"

namespace toolwire::process {

// How to launch one tool server.
struct ServerSpec {
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path working_directory = ".";
    std::map<std::string, std::string> env;  // added to (or overriding) the parent environment
    std::uint32_t call_timeout_ms = 5000;
};

enum class ProcessState {
    Starting,
    Ready,
    Degraded,   // alive, but wrote garbage, broke the protocol or refused a write
    Terminated
};

std::string to_string(ProcessState state);

constexpr std::chrono::milliseconds kDefaultStopGrace{3000};

// A running tool server and its pipes. The object owns the child: destroying
// it terminates the process, reaps it and closes every descriptor.
class ToolServerProcess {
public:
    ToolServerProcess(std::string server_name, pid_t pid, int stdin_fd, int stdout_fd,
                      int stderr_fd);
    ~ToolServerProcess();

    ToolServerProcess(const ToolServerProcess&) = delete;
    ToolServerProcess& operator=(const ToolServerProcess&) = delete;

    const std::string& server_name() const { return server_name_; }
    pid_t pid() const { return pid_; }

    // Write half of the channel (the child's stdin).
    transport::FrameWriter& stdin_writer() { return stdin_writer_; }
    // Read halves; both are non-blocking and meant for a single reader thread.
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    ProcessState state() const;
    void mark_ready();
    void mark_degraded(const std::string& reason);

    bool is_alive();

    // Waits up to `wait` for the child to exit. Returns true once it has been reaped.
    bool reap(std::chrono::milliseconds wait);

    // Drains buffered stderr into the log and the tail buffer. Returns false at EOF.
    bool pump_stderr();
    std::string stderr_tail() const;

    // e.g. "exited with code 3", "killed by signal 9", "running"
    std::string exit_description() const;

    // Closes stdin, then escalates SIGTERM -> SIGKILL until the child is reaped.
    void terminate(std::chrono::milliseconds grace = kDefaultStopGrace);

private:
    bool poll_exit_locked();
    bool wait_exit_locked(std::chrono::milliseconds wait);
    void set_state_locked(ProcessState next, const std::string& reason);
    std::string exit_description_locked() const;

    std::string server_name_;
    pid_t pid_;
    transport::FrameWriter stdin_writer_;
    int stdout_fd_;
    int stderr_fd_;

    mutable std::mutex mutex_;
    ProcessState state_ = ProcessState::Starting;
    bool exited_ = false;
    int wait_status_ = 0;
    std::string stderr_tail_;
    std::string stderr_line_;
};

// Launches tool servers and keeps at most one live process per server name.
class ProcessSupervisor {
public:
    ProcessSupervisor();

    core::errors::Result<std::shared_ptr<ToolServerProcess>> start(const ServerSpec& spec);
    void stop(const std::shared_ptr<ToolServerProcess>& process,
              std::chrono::milliseconds grace = kDefaultStopGrace);
    bool is_alive(const std::shared_ptr<ToolServerProcess>& process) const;

    std::size_t live_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<ToolServerProcess>> live_;
};

}  // namespace toolwire::process
