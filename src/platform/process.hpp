#pragma once

#include <functional>
#include <string>
#include <vector>

namespace platform {

// Handle to a spawned child process. Unix only.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const { return pid_ > 0; }

    // True if the process is still running. Reaps it once it has exited.
    bool running();

    // Wait for the process to exit. Returns its exit code, 128+signal when
    // killed, or -1 on timeout. timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Exit code after running() returned false or wait() succeeded.
    int exit_code() const { return exit_code_; }

    // SIGTERM, then SIGKILL after `grace_ms`. Always reaps the child.
    void terminate(int grace_ms = 2000);

    int native_handle() const { return pid_; }

private:
    void record_status(int status);

    int pid_ = -1;
    int exit_code_ = -1;
    bool reaped_ = false;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const std::string& stdout_log,
                               const std::string& stderr_log);
};

// Spawn a child process with stdin closed.
// stdout_log / stderr_log: if non-empty, redirect that stream to the file
// (truncated). Empty leaves the stream attached to ours.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stdout_log = "",
                    const std::string& stderr_log = "");

struct ProcessResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
    bool spawned = false;
    bool stopped = false;        // should_stop() fired and the child was terminated

    bool success() const { return spawned && !stopped && exit_code == 0; }
};

// Run to completion, capturing both streams through temp files. `should_stop`
// is polled every `poll_ms`; when it returns true the child is terminated.
ProcessResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::function<bool()>& should_stop = nullptr,
                          int poll_ms = 100);

// Read a whole file; empty string if it cannot be opened.
std::string read_file(const std::string& path);

} // namespace platform
