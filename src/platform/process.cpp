#include "process.hpp"
#include "platform.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    // Never leave a zombie or an orphaned download behind
    if (valid() && !reaped_) terminate(500);
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), exit_code_(other.exit_code_), reaped_(other.reaped_) {
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (valid() && !reaped_) terminate(500);
        pid_ = other.pid_;
        exit_code_ = other.exit_code_;
        reaped_ = other.reaped_;
        other.pid_ = -1;
    }
    return *this;
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) exit_code_ = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exit_code_ = 128 + WTERMSIG(status);
    else exit_code_ = -1;
}

bool ProcessHandle::running() {
    if (!valid() || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == 0) return true;
    if (ret == pid_) record_status(status);
    else reaped_ = true;
    return false;
}

int ProcessHandle::wait(int timeout_ms) {
    if (!valid()) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        if (waitpid(pid_, &status, 0) == pid_) record_status(status);
        else reaped_ = true;
        return exit_code_;
    }
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exit_code_;
        sleep_ms(50);
        elapsed += 50;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate(int grace_ms) {
    if (!valid() || reaped_) return;
    // Whole group: yt-dlp forks ffmpeg for merging
    kill(-pid_, SIGTERM);
    for (int waited = 0; waited < grace_ms; waited += 50) {
        if (!running()) return;
        sleep_ms(50);
    }
    kill(-pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) record_status(status);
    else reaped_ = true;
}

// ── spawn ────────────────────────────────────────────────────

static void redirect(const std::string& path, int target_fd) {
    if (path.empty()) return;
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd >= 0) {
        dup2(fd, target_fd);
        close(fd);
    }
}

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const std::string& stdout_log,
                    const std::string& stderr_log) {
    ProcessHandle handle;

    // Build argv before fork; the child may only call async-signal-safe functions
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        redirect(stdout_log, STDOUT_FILENO);
        redirect(stderr_log, STDERR_FILENO);
        // Own process group so terminate() does not hit the parent's terminal
        setpgid(0, 0);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    setpgid(pid, pid);  // also from the parent, whichever runs first
    handle.pid_ = pid;
    return handle;
}

// ── run_capture ──────────────────────────────────────────────

std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return "";
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

ProcessResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          const std::function<bool()>& should_stop,
                          int poll_ms) {
    ProcessResult result;
    std::string out_path = temp_file("vrelay_out").string();
    std::string err_path = temp_file("vrelay_err").string();

    auto proc = spawn(program, args, out_path, err_path);
    if (proc.valid()) {
        result.spawned = true;
        while (proc.running()) {
            if (should_stop && should_stop()) {
                proc.terminate();
                result.stopped = true;
                break;
            }
            sleep_ms(poll_ms);
        }
        result.exit_code = proc.exit_code();
        // execvp failure inside the child
        if (result.exit_code == 127) result.spawned = false;
    }

    result.stdout_data = read_file(out_path);
    result.stderr_data = read_file(err_path);
    std::error_code ec;
    std::filesystem::remove(out_path, ec);
    std::filesystem::remove(err_path, ec);
    return result;
}

} // namespace platform
