#include "singleton.hpp"
#include <cstdlib>
#include <filesystem>
#include <string>
#include <sys/file.h>
#include <unistd.h>
#include <fcntl.h>

SingletonLock::SingletonLock(const std::string& lock_path) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(lock_path).parent_path(), ec);

    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR, 0644);
    if (fd_ < 0) return;

    if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
        char buf[32] = {};
        ssize_t n = pread(fd_, buf, sizeof(buf) - 1, 0);
        if (n > 0) owner_pid_ = std::atoi(buf);
        close(fd_);
        fd_ = -1;
        return;
    }

    owner_pid_ = static_cast<int>(getpid());
    std::string pid = std::to_string(owner_pid_) + "\n";
    if (ftruncate(fd_, 0) == 0) {
        ssize_t written = pwrite(fd_, pid.data(), pid.size(), 0);
        (void)written;  // the pid is informational only
    }
}

SingletonLock::~SingletonLock() {
    if (fd_ < 0) return;
    close(fd_);
    // flock is released automatically when fd is closed
}
