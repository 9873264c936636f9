#include "mcpconf/file_lock.hpp"
#include "mcpconf/error.hpp"
#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <thread>
#include <spdlog/spdlog.h>

namespace mcpconf {

namespace fs = std::filesystem;

namespace {
constexpr std::chrono::milliseconds kRetryInterval{50};
}

fs::path FileLock::lock_path_for(const fs::path& target) {
    fs::path p = target;
    p += ".lock";
    return p;
}

FileLock::FileLock(const fs::path& target, std::chrono::milliseconds timeout)
    : lock_path_(lock_path_for(target)) {
    const fs::path dir = lock_path_.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
    }

    fd_ = ::open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw LockTimeoutError("Cannot open lock file '" + lock_path_.string() + "': "
                               + std::strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            spdlog::debug("Acquired lock {}", lock_path_.string());
            return;
        }
        if (errno == EINTR) continue;
        if (errno != EWOULDBLOCK) {
            std::string msg = std::strerror(errno);
            ::close(fd_);
            fd_ = -1;
            throw LockTimeoutError("Cannot lock '" + lock_path_.string() + "': " + msg);
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(kRetryInterval, remaining));
    }

    ::close(fd_);
    fd_ = -1;
    throw LockTimeoutError("Timed out after " + std::to_string(timeout.count())
                           + " ms waiting for lock '" + lock_path_.string() + "'");
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        spdlog::debug("Released lock {}", lock_path_.string());
    }
}

} // namespace mcpconf
