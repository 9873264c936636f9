#pragma once
#include <chrono>
#include <filesystem>

namespace mcpconf {

/// Advisory exclusive lock on "<target>.lock", held for the lifetime of the
/// object. Acquisition retries until the timeout expires and then throws
/// LockTimeoutError; it never blocks indefinitely.
class FileLock {
public:
    FileLock(const std::filesystem::path& target, std::chrono::milliseconds timeout);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    [[nodiscard]] const std::filesystem::path& lock_path() const { return lock_path_; }

    static std::filesystem::path lock_path_for(const std::filesystem::path& target);

private:
    std::filesystem::path lock_path_;
    int fd_{-1};
};

} // namespace mcpconf
