#include "mcpconf/atomic_file.hpp"
#include "mcpconf/error.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

namespace mcpconf {

namespace fs = std::filesystem;

namespace {

std::string errno_message(const std::string& what, const fs::path& path) {
    return what + " '" + path.string() + "': " + std::strerror(errno);
}

void sync_directory(const fs::path& dir) {
    int dfd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) return;
    ::fsync(dfd);
    ::close(dfd);
}

} // anonymous namespace

AtomicFile::AtomicFile(fs::path target) : target_(std::move(target)) {
    const fs::path dir = target_.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            throw SaveFailedError("Cannot create directory '" + dir.string() + "': " + ec.message());
        }
    }

    std::string pattern = (dir / ("." + target_.filename().string() + ".XXXXXX")).string();
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    fd_ = ::mkstemp(buf.data());
    if (fd_ < 0) {
        throw SaveFailedError(errno_message("Cannot create temporary file in", dir));
    }
    temp_ = fs::path(buf.data());

    // Keep the permissions of the file being replaced.
    mode_t mode = 0644;
    struct stat st{};
    if (::stat(target_.c_str(), &st) == 0) {
        mode = st.st_mode & 07777;
    }
    ::fchmod(fd_, mode);
}

AtomicFile::~AtomicFile() {
    discard();
}

void AtomicFile::write(std::string_view data) {
    if (fd_ < 0) {
        throw SaveFailedError("Temporary file for '" + target_.string() + "' is closed");
    }
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw SaveFailedError(errno_message("Write failed for", temp_));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
}

void AtomicFile::commit() {
    if (committed_) return;
    if (fd_ < 0) {
        throw SaveFailedError("Temporary file for '" + target_.string() + "' is closed");
    }
    if (::fsync(fd_) != 0) {
        throw SaveFailedError(errno_message("fsync failed for", temp_));
    }
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) {
        throw SaveFailedError(errno_message("Close failed for", temp_));
    }
    if (::rename(temp_.c_str(), target_.c_str()) != 0) {
        throw SaveFailedError(errno_message("Cannot rename temporary file over", target_));
    }
    committed_ = true;
    sync_directory(target_.parent_path());
}

void AtomicFile::discard() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!committed_ && !temp_.empty()) {
        ::unlink(temp_.c_str());
    }
}

void AtomicFile::write_file(const fs::path& target, std::string_view content) {
    AtomicFile file(target);
    file.write(content);
    file.commit();
}

} // namespace mcpconf
