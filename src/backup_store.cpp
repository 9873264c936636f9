#include "mcpconf/backup_store.hpp"
#include "mcpconf/error.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>
#include <spdlog/spdlog.h>

namespace mcpconf {

namespace fs = std::filesystem;
using Micros = std::chrono::microseconds;
using MicrosTimePoint = std::chrono::time_point<std::chrono::system_clock, Micros>;

namespace {

constexpr int kMaxNameAttempts = 1000;

// Timestamps handed out by this process, strictly increasing.
MicrosTimePoint next_timestamp() {
    static std::mutex mutex;
    static MicrosTimePoint last{};
    std::lock_guard<std::mutex> lock(mutex);
    auto now = std::chrono::time_point_cast<Micros>(std::chrono::system_clock::now());
    if (now <= last) now = last + Micros{1};
    last = now;
    return now;
}

bool read_all(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) return false;
    out = oss.str();
    return true;
}

void write_all(int fd, const std::string& data, const fs::path& path) {
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw BackupFailedError("Write failed for '" + path.string() + "': " + std::strerror(errno));
        }
        p += written;
        remaining -= static_cast<size_t>(written);
    }
    if (::fsync(fd) != 0) {
        throw BackupFailedError("fsync failed for '" + path.string() + "': " + std::strerror(errno));
    }
}

} // anonymous namespace

BackupStore::BackupStore(Options opts) : opts_(std::move(opts)) {
}

std::string BackupStore::format_timestamp(std::chrono::system_clock::time_point tp) {
    const auto micros = std::chrono::duration_cast<Micros>(tp.time_since_epoch()).count() % 1000000;
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d-%H%M%S") << '-'
        << std::setw(6) << std::setfill('0') << (micros < 0 ? micros + 1000000 : micros);
    return oss.str();
}

std::optional<Snapshot> BackupStore::snapshot(const fs::path& registry_path) {
    std::error_code ec;
    if (!fs::exists(registry_path, ec)) {
        spdlog::debug("Nothing to back up, {} does not exist", registry_path.string());
        return std::nullopt;
    }

    std::string content;
    if (!read_all(registry_path, content)) {
        throw BackupFailedError("Cannot read '" + registry_path.string() + "'");
    }

    fs::create_directories(opts_.directory, ec);
    if (ec) {
        throw BackupFailedError("Cannot create backup directory '" + opts_.directory.string()
                                + "': " + ec.message());
    }

    mode_t mode = 0600;
    struct stat st{};
    if (::stat(registry_path.c_str(), &st) == 0) mode = st.st_mode & 0777;

    auto tp = next_timestamp();
    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt, tp += Micros{1}) {
        Snapshot snap;
        snap.timestamp = format_timestamp(tp);
        snap.path = opts_.directory / (opts_.prefix + "-" + snap.timestamp + opts_.suffix);

        // O_EXCL: an existing snapshot is never overwritten.
        int fd = ::open(snap.path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, mode);
        if (fd < 0) {
            if (errno == EEXIST) continue;
            throw BackupFailedError("Cannot create '" + snap.path.string() + "': " + std::strerror(errno));
        }

        try {
            write_all(fd, content, snap.path);
        } catch (...) {
            ::close(fd);
            ::unlink(snap.path.c_str());
            throw;
        }
        if (::close(fd) != 0) {
            ::unlink(snap.path.c_str());
            throw BackupFailedError("Close failed for '" + snap.path.string() + "'");
        }

        snap.size = content.size();
        spdlog::info("Created backup at {}", snap.path.string());
        return snap;
    }
    throw BackupFailedError("No free snapshot name in '" + opts_.directory.string() + "'");
}

std::optional<std::string> BackupStore::timestamp_of(const std::string& file_name) const {
    const std::string head = opts_.prefix + "-";
    if (file_name.size() <= head.size() + opts_.suffix.size()) return std::nullopt;
    if (file_name.compare(0, head.size(), head) != 0) return std::nullopt;
    if (file_name.compare(file_name.size() - opts_.suffix.size(), opts_.suffix.size(), opts_.suffix) != 0) {
        return std::nullopt;
    }

    std::string ts = file_name.substr(head.size(), file_name.size() - head.size() - opts_.suffix.size());
    // Accept "YYYYMMDD-HHMMSS" (older backups) and "YYYYMMDD-HHMMSS-uuuuuu".
    if (ts.size() != 15 && ts.size() != 22) return std::nullopt;
    for (size_t i = 0; i < ts.size(); ++i) {
        bool dash = (i == 8 || i == 15);
        if (dash ? ts[i] != '-' : !std::isdigit(static_cast<unsigned char>(ts[i]))) {
            return std::nullopt;
        }
    }
    return ts;
}

std::vector<Snapshot> BackupStore::list_snapshots() const {
    std::vector<Snapshot> out;
    std::error_code ec;
    if (!fs::is_directory(opts_.directory, ec)) return out;

    for (fs::directory_iterator it(opts_.directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        auto ts = timestamp_of(it->path().filename().string());
        if (!ts) continue;
        Snapshot snap;
        snap.timestamp = *ts;
        snap.path = it->path();
        snap.size = it->file_size(ec);
        out.push_back(std::move(snap));
    }
    if (ec) {
        spdlog::warn("Listing {} stopped early: {}", opts_.directory.string(), ec.message());
    }

    std::sort(out.begin(), out.end(), [](const Snapshot& a, const Snapshot& b) {
        return a.timestamp < b.timestamp;
    });
    return out;
}

std::optional<Snapshot> BackupStore::latest() const {
    auto all = list_snapshots();
    if (all.empty()) return std::nullopt;
    return all.back();
}

Snapshot BackupStore::find(const std::string& ref) const {
    if (ref == "latest") {
        if (auto snap = latest()) return *snap;
        throw SnapshotNotFoundError("No snapshots in '" + opts_.directory.string() + "'");
    }
    for (const auto& snap : list_snapshots()) {
        if (snap.timestamp == ref || snap.path.filename().string() == ref) {
            return snap;
        }
    }
    throw SnapshotNotFoundError("Snapshot not found: " + ref);
}

std::string BackupStore::read(const Snapshot& snapshot) const {
    std::string content;
    if (!read_all(snapshot.path, content)) {
        throw SnapshotNotFoundError("Cannot read snapshot '" + snapshot.path.string() + "'");
    }
    return content;
}

} // namespace mcpconf
