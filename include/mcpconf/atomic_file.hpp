#pragma once
#include <filesystem>
#include <string_view>

namespace mcpconf {

/// AtomicFile writes into a temporary file beside the target and renames it
/// over the target on commit(). Readers see either the old or the new file.
/// A writer destroyed without commit() removes its temporary file and leaves
/// the target untouched.
class AtomicFile {
public:
    /// Creates the temporary file (and missing parent directories).
    /// Throws SaveFailedError.
    explicit AtomicFile(std::filesystem::path target);
    ~AtomicFile();

    AtomicFile(const AtomicFile&) = delete;
    AtomicFile& operator=(const AtomicFile&) = delete;

    void write(std::string_view data);
    void commit();

    [[nodiscard]] const std::filesystem::path& target() const { return target_; }
    [[nodiscard]] const std::filesystem::path& temp_path() const { return temp_; }
    [[nodiscard]] bool committed() const { return committed_; }

    /// Write content and commit in one step.
    static void write_file(const std::filesystem::path& target, std::string_view content);

private:
    void discard() noexcept;

    std::filesystem::path target_;
    std::filesystem::path temp_;
    int fd_{-1};
    bool committed_{false};
};

} // namespace mcpconf
