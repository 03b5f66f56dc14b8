#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>
#include <spindle/core/types.h>

namespace spindle::scan {

/**
 * A file discovered under the scan root.
 *
 * `index` is the discovery position and defines the final ordering of batch
 * outcomes. `device`/`inode` identify the underlying file so the same file
 * reached through two paths is only yielded once.
 */
struct FileCandidate {
    std::filesystem::path path;
    std::size_t index{0};
    std::uint64_t device{0};
    std::uint64_t inode{0};
    std::int64_t mtimeNs{0};
};

// Non-fatal problem encountered while walking (unreadable directory, dangling link, ...)
struct ScanDiagnostic {
    std::filesystem::path path;
    std::string message;
};

struct ScanOptions {
    std::string extension{".tap"}; // case-insensitive; leading dot optional
    bool followSymlinks{true};
};

struct ScanResult {
    std::vector<FileCandidate> files;
    std::vector<ScanDiagnostic> diagnostics;
};

/**
 * Lazy depth-first walk over a directory tree.
 *
 * Entries of each directory are visited in byte-wise name order. Directories
 * are only read when the walk reaches them. Each directory identity
 * (device, inode) is entered at most once, which bounds the walk even when
 * symbolic links form cycles. A file reached again under another name
 * (symlink or hard link) is not yielded twice; the extra name is recorded as
 * a diagnostic naming the path that was yielded.
 */
class ScanCursor {
public:
    ScanCursor(ScanCursor&&) = default;
    ScanCursor& operator=(ScanCursor&&) = default;
    ScanCursor(const ScanCursor&) = delete;
    ScanCursor& operator=(const ScanCursor&) = delete;

    /**
     * Advance to the next matching file; std::nullopt once the walk is exhausted.
     */
    std::optional<FileCandidate> next();

    const std::vector<ScanDiagnostic>& diagnostics() const { return diagnostics_; }

    std::vector<ScanDiagnostic> takeDiagnostics() { return std::move(diagnostics_); }

private:
    friend class PathScanner;

    struct Frame {
        std::vector<std::filesystem::path> entries;
        std::size_t pos{0};
    };

    using Identity = std::pair<std::uint64_t, std::uint64_t>;

    explicit ScanCursor(ScanOptions options) : options_(std::move(options)) {}

    // Reads a directory listing into a new frame; records a diagnostic on failure.
    bool enterDirectory(const std::filesystem::path& dir, Identity id);

    ScanOptions options_;
    std::vector<Frame> stack_;
    std::set<Identity> visitedDirs_;
    std::map<Identity, std::filesystem::path> seenFiles_; // identity -> path yielded
    std::vector<ScanDiagnostic> diagnostics_;
    std::error_code lastListingError_;
    std::size_t nextIndex_{0};
};

class PathScanner {
public:
    explicit PathScanner(ScanOptions options = {});

    /**
     * Start a fresh walk at root. Fails only when the root itself cannot be
     * read: PermissionDenied when access is refused, IoError otherwise. Every
     * call re-walks the tree.
     */
    Result<ScanCursor> scan(const std::filesystem::path& root) const;

    /**
     * Drain a fresh walk into a vector.
     */
    Result<ScanResult> collect(const std::filesystem::path& root) const;

    const ScanOptions& options() const { return options_; }

    /**
     * True when the file name ends with the extension (case-insensitive).
     */
    static bool matchesExtension(const std::filesystem::path& path, std::string_view extension);

private:
    ScanOptions options_;
};

} // namespace spindle::scan
