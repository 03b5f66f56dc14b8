#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <spindle/scan/path_scanner.h>

#include <sys/stat.h>
#include <sys/types.h>

namespace spindle::scan {

namespace fs = std::filesystem;

namespace {

std::string normalizeExtension(std::string_view ext) {
    std::string out;
    out.reserve(ext.size() + 1);
    if (ext.empty() || ext.front() != '.')
        out.push_back('.');
    for (char c : ext)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

std::int64_t mtimeNanos(const struct stat& st) {
    return static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000LL +
           static_cast<std::int64_t>(st.st_mtim.tv_nsec);
}

bool isSymlink(const fs::path& p) {
    struct stat lst {};
    return ::lstat(p.c_str(), &lst) == 0 && S_ISLNK(lst.st_mode);
}

} // namespace

bool ScanCursor::enterDirectory(const fs::path& dir, Identity id) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        lastListingError_ = ec;
        spdlog::warn("[PathScanner] Skipping unreadable directory '{}': {}", dir.string(),
                     ec.message());
        diagnostics_.push_back({dir, "unreadable directory: " + ec.message()});
        return false;
    }

    Frame frame;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        frame.entries.push_back(it->path());
    }
    if (ec) {
        spdlog::warn("[PathScanner] Listing of '{}' ended early: {}", dir.string(), ec.message());
        diagnostics_.push_back({dir, "incomplete listing: " + ec.message()});
    }
    std::sort(frame.entries.begin(), frame.entries.end(),
              [](const fs::path& a, const fs::path& b) {
                  return a.filename().native() < b.filename().native();
              });

    visitedDirs_.insert(id);
    stack_.push_back(std::move(frame));
    return true;
}

std::optional<FileCandidate> ScanCursor::next() {
    while (!stack_.empty()) {
        auto& top = stack_.back();
        if (top.pos >= top.entries.size()) {
            stack_.pop_back();
            continue;
        }
        fs::path entry = top.entries[top.pos++];

        struct stat st {};
        if (::stat(entry.c_str(), &st) != 0) {
            int err = errno;
            if (isSymlink(entry)) {
                diagnostics_.push_back({entry, "dangling symbolic link"});
                spdlog::debug("[PathScanner] Dangling link '{}'", entry.string());
            } else {
                diagnostics_.push_back({entry, std::string("stat failed: ") + std::strerror(err)});
                spdlog::warn("[PathScanner] Cannot stat '{}': {}", entry.string(),
                             std::strerror(err));
            }
            continue;
        }

        Identity id{static_cast<std::uint64_t>(st.st_dev), static_cast<std::uint64_t>(st.st_ino)};

        if (S_ISDIR(st.st_mode)) {
            if (!options_.followSymlinks && isSymlink(entry))
                continue;
            if (visitedDirs_.count(id) != 0) {
                spdlog::debug("[PathScanner] Already visited '{}', pruning", entry.string());
                continue;
            }
            // May invalidate `top`; nothing below touches it.
            enterDirectory(entry, id);
            continue;
        }

        if (!S_ISREG(st.st_mode))
            continue;
        if (!PathScanner::matchesExtension(entry, options_.extension))
            continue;
        if (!options_.followSymlinks && isSymlink(entry))
            continue;
        if (auto [it, inserted] = seenFiles_.emplace(id, entry); !inserted) {
            spdlog::debug("[PathScanner] '{}' is the same file as '{}', skipping", entry.string(),
                          it->second.string());
            diagnostics_.push_back({entry, "same file as '" + it->second.string() + "'"});
            continue;
        }

        FileCandidate candidate;
        candidate.path = std::move(entry);
        candidate.index = nextIndex_++;
        candidate.device = id.first;
        candidate.inode = id.second;
        candidate.mtimeNs = mtimeNanos(st);
        return candidate;
    }
    return std::nullopt;
}

PathScanner::PathScanner(ScanOptions options) : options_(std::move(options)) {
    options_.extension = normalizeExtension(options_.extension);
}

bool PathScanner::matchesExtension(const fs::path& path, std::string_view extension) {
    const std::string ext = normalizeExtension(extension);
    const std::string name = path.filename().string();
    if (name.size() <= ext.size())
        return false;
    return std::equal(ext.begin(), ext.end(), name.end() - static_cast<std::ptrdiff_t>(ext.size()),
                      [](char a, char b) {
                          return a == static_cast<char>(
                                          std::tolower(static_cast<unsigned char>(b)));
                      });
}

Result<ScanCursor> PathScanner::scan(const fs::path& root) const {
    struct stat st {};
    if (::stat(root.c_str(), &st) != 0) {
        int err = errno;
        return Error{err == EACCES ? ErrorCode::PermissionDenied : ErrorCode::IoError,
                     "Cannot read scan root '" + root.string() + "': " + std::strerror(err)};
    }
    if (!S_ISDIR(st.st_mode)) {
        return Error{ErrorCode::IoError, "Scan root is not a directory: " + root.string()};
    }

    ScanCursor cursor(options_);
    ScanCursor::Identity id{static_cast<std::uint64_t>(st.st_dev),
                            static_cast<std::uint64_t>(st.st_ino)};
    if (!cursor.enterDirectory(root, id)) {
        auto msg = cursor.diagnostics().empty() ? std::string("unreadable")
                                                : cursor.diagnostics().front().message;
        const bool denied = cursor.lastListingError_ == std::errc::permission_denied;
        return Error{denied ? ErrorCode::PermissionDenied : ErrorCode::IoError,
                     "Cannot read scan root '" + root.string() + "': " + msg};
    }
    spdlog::debug("[PathScanner] Walking '{}' for *{}", root.string(), options_.extension);
    return cursor;
}

Result<ScanResult> PathScanner::collect(const fs::path& root) const {
    auto cursor = scan(root);
    if (!cursor)
        return cursor.error();

    ScanResult result;
    auto& c = cursor.value();
    while (auto candidate = c.next()) {
        result.files.push_back(std::move(*candidate));
    }
    result.diagnostics = c.takeDiagnostics();
    spdlog::debug("[PathScanner] Found {} file(s), {} diagnostic(s) under '{}'",
                  result.files.size(), result.diagnostics.size(), root.string());
    return result;
}

} // namespace spindle::scan
