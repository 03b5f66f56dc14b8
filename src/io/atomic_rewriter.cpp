#include <spindle/gcode/speed_validator.h>
#include <spindle/io/atomic_rewriter.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace spindle::io {

namespace fs = std::filesystem;

namespace {

std::atomic<std::uint64_t> g_tempCounter{0};

std::string errnoMessage(int err) {
    return std::strerror(err);
}

// Removes the temp file unless release() was called (i.e. the rename happened).
class TempFileGuard {
public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!released_ && ::unlink(path_.c_str()) != 0 && errno != ENOENT) {
            spdlog::warn("[Rewriter] Failed to remove temp file '{}': {}", path_.string(),
                         errnoMessage(errno));
        }
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void release() { released_ = true; }

private:
    fs::path path_;
    bool released_{false};
};

Result<void> writeAll(int fd, std::string_view content, const fs::path& tempPath) {
    const char* p = content.data();
    std::size_t left = content.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Error{ErrorCode::WriteError,
                         "write() failed for " + tempPath.string() + ": " + errnoMessage(errno)};
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    return {};
}

Result<void> fsyncDir(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return Error{ErrorCode::IoError,
                     "open(O_DIRECTORY) failed for: " + dir.string() + ": " + errnoMessage(errno)};
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return Error{ErrorCode::IoError,
                     "fsync(dir) failed for: " + dir.string() + ": " + errnoMessage(err)};
    }
    ::close(fd);
    return {};
}

fs::path resolveTarget(const fs::path& requested) {
    std::error_code ec;
    if (!fs::is_symlink(requested, ec))
        return requested;
    auto resolved = fs::canonical(requested, ec);
    if (ec)
        return requested;
    spdlog::debug("[Rewriter] '{}' is a link to '{}'", requested.string(), resolved.string());
    return resolved;
}

fs::path makeTempName(const fs::path& target) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string name = "." + target.filename().string() + ".spindle-" +
                       std::to_string(::getpid()) + "-" + std::to_string(stamp) + "-" +
                       std::to_string(g_tempCounter.fetch_add(1, std::memory_order_relaxed)) +
                       ".tmp";
    return target.parent_path() / name;
}

} // namespace

Result<std::string> readTextFile(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Error{ErrorCode::IoError,
                     "Failed to open '" + path.string() + "': " + errnoMessage(errno)};
    }

    std::string data;
    struct stat st {};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        data.reserve(static_cast<std::size_t>(st.st_size));
    }

    char buf[64 * 1024];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            int err = errno;
            ::close(fd);
            return Error{ErrorCode::IoError,
                         "Failed to read '" + path.string() + "': " + errnoMessage(err)};
        }
        if (n == 0)
            break;
        data.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fd);
    return data;
}

Result<std::string> applySpeed(std::string_view original, const gcode::TokenMatch& match,
                               double newSpeed) {
    const std::size_t len = match.columnSpan.length();
    if (len == 0 || match.offset > original.size() || len > original.size() - match.offset) {
        return Error{ErrorCode::InvalidData, "Token span lies outside the file content"};
    }
    std::string_view current = original.substr(match.offset, len);
    for (char c : current) {
        if (!(c >= '0' && c <= '9') && c != '.') {
            return Error{ErrorCode::InvalidData,
                         "Token span does not hold a numeric literal: '" + std::string(current) +
                             "'"};
        }
    }

    const std::string replacement = gcode::formatSpeed(newSpeed);
    std::string out;
    out.reserve(original.size() - len + replacement.size());
    out.append(original.substr(0, match.offset));
    out.append(replacement);
    out.append(original.substr(match.offset + len));
    return out;
}

Result<void> commitAtomically(const fs::path& requested, std::string_view content,
                              const CommitOptions& options) {
    // Renaming onto a symlink would replace the link, not the program it points to
    const fs::path target = resolveTarget(requested);

    mode_t mode = 0644;
    struct stat st {};
    if (::stat(target.c_str(), &st) == 0) {
        mode = st.st_mode & 07777;
        if (st.st_nlink > 1) {
            spdlog::warn("[Rewriter] '{}' has {} hard links; only this name gets the new content",
                         target.string(), static_cast<unsigned long>(st.st_nlink));
        }
    } else if (errno != ENOENT) {
        return Error{ErrorCode::WriteError,
                     "stat() failed for " + target.string() + ": " + errnoMessage(errno)};
    }

    fs::path dir = target.parent_path();
    if (dir.empty())
        dir = ".";

    fs::path tempPath;
    int fd = -1;
    for (int attempt = 0; attempt < 8 && fd < 0; ++attempt) {
        tempPath = makeTempName(target);
        fd = ::open(tempPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
        if (fd < 0 && errno != EEXIST)
            break;
    }
    if (fd < 0) {
        return Error{ErrorCode::WriteError,
                     "Failed to create temp file in " + dir.string() + ": " + errnoMessage(errno)};
    }
    TempFileGuard guard(tempPath);

    auto written = writeAll(fd, content, tempPath);
    if (!written) {
        ::close(fd);
        return written.error();
    }
    if (::fchmod(fd, mode) != 0) {
        spdlog::debug("[Rewriter] fchmod({:o}) failed for {}: {}", mode, tempPath.string(),
                      errnoMessage(errno));
    }
    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return Error{ErrorCode::WriteError,
                     "fsync() failed for " + tempPath.string() + ": " + errnoMessage(err)};
    }
    if (::close(fd) != 0) {
        return Error{ErrorCode::WriteError,
                     "close() failed for " + tempPath.string() + ": " + errnoMessage(errno)};
    }

    if (options.beforeReplace) {
        auto hook = options.beforeReplace(tempPath);
        if (!hook) {
            return Error{ErrorCode::WriteError, hook.error().message};
        }
    }

    if (::rename(tempPath.c_str(), target.c_str()) != 0) {
        int err = errno;
        std::string msg = "rename() onto " + target.string() + " failed: " + errnoMessage(err);
        if (err == EXDEV)
            msg += " (temp file on a different filesystem)";
        return Error{ErrorCode::WriteError, msg};
    }
    guard.release();

    if (options.syncDirectory) {
        auto synced = fsyncDir(dir);
        if (!synced) {
            spdlog::warn("[Rewriter] {} (content already replaced)", synced.error().message);
        }
    }
    spdlog::debug("[Rewriter] Replaced {} ({} bytes)", target.string(), content.size());
    return {};
}

} // namespace spindle::io
