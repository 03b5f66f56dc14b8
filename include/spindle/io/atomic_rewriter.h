#pragma once

/*
 * Atomic rewrite of G-code programs.
 *
 * applySpeed() produces the patched text: only the numeric span of the located
 * speed word changes, every other byte (including line terminators) is kept.
 *
 * commitAtomically() writes that text next to the target and swaps it in:
 *   1. create a temp file in the target's directory (O_EXCL, same permissions)
 *   2. write, fsync, close
 *   3. rename(temp, target), atomic on the same filesystem
 *   4. fsync the directory (best effort)
 * Any failure before step 3 removes the temp file and leaves the target
 * byte-for-byte untouched.
 *
 * A target that is a symbolic link is resolved first: the link survives and
 * the file it names is replaced. Hard links are split by the rename; the
 * other names keep the previous content and a warning is logged.
 */

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <spindle/core/types.h>
#include <spindle/gcode/speed_locator.h>

namespace spindle::io {

struct CommitOptions {
    bool syncDirectory{true};

    // Runs after the temp file is durable and before the rename. Returning an
    // error aborts the commit as if the replace step had failed.
    std::function<Result<void>(const std::filesystem::path& tempPath)> beforeReplace;
};

/**
 * Read a whole file as raw bytes. Failures map to IoError (message carries the
 * OS reason, e.g. "Permission denied").
 */
Result<std::string> readTextFile(const std::filesystem::path& path);

/**
 * Replace the numeric literal at match.offset with formatSpeed(newSpeed).
 * Fails with InvalidData when the span no longer holds a numeric literal.
 */
Result<std::string> applySpeed(std::string_view original, const gcode::TokenMatch& match,
                               double newSpeed);

/**
 * Durably replace target with content (see file comment). Fails with WriteError.
 */
Result<void> commitAtomically(const std::filesystem::path& target, std::string_view content,
                              const CommitOptions& options = {});

/**
 * File access used by the batch orchestrator.
 */
class IFileAccess {
public:
    virtual ~IFileAccess() = default;

    virtual Result<std::string> read(const std::filesystem::path& path) = 0;

    virtual Result<void> replace(const std::filesystem::path& path, std::string_view content) = 0;
};

class PosixFileAccess final : public IFileAccess {
public:
    explicit PosixFileAccess(CommitOptions options = {}) : options_(std::move(options)) {}

    Result<std::string> read(const std::filesystem::path& path) override {
        return readTextFile(path);
    }

    Result<void> replace(const std::filesystem::path& path, std::string_view content) override {
        return commitAtomically(path, content, options_);
    }

private:
    CommitOptions options_;
};

} // namespace spindle::io
