#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <spindle/core/types.h>
#include <spindle/scan/path_scanner.h>

namespace spindle::batch {

inline constexpr const char* kNoMatchReason = "no spindle-speed command found";
inline constexpr const char* kUnchangedReason = "spindle speed already set";

/**
 * One bulk-edit request. Immutable once handed to the orchestrator.
 */
struct Job {
    std::filesystem::path rootPath;
    double requestedSpeed{0.0};
};

enum class FileStatus { Updated, Skipped, Failed };

constexpr const char* fileStatusToString(FileStatus status) {
    switch (status) {
        case FileStatus::Updated: return "updated";
        case FileStatus::Skipped: return "skipped";
        case FileStatus::Failed: return "failed";
    }
    return "unknown";
}

/**
 * Terminal result for one discovered file.
 */
struct FileOutcome {
    std::filesystem::path filePath;
    std::size_t index{0}; // discovery order
    FileStatus status{FileStatus::Skipped};
    std::string reason; // empty for Updated
    std::optional<double> oldSpeed;
    std::optional<double> newSpeed;
    std::optional<std::size_t> lineIndex; // 0-based line of the speed word
    std::optional<Error> error;           // set for Failed
};

/**
 * Aggregate result of a batch run.
 *
 * updatedCount + skippedCount + failedCount == total == outcomes.size().
 * `discovered` can exceed `total` when the run was cancelled.
 */
struct BatchSummary {
    std::filesystem::path rootPath;
    double requestedSpeed{0.0};
    std::size_t discovered{0};
    std::size_t total{0};
    std::size_t updatedCount{0};
    std::size_t skippedCount{0};
    std::size_t failedCount{0};
    bool cancelled{false};
    bool dryRun{false};
    std::vector<FileOutcome> outcomes; // sorted by discovery order
    std::vector<scan::ScanDiagnostic> diagnostics;
    std::chrono::milliseconds elapsed{0};
};

struct ProgressEvent {
    std::filesystem::path path;
    FileStatus status{FileStatus::Skipped};
    std::size_t completed{0};
    std::size_t discovered{0};
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

} // namespace spindle::batch
