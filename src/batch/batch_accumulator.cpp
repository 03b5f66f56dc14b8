#include <spdlog/spdlog.h>
#include <algorithm>
#include <exception>
#include <utility>
#include <spindle/batch/batch_accumulator.h>

namespace spindle::batch {

BatchAccumulator::BatchAccumulator(std::size_t discovered, ProgressCallback progress)
    : callback_(std::move(progress)) {
    progress_.discovered = discovered;
    outcomes_.reserve(discovered);
}

void BatchAccumulator::record(FileOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (outcome.status) {
        case FileStatus::Updated:
            ++progress_.updated;
            break;
        case FileStatus::Skipped:
            ++progress_.skipped;
            break;
        case FileStatus::Failed:
            ++progress_.failed;
            break;
    }
    ++progress_.completed;

    ProgressEvent event{outcome.filePath, outcome.status, progress_.completed,
                        progress_.discovered};
    outcomes_.push_back(std::move(outcome));

    if (callback_) {
        try {
            callback_(event);
        } catch (const std::exception& e) {
            spdlog::warn("[BatchAccumulator] Progress callback threw: {}", e.what());
        }
    }
}

BatchProgress BatchAccumulator::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

BatchSummary BatchAccumulator::finalize(bool cancelled) {
    std::lock_guard<std::mutex> lock(mutex_);
    BatchSummary summary;
    summary.discovered = progress_.discovered;
    summary.total = progress_.completed;
    summary.updatedCount = progress_.updated;
    summary.skippedCount = progress_.skipped;
    summary.failedCount = progress_.failed;
    summary.cancelled = cancelled;
    summary.outcomes = std::move(outcomes_);
    outcomes_.clear();
    std::sort(summary.outcomes.begin(), summary.outcomes.end(),
              [](const FileOutcome& a, const FileOutcome& b) { return a.index < b.index; });
    return summary;
}

} // namespace spindle::batch
