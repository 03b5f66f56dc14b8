#pragma once

#include <cstddef>
#include <mutex>
#include <vector>
#include <spindle/batch/batch_types.h>

namespace spindle::batch {

// Consistent point-in-time view of a running batch
struct BatchProgress {
    std::size_t discovered{0};
    std::size_t completed{0};
    std::size_t updated{0};
    std::size_t skipped{0};
    std::size_t failed{0};
};

/**
 * Single-writer accumulator shared by file workers.
 *
 * record() appends one outcome and publishes the progress event under the
 * same lock, so callbacks are serialized and never observe a half-applied
 * outcome. The callback must not call back into the accumulator.
 */
class BatchAccumulator {
public:
    explicit BatchAccumulator(std::size_t discovered, ProgressCallback progress = {});

    BatchAccumulator(const BatchAccumulator&) = delete;
    BatchAccumulator& operator=(const BatchAccumulator&) = delete;

    void record(FileOutcome outcome);

    BatchProgress snapshot() const;

    /**
     * Sort outcomes by discovery order and build the summary. Moves the
     * recorded outcomes out; call once, after all workers are done.
     */
    BatchSummary finalize(bool cancelled);

private:
    mutable std::mutex mutex_;
    BatchProgress progress_;
    std::vector<FileOutcome> outcomes_;
    ProgressCallback callback_;
};

} // namespace spindle::batch
