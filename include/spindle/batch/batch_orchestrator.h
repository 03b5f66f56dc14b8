#pragma once

#include <cstddef>
#include <memory>
#include <stop_token>
#include <spindle/batch/batch_types.h>
#include <spindle/config/spindle_config.h>
#include <spindle/gcode/speed_locator.h>
#include <spindle/gcode/speed_validator.h>
#include <spindle/io/atomic_rewriter.h>
#include <spindle/scan/path_scanner.h>

namespace spindle::batch {

struct BatchOptions {
    scan::ScanOptions scan;
    gcode::LocatorOptions locator;
    gcode::SpeedRange range;
    std::size_t concurrencyLimit{4}; // 1 = sequential on the calling thread
    bool skipUnchanged{false};       // skip files already at the requested speed
    bool dryRun{false};              // locate and report only; never write

    static BatchOptions fromConfig(const config::SpindleConfig& cfg);
};

/**
 * Drives scan -> locate -> rewrite over every program under a root.
 *
 * The requested speed is validated once before any file is touched; a bad
 * speed aborts the whole run with InvalidSpeed/OutOfRangeSpeed. Per-file
 * problems never escape their task: they become Failed outcomes. Cancellation
 * is cooperative and checked before each file starts; a rewrite in progress
 * always completes.
 */
class BatchOrchestrator {
public:
    explicit BatchOrchestrator(BatchOptions options,
                               std::shared_ptr<io::IFileAccess> files = nullptr);

    Result<BatchSummary> run(const Job& job, std::stop_token stop = {},
                             const ProgressCallback& progress = {}) const;

    /**
     * Process a single candidate against an already validated target speed.
     */
    FileOutcome processFile(const scan::FileCandidate& candidate, double targetSpeed) const;

    const BatchOptions& options() const { return options_; }

private:
    FileOutcome processFileImpl(const scan::FileCandidate& candidate, double targetSpeed) const;

    BatchOptions options_;
    std::shared_ptr<io::IFileAccess> files_;
    gcode::SpeedTokenLocator locator_;
};

} // namespace spindle::batch
