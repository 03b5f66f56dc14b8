#include <spindle/batch/batch_accumulator.h>
#include <spindle/batch/batch_orchestrator.h>

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <utility>

#include <sys/stat.h>

namespace spindle::batch {

namespace {

FileOutcome failed(const scan::FileCandidate& candidate, Error error) {
    FileOutcome out;
    out.filePath = candidate.path;
    out.index = candidate.index;
    out.status = FileStatus::Failed;
    out.reason = fmt::format("{}: {}", errorCodeName(error.code), error.message);
    out.error = std::move(error);
    return out;
}

void warnIfModifiedSinceScan(const scan::FileCandidate& candidate) {
    struct stat st {};
    if (::stat(candidate.path.c_str(), &st) != 0)
        return;
    std::int64_t now = static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000LL +
                       static_cast<std::int64_t>(st.st_mtim.tv_nsec);
    if (now != candidate.mtimeNs) {
        spdlog::warn("[BatchOrchestrator] '{}' was modified after it was discovered",
                     candidate.path.string());
    }
}

} // namespace

BatchOptions BatchOptions::fromConfig(const config::SpindleConfig& cfg) {
    BatchOptions opts;
    opts.scan.extension = cfg.fileExtension;
    opts.locator.searchWindowLines = cfg.searchWindowLines;
    opts.locator.stopAtMotion = cfg.stopAtMotion;
    opts.range = gcode::SpeedRange{cfg.minRpm, cfg.maxRpm};
    opts.concurrencyLimit = cfg.concurrencyLimit;
    opts.skipUnchanged = cfg.skipUnchanged;
    return opts;
}

BatchOrchestrator::BatchOrchestrator(BatchOptions options, std::shared_ptr<io::IFileAccess> files)
    : options_(std::move(options)), files_(std::move(files)), locator_(options_.locator) {
    if (!files_) {
        files_ = std::make_shared<io::PosixFileAccess>();
    }
    if (options_.concurrencyLimit == 0) {
        options_.concurrencyLimit = 1;
    }
}

Result<BatchSummary> BatchOrchestrator::run(const Job& job, std::stop_token stop,
                                            const ProgressCallback& progress) const {
    const auto started = std::chrono::steady_clock::now();

    // Validate once, before any filesystem work
    auto validator = gcode::SpeedValidator::create(options_.range);
    if (!validator) {
        return validator.error();
    }
    auto target = validator.value().validate(job.requestedSpeed);
    if (!target) {
        spdlog::error("[BatchOrchestrator] Rejected requested speed: {}", target.error().message);
        return target.error();
    }
    const double targetSpeed = target.value();

    scan::PathScanner scanner(options_.scan);
    auto scanned = scanner.collect(job.rootPath);
    if (!scanned) {
        spdlog::error("[BatchOrchestrator] {}", scanned.error().message);
        return scanned.error();
    }
    auto& files = scanned.value().files;

    spdlog::info("[BatchOrchestrator] Updating {} file(s) under '{}' to S{}{}", files.size(),
                 job.rootPath.string(), gcode::formatSpeed(targetSpeed),
                 options_.dryRun ? " (dry run)" : "");

    BatchAccumulator accumulator(files.size(), progress);
    std::atomic<std::size_t> notStarted{0};

    auto runOne = [&](const scan::FileCandidate& candidate) {
        if (stop.stop_requested()) {
            notStarted.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        accumulator.record(processFile(candidate, targetSpeed));
    };

    const std::size_t workers = std::min(options_.concurrencyLimit, files.size());
    if (workers <= 1) {
        for (const auto& candidate : files) {
            runOne(candidate);
        }
    } else {
        boost::asio::thread_pool pool(workers);
        for (const auto& candidate : files) {
            boost::asio::post(pool, [&runOne, &candidate]() { runOne(candidate); });
        }
        pool.join();
    }

    const bool cancelled = notStarted.load() > 0;
    BatchSummary summary = accumulator.finalize(cancelled);
    summary.rootPath = job.rootPath;
    summary.requestedSpeed = targetSpeed;
    summary.dryRun = options_.dryRun;
    summary.diagnostics = std::move(scanned.value().diagnostics);
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (cancelled) {
        spdlog::warn("[BatchOrchestrator] Cancelled: {} of {} file(s) processed", summary.total,
                     summary.discovered);
    }
    spdlog::info("[BatchOrchestrator] Done: total={} updated={} skipped={} failed={} in {} ms",
                 summary.total, summary.updatedCount, summary.skippedCount, summary.failedCount,
                 summary.elapsed.count());
    return summary;
}

FileOutcome BatchOrchestrator::processFile(const scan::FileCandidate& candidate,
                                           double targetSpeed) const {
    try {
        return processFileImpl(candidate, targetSpeed);
    } catch (const std::exception& e) {
        spdlog::error("[BatchOrchestrator] Unexpected error on '{}': {}", candidate.path.string(),
                      e.what());
        return failed(candidate, Error{ErrorCode::InternalError, e.what()});
    }
}

FileOutcome BatchOrchestrator::processFileImpl(const scan::FileCandidate& candidate,
                                               double targetSpeed) const {
    auto content = files_->read(candidate.path);
    if (!content) {
        spdlog::warn("[BatchOrchestrator] {}", content.error().message);
        return failed(candidate, content.error());
    }

    auto match = locator_.locate(candidate.path, content.value());
    if (!match) {
        spdlog::debug("[BatchOrchestrator] {}: {}", candidate.path.string(), kNoMatchReason);
        FileOutcome out;
        out.filePath = candidate.path;
        out.index = candidate.index;
        out.status = FileStatus::Skipped;
        out.reason = kNoMatchReason;
        return out;
    }

    FileOutcome out;
    out.filePath = candidate.path;
    out.index = candidate.index;
    out.oldSpeed = match->currentSpeed;
    out.lineIndex = match->lineIndex;

    if (options_.skipUnchanged && match->currentSpeed == targetSpeed) {
        spdlog::debug("[BatchOrchestrator] {}: already S{}", candidate.path.string(),
                      match->literal);
        out.status = FileStatus::Skipped;
        out.reason = kUnchangedReason;
        return out;
    }

    auto patched = io::applySpeed(content.value(), *match, targetSpeed);
    if (!patched) {
        return failed(candidate, patched.error());
    }

    if (!options_.dryRun) {
        warnIfModifiedSinceScan(candidate);
        auto replaced = files_->replace(candidate.path, patched.value());
        if (!replaced) {
            spdlog::warn("[BatchOrchestrator] {}", replaced.error().message);
            return failed(candidate, replaced.error());
        }
    }

    spdlog::debug("[BatchOrchestrator] {} line {}: S{} -> S{}", candidate.path.string(),
                  match->lineIndex + 1, match->literal, gcode::formatSpeed(targetSpeed));
    out.status = FileStatus::Updated;
    out.newSpeed = targetSpeed;
    return out;
}

} // namespace spindle::batch
