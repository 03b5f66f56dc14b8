#include <cmath>
#include <cstdint>
#include <ostream>
#include <spindle/cli/summary_renderer.h>
#include <spindle/cli/ui_helpers.hpp>
#include <spindle/gcode/speed_validator.h>

namespace spindle::cli {

json speedToJson(double speed) {
    if (std::isfinite(speed) && std::floor(speed) == speed && std::fabs(speed) < 9.0e15) {
        return static_cast<std::int64_t>(speed);
    }
    return speed;
}

json outcomeToJson(const batch::FileOutcome& outcome) {
    json j;
    j["path"] = outcome.filePath.string();
    j["status"] = batch::fileStatusToString(outcome.status);
    if (!outcome.reason.empty())
        j["reason"] = outcome.reason;
    if (outcome.oldSpeed)
        j["old_speed"] = speedToJson(*outcome.oldSpeed);
    if (outcome.newSpeed)
        j["new_speed"] = speedToJson(*outcome.newSpeed);
    if (outcome.lineIndex)
        j["line"] = *outcome.lineIndex + 1;
    if (outcome.error)
        j["error"] = errorCodeName(outcome.error->code);
    return j;
}

json summaryToJson(const batch::BatchSummary& summary) {
    json j;
    j["root"] = summary.rootPath.string();
    j["requested_speed"] = speedToJson(summary.requestedSpeed);
    j["discovered"] = summary.discovered;
    j["total"] = summary.total;
    j["updated"] = summary.updatedCount;
    j["skipped"] = summary.skippedCount;
    j["failed"] = summary.failedCount;
    j["cancelled"] = summary.cancelled;
    j["dry_run"] = summary.dryRun;
    j["elapsed_ms"] = summary.elapsed.count();

    json files = json::array();
    for (const auto& o : summary.outcomes)
        files.push_back(outcomeToJson(o));
    j["files"] = std::move(files);

    json diags = json::array();
    for (const auto& d : summary.diagnostics)
        diags.push_back({{"path", d.path.string()}, {"message", d.message}});
    j["diagnostics"] = std::move(diags);
    return j;
}

json configToJson(const config::SpindleConfig& cfg) {
    json j;
    j["source"] = cfg.sourcePath.empty() ? json(nullptr) : json(cfg.sourcePath.string());
    j["min_rpm"] = speedToJson(cfg.minRpm);
    j["max_rpm"] = speedToJson(cfg.maxRpm);
    j["file_extension"] = cfg.fileExtension;
    j["search_window_lines"] = cfg.searchWindowLines;
    j["stop_at_motion"] = cfg.stopAtMotion;
    j["concurrency_limit"] = cfg.concurrencyLimit;
    j["skip_unchanged"] = cfg.skipUnchanged;
    j["log_level"] = cfg.logLevel;
    return j;
}

void renderSummary(std::ostream& os, const batch::BatchSummary& summary, bool verbose) {
    for (const auto& o : summary.outcomes) {
        switch (o.status) {
            case batch::FileStatus::Failed:
                os << ui::status_error(o.filePath.string()) << ": " << o.reason << "\n";
                break;
            case batch::FileStatus::Updated:
                if (verbose) {
                    os << ui::status_ok(o.filePath.string()) << ": S"
                       << gcode::formatSpeed(o.oldSpeed.value_or(0.0)) << " -> S"
                       << gcode::formatSpeed(o.newSpeed.value_or(0.0)) << "\n";
                }
                break;
            case batch::FileStatus::Skipped:
                if (verbose) {
                    os << ui::status_info(o.filePath.string()) << ": " << o.reason << "\n";
                }
                break;
        }
    }
    for (const auto& d : summary.diagnostics) {
        os << ui::status_warning(d.path.string()) << ": " << d.message << "\n";
    }

    os << (summary.dryRun ? "Dry run: " : "") << "Processed " << summary.total << " of "
       << summary.discovered << " file(s) in " << summary.elapsed.count() << " ms: "
       << summary.updatedCount << (summary.dryRun ? " would be updated, " : " updated, ")
       << summary.skippedCount << " skipped, " << summary.failedCount << " failed\n";

    if (summary.cancelled) {
        os << ui::status_warning("Cancelled before all files were processed") << "\n";
    } else if (summary.failedCount == 0 && !summary.dryRun) {
        os << ui::status_ok("Spindle speed set to S" +
                            gcode::formatSpeed(summary.requestedSpeed))
           << "\n";
    }
}

} // namespace spindle::cli
