#pragma once

#include <nlohmann/json.hpp>
#include <iosfwd>
#include <spindle/batch/batch_types.h>
#include <spindle/config/spindle_config.h>

namespace spindle::cli {

using json = nlohmann::json;

// Integral speeds are emitted as JSON integers, others as floats
json speedToJson(double speed);

json outcomeToJson(const batch::FileOutcome& outcome);

/**
 * Machine-readable summary: counts, flags, per-file outcomes in discovery order
 * and scan diagnostics. Failed outcomes carry "error" (stable code name) and
 * "reason".
 */
json summaryToJson(const batch::BatchSummary& summary);

json configToJson(const config::SpindleConfig& cfg);

/**
 * Human-readable summary. Failed files are always listed; updated and skipped
 * files only when verbose.
 */
void renderSummary(std::ostream& os, const batch::BatchSummary& summary, bool verbose);

} // namespace spindle::cli
