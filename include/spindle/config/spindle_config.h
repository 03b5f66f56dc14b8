#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <spindle/core/types.h>

namespace spindle::config {

/**
 * Effective engine settings.
 *
 * Defaults match the stock router profile: 1..24000 RPM, ".tap" programs,
 * a 50 line search window that also stops at the first motion command.
 */
struct SpindleConfig {
    double minRpm{1.0};
    double maxRpm{24000.0};
    std::string fileExtension{".tap"};
    std::size_t searchWindowLines{50}; // 0 = unbounded
    bool stopAtMotion{true};
    std::size_t concurrencyLimit{4};
    bool skipUnchanged{false};
    std::string logLevel{"warn"};

    // Path the values were read from; empty when only defaults apply
    std::filesystem::path sourcePath;
};

/**
 * Apply a flat "section.key" map (see parse_simple_toml_flat) on top of cfg.
 * Only keys under [spindle] and [logging] are consumed; others are ignored.
 */
Result<void> applyConfigMap(const std::map<std::string, std::string>& flat, SpindleConfig& cfg);

/**
 * Check cross-field invariants (min <= max, positive bounds, at least one worker).
 */
Result<void> validateConfig(const SpindleConfig& cfg);

/**
 * Load configuration: built-in defaults, then the TOML file (if present), then
 * SPINDLE_LOG_LEVEL from the environment. A missing file is not an error.
 */
Result<SpindleConfig> loadConfig(const std::filesystem::path& path);

} // namespace spindle::config
