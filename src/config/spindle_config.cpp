#include <spdlog/spdlog.h>
#include <charconv>
#include <cmath>
#include <spindle/config/config_helpers.h>
#include <spindle/config/spindle_config.h>

namespace spindle::config {

namespace {

Result<double> parseDouble(const std::string& key, const std::string& raw) {
    double v = 0.0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (raw.empty() || ec != std::errc{} || ptr != last || !std::isfinite(v)) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid numeric value for '" + key + "': '" + raw + "'"};
    }
    return v;
}

Result<std::size_t> parseCount(const std::string& key, const std::string& raw) {
    std::size_t v = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, v);
    if (raw.empty() || ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid count for '" + key + "': '" + raw + "'"};
    }
    return v;
}

Result<bool> parseFlag(const std::string& key, const std::string& raw) {
    bool v = false;
    if (!parse_bool(raw, v)) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid boolean for '" + key + "': '" + raw + "'"};
    }
    return v;
}

} // namespace

Result<void> applyConfigMap(const std::map<std::string, std::string>& flat, SpindleConfig& cfg) {
    for (const auto& [key, value] : flat) {
        if (key == "spindle.min_rpm") {
            auto r = parseDouble(key, value);
            if (!r)
                return r.error();
            cfg.minRpm = r.value();
        } else if (key == "spindle.max_rpm") {
            auto r = parseDouble(key, value);
            if (!r)
                return r.error();
            cfg.maxRpm = r.value();
        } else if (key == "spindle.file_extension") {
            if (value.empty()) {
                return Error{ErrorCode::InvalidArgument, "'spindle.file_extension' is empty"};
            }
            cfg.fileExtension = value;
        } else if (key == "spindle.search_window_lines") {
            auto r = parseCount(key, value);
            if (!r)
                return r.error();
            cfg.searchWindowLines = r.value();
        } else if (key == "spindle.stop_at_motion") {
            auto r = parseFlag(key, value);
            if (!r)
                return r.error();
            cfg.stopAtMotion = r.value();
        } else if (key == "spindle.concurrency_limit") {
            auto r = parseCount(key, value);
            if (!r)
                return r.error();
            cfg.concurrencyLimit = r.value();
        } else if (key == "spindle.skip_unchanged") {
            auto r = parseFlag(key, value);
            if (!r)
                return r.error();
            cfg.skipUnchanged = r.value();
        } else if (key == "logging.level") {
            cfg.logLevel = value;
        } else if (key.rfind("spindle.", 0) == 0) {
            spdlog::warn("[Config] Ignoring unknown key '{}'", key);
        }
    }
    return {};
}

Result<void> validateConfig(const SpindleConfig& cfg) {
    if (!(cfg.minRpm > 0.0)) {
        return Error{ErrorCode::InvalidArgument, "'spindle.min_rpm' must be greater than zero"};
    }
    if (cfg.minRpm > cfg.maxRpm) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("'spindle.min_rpm' ({}) is greater than 'spindle.max_rpm' ({})",
                                 cfg.minRpm, cfg.maxRpm)};
    }
    if (cfg.concurrencyLimit == 0) {
        return Error{ErrorCode::InvalidArgument, "'spindle.concurrency_limit' must be at least 1"};
    }
    if (cfg.fileExtension.empty() || cfg.fileExtension == ".") {
        return Error{ErrorCode::InvalidArgument, "'spindle.file_extension' must not be empty"};
    }
    return {};
}

Result<SpindleConfig> loadConfig(const std::filesystem::path& path) {
    SpindleConfig cfg;

    std::error_code ec;
    if (!path.empty() && std::filesystem::exists(path, ec)) {
        auto flat = parse_simple_toml_flat(path);
        auto applied = applyConfigMap(flat, cfg);
        if (!applied) {
            return Error{applied.error().code,
                         applied.error().message + " (in " + path.string() + ")"};
        }
        cfg.sourcePath = path;
        spdlog::debug("[Config] Loaded {} keys from {}", flat.size(), path.string());
    } else {
        spdlog::debug("[Config] No config file at '{}', using defaults", path.string());
    }

    if (const char* envLvl = std::getenv("SPINDLE_LOG_LEVEL"); envLvl && *envLvl) {
        cfg.logLevel = envLvl;
    }

    auto valid = validateConfig(cfg);
    if (!valid) {
        return valid.error();
    }
    return cfg;
}

} // namespace spindle::config
