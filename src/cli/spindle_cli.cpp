#include <spdlog/spdlog.h>
#include <array>
#include <cctype>
#include <iostream>
#include <utility>
#include <spindle/cli/command_registry.h>
#include <spindle/cli/error_hints.h>
#include <spindle/cli/spindle_cli.h>
#include <spindle/config/config_helpers.h>
#include <spindle/version.hpp>

namespace spindle::cli {

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& s) {
    using spdlog::level::level_enum;
    static constexpr std::array<std::pair<const char*, level_enum>, 11> kNames{{
        {"trace", level_enum::trace},
        {"debug", level_enum::debug},
        {"info", level_enum::info},
        {"warn", level_enum::warn},
        {"warning", level_enum::warn},
        {"error", level_enum::err},
        {"err", level_enum::err},
        {"critical", level_enum::critical},
        {"off", level_enum::off},
        {"none", level_enum::off},
        {"silent", level_enum::off},
    }};

    std::string lowered;
    for (char c : s)
        lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (const auto& [name, level] : kNames) {
        if (lowered == name)
            return level;
    }
    return std::nullopt;
}

SpindleCLI::SpindleCLI()
    : app_(std::make_unique<CLI::App>("Bulk spindle-speed editor for G-code programs", "spindle")) {
    app_->require_subcommand(1);
    app_->set_version_flag("--version", SPINDLE_VERSION_LONG_STRING);
    app_->add_option("--config", configPath_,
                     "Config file (default: $SPINDLE_CONFIG or ~/.config/spindle/config.toml)");
    app_->add_flag("-v,--verbose", verbose_, "Debug logging and per-file summary lines");
    app_->add_flag("--json", jsonOutput_, "Write results to stdout as JSON");

    commands_ = builtinCommands();
    for (auto& command : commands_)
        command->attach(*app_, *this);
}

SpindleCLI::~SpindleCLI() = default;

std::filesystem::path SpindleCLI::executableDirectory() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && !exe.empty())
        return exe.parent_path();
    auto cwd = std::filesystem::current_path(ec);
    return ec ? std::filesystem::path(".") : cwd;
}

Result<void> SpindleCLI::loadEffectiveConfig() {
    const auto path = config::get_config_path(configPath_);
    if (!configPath_.empty() && !std::filesystem::exists(path))
        return Error{ErrorCode::FileNotFound, "Config file not found: " + path.string()};

    auto loaded = config::loadConfig(path);
    if (!loaded)
        return loaded.error();
    config_ = std::move(loaded).value();

    // --verbose wins over SPINDLE_LOG_LEVEL, which loadConfig folded over [logging] level
    auto level = verbose_ ? std::optional(spdlog::level::debug) : parseLogLevel(config_.logLevel);
    if (!level) {
        spdlog::warn("[CLI] Unknown log level '{}', keeping 'warn'", config_.logLevel);
        level = spdlog::level::warn;
    }
    spdlog::set_level(*level);

    if (!config_.sourcePath.empty())
        spdlog::debug("[CLI] Loaded config from {}", config_.sourcePath.string());
    return {};
}

int SpindleCLI::reportFailure(const Error& error, const std::string& context) const {
    std::cerr << formatErrorWithHint(error.code, error.message, context) << "\n";
    return 1;
}

int SpindleCLI::run(int argc, char* argv[]) {
    try {
        app_->parse(argc, argv);

        if (auto loaded = loadEffectiveConfig(); !loaded)
            return reportFailure(loaded.error(), "config");

        if (pendingCommand_ != nullptr) {
            if (auto result = pendingCommand_->execute(); !result)
                return reportFailure(result.error(), pendingCommand_->name());
        }
        return exitCode_;
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    } catch (const std::exception& e) {
        spdlog::error("[CLI] Unexpected error: {}", e.what());
        std::cerr << "spindle: unexpected error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace spindle::cli
