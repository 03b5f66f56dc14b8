#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>
#include <CLI/CLI.hpp>
#include <spdlog/common.h>
#include <spindle/cli/command.h>
#include <spindle/config/spindle_config.h>

namespace spindle::cli {

// "debug", "WARN", "off", ... onto spdlog levels; nullopt for anything else
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& s);

/**
 * Front end of the spindle binary.
 *
 * run() parses argv, loads the effective configuration (file, environment,
 * then --verbose), applies the log level and executes the one subcommand the
 * parse selected. Commands read the shared state below through a reference
 * handed to ICommand::attach().
 */
class SpindleCLI {
public:
    SpindleCLI();
    ~SpindleCLI();

    SpindleCLI(const SpindleCLI&) = delete;
    SpindleCLI& operator=(const SpindleCLI&) = delete;

    // Process exit code: 0, or 1 on a command error or a partial batch failure
    int run(int argc, char* argv[]);

    const config::SpindleConfig& getConfig() const { return config_; }
    bool getVerbose() const { return verbose_; }
    bool getJsonOutput() const { return jsonOutput_; }

    // InterruptScope calls requestStop() on SIGINT/SIGTERM; batches poll the token
    std::stop_token getStopToken() const { return stopSource_.get_token(); }
    void requestStop() { stopSource_.request_stop(); }

    void setExitCode(int code) { exitCode_ = code; }
    void setPendingCommand(ICommand* cmd) { pendingCommand_ = cmd; }

    // Default scan root when --root is absent
    static std::filesystem::path executableDirectory();

private:
    Result<void> loadEffectiveConfig();
    int reportFailure(const Error& error, const std::string& context) const;

    std::unique_ptr<CLI::App> app_;
    std::vector<std::unique_ptr<ICommand>> commands_;

    config::SpindleConfig config_;
    std::string configPath_;
    bool verbose_ = false;
    bool jsonOutput_ = false;

    std::stop_source stopSource_;
    int exitCode_ = 0;
    ICommand* pendingCommand_ = nullptr;
};

} // namespace spindle::cli
