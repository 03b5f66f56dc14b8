#include <iostream>
#include <spindle/cli/command.h>
#include <spindle/cli/spindle_cli.h>
#include <spindle/cli/summary_renderer.h>
#include <spindle/cli/ui_helpers.hpp>
#include <spindle/config/config_helpers.h>
#include <spindle/gcode/speed_validator.h>

namespace spindle::cli {

class ConfigCommand : public ICommand {
public:
    std::string name() const override { return "config"; }

    std::string summary() const override { return "Inspect spindle configuration"; }

    void attach(CLI::App& app, SpindleCLI& cli) override {
        cli_ = &cli;

        auto* cmd = app.add_subcommand("config", summary());
        cmd->require_subcommand();

        auto* showCmd = cmd->add_subcommand("show", "Print the effective configuration");
        showCmd->callback([this]() { cli_->setPendingCommand(this); });

        auto* pathCmd = cmd->add_subcommand("path", "Print the config file location");
        pathCmd->callback([this]() {
            pathOnly_ = true;
            cli_->setPendingCommand(this);
        });
    }

    Result<void> execute() override {
        const auto& cfg = cli_->getConfig();

        if (pathOnly_) {
            std::cout << (cfg.sourcePath.empty() ? config::get_config_path() : cfg.sourcePath).string()
                      << "\n";
            return Result<void>();
        }

        if (cli_->getJsonOutput()) {
            std::cout << configToJson(cfg).dump(2) << std::endl;
            return Result<void>();
        }

        constexpr int kKeyWidth = 20;
        std::cout << ui::key_value("source",
                                   cfg.sourcePath.empty() ? "(defaults)" : cfg.sourcePath.string(),
                                   kKeyWidth)
                  << "\n";
        std::cout << ui::key_value("min_rpm", gcode::formatSpeed(cfg.minRpm), kKeyWidth) << "\n";
        std::cout << ui::key_value("max_rpm", gcode::formatSpeed(cfg.maxRpm), kKeyWidth) << "\n";
        std::cout << ui::key_value("file_extension", cfg.fileExtension, kKeyWidth) << "\n";
        std::cout << ui::key_value("search_window_lines",
                                   cfg.searchWindowLines == 0
                                       ? std::string("0 (whole file)")
                                       : std::to_string(cfg.searchWindowLines),
                                   kKeyWidth)
                  << "\n";
        std::cout << ui::key_value("stop_at_motion", cfg.stopAtMotion ? "true" : "false",
                                   kKeyWidth)
                  << "\n";
        std::cout << ui::key_value("concurrency_limit", std::to_string(cfg.concurrencyLimit),
                                   kKeyWidth)
                  << "\n";
        std::cout << ui::key_value("skip_unchanged", cfg.skipUnchanged ? "true" : "false",
                                   kKeyWidth)
                  << "\n";
        std::cout << ui::key_value("log_level", cfg.logLevel, kKeyWidth) << "\n";
        return Result<void>();
    }

private:
    SpindleCLI* cli_ = nullptr;
    bool pathOnly_ = false;
};

// Factory function
std::unique_ptr<ICommand> createConfigCommand() {
    return std::make_unique<ConfigCommand>();
}

} // namespace spindle::cli
