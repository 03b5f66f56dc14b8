#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <iostream>
#include <spindle/batch/batch_orchestrator.h>
#include <spindle/cli/command.h>
#include <spindle/cli/progress_indicator.h>
#include <spindle/cli/prompt_util.h>
#include <spindle/cli/spindle_cli.h>
#include <spindle/cli/summary_renderer.h>
#include <spindle/gcode/speed_validator.h>

#include <unistd.h>

namespace spindle::cli {

class UpdateCommand : public ICommand {
public:
    std::string name() const override { return "update"; }

    std::string summary() const override {
        return "Set the spindle speed in every G-code program under a directory";
    }

    void attach(CLI::App& app, SpindleCLI& cli) override {
        cli_ = &cli;

        auto* cmd = app.add_subcommand("update", summary());
        cmd->add_option("speed", speed_, "New spindle speed in RPM (prompted when omitted)");
        rootOpt_ = cmd->add_option("-r,--root", root_,
                                   "Directory to process (default: the executable's directory)");

        cmd->add_flag("-y,--yes", yes_, "Skip confirmation prompt");
        cmd->add_flag("--dry-run", dryRun_, "Report what would change without writing");
        cmd->add_flag("--skip-unchanged", skipUnchanged_,
                      "Leave files that already carry the requested speed untouched");

        jobsOpt_ = cmd->add_option("-j,--jobs", jobs_, "Files processed concurrently")
                       ->check(CLI::PositiveNumber);
        minOpt_ = cmd->add_option("--min-rpm", minRpm_, "Lowest accepted speed");
        maxOpt_ = cmd->add_option("--max-rpm", maxRpm_, "Highest accepted speed");
        extOpt_ = cmd->add_option("--ext", ext_, "Program file extension (e.g. .tap, .nc)");
        windowOpt_ = cmd->add_option("--window", window_,
                                     "Lines searched for the speed word (0 = whole file)");
        cmd->add_flag("--no-motion-stop", noMotionStop_,
                      "Keep searching past the first feed move");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        auto cfg = effectiveConfig();
        if (!cfg) {
            return cfg.error();
        }
        auto options = batch::BatchOptions::fromConfig(cfg.value());
        options.dryRun = dryRun_;

        auto speed = requestedSpeed();
        if (!speed) {
            return speed.error();
        }

        // Reject bad speeds before anything is scanned or prompted
        auto validator = gcode::SpeedValidator::create(options.range);
        if (!validator) {
            return validator.error();
        }
        auto checked = validator.value().validate(speed.value());
        if (!checked) {
            return checked.error();
        }

        const std::filesystem::path root =
            rootOpt_->count() > 0 ? std::filesystem::path(root_) : SpindleCLI::executableDirectory();
        spdlog::debug("[CLI] update root='{}' speed={} jobs={} dry_run={}", root.string(),
                      gcode::formatSpeed(checked.value()), options.concurrencyLimit, dryRun_);

        if (!yes_ && !dryRun_) {
            auto question = fmt::format("Update spindle speed to {} RPM in all {} files under '{}'? "
                                        "[y/N] ",
                                        gcode::formatSpeed(checked.value()),
                                        options.scan.extension, root.string());
            if (!prompt_yes_no(question)) {
                std::cout << "Aborted, no files were changed.\n";
                return Result<void>();
            }
        }

        const bool json = cli_->getJsonOutput();
        ProgressIndicator progress;
        if (!json) {
            progress.start("Updating");
        }
        auto onProgress = [&progress](const batch::ProgressEvent& ev) {
            progress.update(ev.completed, ev.discovered, ev.path.filename().string());
        };

        batch::BatchOrchestrator orchestrator(options);
        auto result = orchestrator.run(batch::Job{root, checked.value()}, cli_->getStopToken(),
                                       json ? batch::ProgressCallback{} : onProgress);
        progress.stop();
        if (!result) {
            return result.error();
        }

        const auto& summary = result.value();
        if (json) {
            std::cout << summaryToJson(summary).dump(2) << std::endl;
        } else {
            renderSummary(std::cout, summary, cli_->getVerbose());
        }

        if (summary.failedCount > 0 || summary.cancelled) {
            cli_->setExitCode(1);
        }
        return Result<void>();
    }

private:
    Result<config::SpindleConfig> effectiveConfig() const {
        config::SpindleConfig cfg = cli_->getConfig();
        if (minOpt_->count() > 0)
            cfg.minRpm = minRpm_;
        if (maxOpt_->count() > 0)
            cfg.maxRpm = maxRpm_;
        if (extOpt_->count() > 0)
            cfg.fileExtension = ext_;
        if (windowOpt_->count() > 0)
            cfg.searchWindowLines = window_;
        if (jobsOpt_->count() > 0)
            cfg.concurrencyLimit = jobs_;
        if (noMotionStop_)
            cfg.stopAtMotion = false;
        if (skipUnchanged_)
            cfg.skipUnchanged = true;

        auto valid = config::validateConfig(cfg);
        if (!valid) {
            return valid.error();
        }
        return cfg;
    }

    Result<double> requestedSpeed() const {
        if (!speed_.empty()) {
            return gcode::parseSpeed(speed_);
        }
        if (!::isatty(STDIN_FILENO)) {
            return Error{ErrorCode::InvalidSpeed, "No spindle speed given"};
        }

        InputOptions in;
        in.allowEmpty = false;
        in.validator = [](const std::string& s) { return gcode::parseSpeed(s).has_value(); };
        in.invalidMessage = "Invalid input. Please enter a valid number";
        auto line = prompt_input("Enter the desired spindle speed: ", in);
        if (line.empty()) {
            return Error{ErrorCode::InvalidSpeed, "No spindle speed given"};
        }
        return gcode::parseSpeed(line);
    }

    SpindleCLI* cli_ = nullptr;

    std::string speed_;
    std::string root_;
    bool yes_ = false;
    bool dryRun_ = false;
    bool skipUnchanged_ = false;
    bool noMotionStop_ = false;
    std::size_t jobs_ = 0;
    double minRpm_ = 0.0;
    double maxRpm_ = 0.0;
    std::string ext_;
    std::size_t window_ = 0;

    CLI::Option* rootOpt_ = nullptr;
    CLI::Option* jobsOpt_ = nullptr;
    CLI::Option* minOpt_ = nullptr;
    CLI::Option* maxOpt_ = nullptr;
    CLI::Option* extOpt_ = nullptr;
    CLI::Option* windowOpt_ = nullptr;
};

// Factory function
std::unique_ptr<ICommand> createUpdateCommand() {
    return std::make_unique<UpdateCommand>();
}

} // namespace spindle::cli
