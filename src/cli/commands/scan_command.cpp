#include <spdlog/spdlog.h>
#include <iostream>
#include <spindle/batch/batch_types.h>
#include <spindle/cli/command.h>
#include <spindle/cli/spindle_cli.h>
#include <spindle/cli/summary_renderer.h>
#include <spindle/cli/ui_helpers.hpp>
#include <spindle/gcode/speed_locator.h>
#include <spindle/io/atomic_rewriter.h>
#include <spindle/scan/path_scanner.h>

namespace spindle::cli {

/**
 * Read-only preview: lists every candidate program with the speed word the
 * update command would rewrite.
 */
class ScanCommand : public ICommand {
public:
    std::string name() const override { return "scan"; }

    std::string summary() const override {
        return "List G-code programs and their current spindle speed";
    }

    void attach(CLI::App& app, SpindleCLI& cli) override {
        cli_ = &cli;

        auto* cmd = app.add_subcommand("scan", summary());
        rootOpt_ = cmd->add_option("-r,--root", root_,
                                   "Directory to scan (default: the executable's directory)");

        cmd->callback([this]() { cli_->setPendingCommand(this); });
    }

    Result<void> execute() override {
        const auto& cfg = cli_->getConfig();
        const std::filesystem::path root =
            rootOpt_->count() > 0 ? std::filesystem::path(root_) : SpindleCLI::executableDirectory();

        scan::ScanOptions scanOpts;
        scanOpts.extension = cfg.fileExtension;
        gcode::LocatorOptions locOpts;
        locOpts.searchWindowLines = cfg.searchWindowLines;
        locOpts.stopAtMotion = cfg.stopAtMotion;

        auto cursor = scan::PathScanner(scanOpts).scan(root);
        if (!cursor) {
            return cursor.error();
        }

        gcode::SpeedTokenLocator locator(locOpts);
        json files = json::array();
        std::size_t found = 0;
        std::size_t unreadable = 0;
        const bool asJson = cli_->getJsonOutput();

        while (auto candidate = cursor.value().next()) {
            json entry;
            entry["path"] = candidate->path.string();

            auto text = io::readTextFile(candidate->path);
            if (!text) {
                ++unreadable;
                entry["error"] = errorCodeName(text.error().code);
                entry["reason"] = text.error().message;
                if (!asJson)
                    std::cout << ui::status_error(candidate->path.string()) << ": "
                              << text.error().message << "\n";
            } else if (auto match = locator.locate(candidate->path, text.value())) {
                ++found;
                entry["speed"] = speedToJson(match->currentSpeed);
                entry["line"] = match->lineIndex + 1;
                if (!asJson)
                    std::cout << ui::status_ok(candidate->path.string()) << ": S"
                              << match->literal << " (line " << match->lineIndex + 1 << ")\n";
            } else {
                entry["reason"] = batch::kNoMatchReason;
                if (!asJson)
                    std::cout << ui::status_info(candidate->path.string())
                              << ": " << batch::kNoMatchReason << "\n";
            }
            files.push_back(std::move(entry));
        }

        const std::size_t listed = files.size();
        const auto& diagnostics = cursor.value().diagnostics();
        if (asJson) {
            json out;
            out["root"] = root.string();
            out["files"] = std::move(files);
            json diags = json::array();
            for (const auto& d : diagnostics)
                diags.push_back({{"path", d.path.string()}, {"message", d.message}});
            out["diagnostics"] = std::move(diags);
            std::cout << out.dump(2) << std::endl;
        } else {
            for (const auto& d : diagnostics)
                std::cout << ui::status_warning(d.path.string()) << ": " << d.message << "\n";
            std::cout << listed << " file(s), " << found << " with a spindle speed, "
                      << unreadable << " unreadable\n";
        }

        spdlog::debug("[CLI] scan of '{}' listed {} file(s)", root.string(), listed);
        if (unreadable > 0) {
            cli_->setExitCode(1);
        }
        return Result<void>();
    }

private:
    SpindleCLI* cli_ = nullptr;
    std::string root_;
    CLI::Option* rootOpt_ = nullptr;
};

// Factory function
std::unique_ptr<ICommand> createScanCommand() {
    return std::make_unique<ScanCommand>();
}

} // namespace spindle::cli
