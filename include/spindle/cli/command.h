#pragma once

#include <string>
#include <CLI/CLI.hpp>
#include <spindle/core/types.h>

namespace spindle::cli {

class SpindleCLI;

/**
 * One `spindle <name>` subcommand.
 *
 * attach() adds the subcommand and its options to the CLI11 app; its parse
 * callback only marks the command pending. execute() runs after the effective
 * configuration has been loaded, and its error becomes the process's message
 * and exit code 1.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    virtual std::string name() const = 0;
    virtual std::string summary() const = 0;
    virtual void attach(CLI::App& app, SpindleCLI& cli) = 0;
    virtual Result<void> execute() = 0;
};

} // namespace spindle::cli
