#pragma once

#include <memory>
#include <vector>
#include <spindle/cli/command.h>

namespace spindle::cli {

// Factories defined next to each command implementation
std::unique_ptr<ICommand> createUpdateCommand();
std::unique_ptr<ICommand> createScanCommand();
std::unique_ptr<ICommand> createConfigCommand();

// Every subcommand the spindle binary offers, in help order
std::vector<std::unique_ptr<ICommand>> builtinCommands();

} // namespace spindle::cli
