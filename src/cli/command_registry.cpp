#include <spindle/cli/command_registry.h>

namespace spindle::cli {

std::vector<std::unique_ptr<ICommand>> builtinCommands() {
    std::vector<std::unique_ptr<ICommand>> commands;
    commands.push_back(createUpdateCommand());
    commands.push_back(createScanCommand());
    commands.push_back(createConfigCommand());
    return commands;
}

} // namespace spindle::cli
