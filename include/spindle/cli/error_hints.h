#pragma once
#include <array>
#include <string>
#include <string_view>
#include <spindle/core/types.h>

namespace spindle::cli {

struct ErrorHint {
    std::string hint;    // what the operator should check or change
    std::string command; // follow-up invocation, empty when none applies
};

namespace detail {

// OS and config messages are more specific than the code they arrive with
struct MessageRule {
    std::string_view needleA;
    std::string_view needleB;
    std::string_view hint;
    std::string_view command;
};

inline constexpr std::array<MessageRule, 3> kMessageRules{{
    {"Permission denied", "EACCES", "Check file/directory permissions", ""},
    {"No space left", "ENOSPC", "Disk is full; free up space next to the programs and retry", ""},
    {"spindle.", "logging.", "Fix the value in the config file or pass --config",
     "spindle config show"},
}};

} // namespace detail

/**
 * Pick a hint for a failed command. Known message fragments win; otherwise
 * the error code decides. `command` names the subcommand for --help hints.
 */
inline ErrorHint getErrorHint(ErrorCode code, std::string_view message,
                              std::string_view command = "") {
    for (const auto& rule : detail::kMessageRules) {
        if (message.find(rule.needleA) != std::string_view::npos ||
            message.find(rule.needleB) != std::string_view::npos)
            return {std::string(rule.hint), std::string(rule.command)};
    }

    switch (code) {
        case ErrorCode::InvalidSpeed:
            return {"Enter the speed as a positive number of RPM, e.g. 12000", ""};
        case ErrorCode::OutOfRangeSpeed:
            return {"Pick a speed inside the configured range or adjust [spindle] min_rpm/max_rpm",
                    "spindle config show"};
        case ErrorCode::FileNotFound:
            return {"Verify the directory exists and is accessible", "spindle scan --root <dir>"};
        case ErrorCode::PermissionDenied:
            return {"Check file/directory permissions", ""};
        case ErrorCode::IoError:
            return {"Check that the directory is readable", ""};
        case ErrorCode::WriteError:
            return {"Check write permission and free space in the program's directory", ""};
        case ErrorCode::InvalidArgument: {
            std::string help = "spindle ";
            if (!command.empty())
                help.append(command).append(" ");
            return {"Check command syntax", help + "--help"};
        }
        default:
            return {};
    }
}

// "<message>\n  Hint: ...\n  Try: ..." with the lines present only when known
inline std::string formatErrorWithHint(ErrorCode code, std::string_view message,
                                       std::string_view command = "") {
    const auto hint = getErrorHint(code, message, command);
    std::string text(message);
    if (hint.hint.empty())
        return text;
    text.append("\n  Hint: ").append(hint.hint);
    if (!hint.command.empty())
        text.append("\n  Try: ").append(hint.command);
    return text;
}

} // namespace spindle::cli
