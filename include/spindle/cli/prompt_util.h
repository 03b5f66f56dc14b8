/**
 * Interactive prompts used by the update command: the confirmation before a
 * batch rewrite and the speed entry when no speed argument was given.
 *
 * Streams default to std::cin/std::cout; tests pass string streams. EOF always
 * yields the configured default so a closed stdin never blocks or loops.
 */
#pragma once
#include <algorithm>
#include <cctype>
#include <functional>
#include <iostream>
#include <optional>
#include <string>

namespace spindle::cli {

namespace detail {

// Prints the prompt and reads one line with surrounding whitespace removed
inline std::optional<std::string> ask(const std::string& prompt, std::istream& in,
                                      std::ostream& out) {
    out << prompt << std::flush;
    std::string line;
    if (!std::getline(in, line))
        return std::nullopt;
    const auto first = line.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return std::string();
    const auto last = line.find_last_not_of(" \t\r\n");
    return line.substr(first, last - first + 1);
}

} // namespace detail

struct YesNoOptions {
    bool defaultYes{false};     // answer for empty input, EOF or (without retry) anything else
    bool retryOnInvalid{false}; // ask again on an answer that is neither yes nor no
};

/**
 * Accepts "y"/"yes" and "n"/"no" in any case.
 */
inline bool prompt_yes_no(const std::string& prompt, const YesNoOptions& opts = {},
                          std::istream& in = std::cin, std::ostream& out = std::cout) {
    for (;;) {
        auto answer = detail::ask(prompt, in, out);
        if (!answer || answer->empty())
            return opts.defaultYes;
        std::string word = *answer;
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (word == "y" || word == "yes")
            return true;
        if (word == "n" || word == "no")
            return false;
        if (!opts.retryOnInvalid)
            return opts.defaultYes;
    }
}

struct InputOptions {
    std::string defaultValue{};                          // returned on EOF, or on empty input when allowed
    bool allowEmpty{true};                               // otherwise empty input re-prompts
    std::function<bool(const std::string&)> validator{}; // rejects input and re-prompts
    std::string invalidMessage{};                        // printed before re-prompting
};

inline std::string prompt_input(const std::string& prompt, const InputOptions& opts = {},
                                std::istream& in = std::cin, std::ostream& out = std::cout) {
    for (;;) {
        auto answer = detail::ask(prompt, in, out);
        if (!answer)
            return opts.defaultValue;
        if (answer->empty()) {
            if (opts.allowEmpty)
                return opts.defaultValue;
            continue;
        }
        if (opts.validator && !opts.validator(*answer)) {
            if (!opts.invalidMessage.empty())
                out << opts.invalidMessage << "\n";
            continue;
        }
        return *answer;
    }
}

} // namespace spindle::cli
