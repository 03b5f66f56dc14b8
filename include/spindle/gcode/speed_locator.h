#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace spindle::gcode {

// Half-open [begin, end) character range within one line
struct ColumnSpan {
    std::size_t begin{0};
    std::size_t end{0};

    std::size_t length() const { return end - begin; }
};

/**
 * Location of the initial spindle-speed word in a program.
 *
 * `columnSpan` covers only the numeric literal (never the command letter);
 * `offset` is the absolute byte position of columnSpan.begin in the file text.
 */
struct TokenMatch {
    std::filesystem::path filePath;
    std::size_t lineIndex{0}; // 0-based
    ColumnSpan columnSpan;
    std::size_t offset{0};
    double currentSpeed{0.0};
    std::string literal;
};

struct LocatorOptions {
    char commandLetter{'S'};
    std::size_t searchWindowLines{50}; // 0 = no line limit
    bool stopAtMotion{true};
};

/**
 * Finds the first spindle-speed word near the start of a G-code program.
 *
 * Lines are scanned the way a controller lexes a block: "( ... )" and ";"
 * comments are ignored and letters match case-insensitively. The search ends
 * after searchWindowLines lines or, when stopAtMotion is set, after the first
 * line carrying a feed move (G1/G2/G3), whichever comes first. A speed word on
 * that motion line itself is still found.
 */
class SpeedTokenLocator {
public:
    explicit SpeedTokenLocator(LocatorOptions options = {});

    std::optional<TokenMatch> locate(std::string_view text) const;

    std::optional<TokenMatch> locate(const std::filesystem::path& file,
                                     std::string_view text) const;

    /**
     * True when the line (comments excluded) carries a G1, G2 or G3 word.
     */
    static bool isMotionLine(std::string_view line);

    const LocatorOptions& options() const { return options_; }

private:
    std::optional<ColumnSpan> findWord(std::string_view line) const;

    LocatorOptions options_;
};

} // namespace spindle::gcode
