#pragma once

// Terminal presentation for the spindle CLI: colors, per-file status markers,
// the batch progress bar and aligned "key: value" lines. Header-only.

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>

#include <unistd.h>

namespace spindle::cli::ui {

namespace sgr {
inline constexpr const char* kReset = "\x1b[0m";
inline constexpr const char* kRed = "\x1b[31m";
inline constexpr const char* kGreen = "\x1b[32m";
inline constexpr const char* kYellow = "\x1b[33m";
inline constexpr const char* kBlue = "\x1b[34m";
inline constexpr const char* kCyan = "\x1b[36m";
} // namespace sgr

inline bool stdout_is_tty() {
    return ::isatty(::fileno(stdout)) != 0;
}

enum class ColorMode { Auto, ForceOn, ForceOff };

// Process-wide override; tests force colors off to compare plain text
inline ColorMode& color_mode() {
    static ColorMode mode = ColorMode::Auto;
    return mode;
}

inline void set_color_mode(ColorMode mode) {
    color_mode() = mode;
}

// Auto: honour NO_COLOR and TERM=dumb, otherwise color only on a terminal
inline bool colors_enabled() {
    switch (color_mode()) {
        case ColorMode::ForceOn:
            return true;
        case ColorMode::ForceOff:
            return false;
        case ColorMode::Auto:
            break;
    }
    if (std::getenv("NO_COLOR") != nullptr)
        return false;
    if (const char* term = std::getenv("TERM"); term != nullptr && std::string_view(term) == "dumb")
        return false;
    return stdout_is_tty();
}

inline std::string colorize(std::string_view text, const char* sgrCode) {
    std::string out;
    if (!colors_enabled() || sgrCode == nullptr) {
        out.assign(text);
        return out;
    }
    out.append(sgrCode).append(text).append(sgr::kReset);
    return out;
}

// Outcome of one program as shown in listings and summaries
enum class Tone { Ok, Warning, Error, Info };

inline std::string status(Tone tone, std::string_view text) {
    struct Style {
        const char* marker;
        const char* color;
    };
    static constexpr std::array<Style, 4> kStyles{{
        {"✓ ", sgr::kGreen},
        {"⚠ ", sgr::kYellow},
        {"✗ ", sgr::kRed},
        {"ℹ ", sgr::kBlue},
    }};
    const auto& style = kStyles[static_cast<std::size_t>(tone)];
    return colorize(std::string(style.marker).append(text), style.color);
}

inline std::string status_ok(std::string_view text) {
    return status(Tone::Ok, text);
}
inline std::string status_warning(std::string_view text) {
    return status(Tone::Warning, text);
}
inline std::string status_error(std::string_view text) {
    return status(Tone::Error, text);
}
inline std::string status_info(std::string_view text) {
    return status(Tone::Info, text);
}

// "[#####     ]" with `cells` cells; fraction is clamped to [0, 1]
inline std::string progress_bar(double fraction, std::size_t cells) {
    if (cells == 0)
        return {};
    const double clamped = std::clamp(fraction, 0.0, 1.0);
    const auto done = static_cast<std::size_t>(std::llround(clamped * static_cast<double>(cells)));
    return "[" + colorize(std::string(done, '#'), sgr::kGreen) + std::string(cells - done, ' ') +
           "]";
}

inline std::string key_value(std::string_view key, std::string_view value, int keyWidth = 0) {
    std::string label(key);
    if (keyWidth > 0 && label.size() < static_cast<std::size_t>(keyWidth))
        label.resize(static_cast<std::size_t>(keyWidth), ' ');
    return colorize(label, sgr::kCyan) + ": " + std::string(value);
}

} // namespace spindle::cli::ui
