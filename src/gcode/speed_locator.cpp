#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>
#include <spindle/gcode/speed_locator.h>

namespace spindle::gcode {

namespace {

bool isAlpha(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

char upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

// Length of the unsigned decimal literal starting at pos (0 if none).
// Accepts "123", "123.", "123.45" and ".5"; requires at least one digit.
std::size_t literalLength(std::string_view line, std::size_t pos) {
    std::size_t i = pos;
    std::size_t digits = 0;
    while (i < line.size() && isDigit(line[i])) {
        ++i;
        ++digits;
    }
    if (i < line.size() && line[i] == '.') {
        ++i;
        while (i < line.size() && isDigit(line[i])) {
            ++i;
            ++digits;
        }
    }
    return digits == 0 ? 0 : i - pos;
}

// Calls fn(index) for every character outside "( ... )" and ";" comments.
template <typename Fn> void forEachCodeChar(std::string_view line, Fn&& fn) {
    bool inParen = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inParen) {
            if (c == ')')
                inParen = false;
            continue;
        }
        if (c == '(') {
            inParen = true;
            continue;
        }
        if (c == ';')
            return;
        if (!fn(i))
            return;
    }
}

} // namespace

SpeedTokenLocator::SpeedTokenLocator(LocatorOptions options) : options_(options) {
    options_.commandLetter = upper(options_.commandLetter);
}

bool SpeedTokenLocator::isMotionLine(std::string_view line) {
    bool motion = false;
    forEachCodeChar(line, [&](std::size_t i) {
        if (upper(line[i]) != 'G' || (i > 0 && isAlpha(line[i - 1])))
            return true;
        std::size_t len = literalLength(line, i + 1);
        if (len == 0)
            return true;
        std::string_view lit = line.substr(i + 1, len);
        if (lit.find('.') != std::string_view::npos)
            return true; // G38.2 and friends are not plain feed moves
        int code = -1;
        (void)std::from_chars(lit.data(), lit.data() + lit.size(), code);
        if (code >= 1 && code <= 3) {
            motion = true;
            return false;
        }
        return true;
    });
    return motion;
}

std::optional<ColumnSpan> SpeedTokenLocator::findWord(std::string_view line) const {
    std::optional<ColumnSpan> found;
    forEachCodeChar(line, [&](std::size_t i) {
        if (upper(line[i]) != options_.commandLetter)
            return true;
        if (i > 0 && isAlpha(line[i - 1]))
            return true;
        std::size_t len = literalLength(line, i + 1);
        if (len == 0)
            return true;
        found = ColumnSpan{i + 1, i + 1 + len};
        return false;
    });
    return found;
}

std::optional<TokenMatch> SpeedTokenLocator::locate(std::string_view text) const {
    std::size_t pos = 0;
    std::size_t lineIndex = 0;

    while (pos < text.size()) {
        if (options_.searchWindowLines != 0 && lineIndex >= options_.searchWindowLines)
            break;

        std::size_t eol = text.find_first_of("\r\n", pos);
        if (eol == std::string_view::npos)
            eol = text.size();
        std::string_view line = text.substr(pos, eol - pos);

        if (auto span = findWord(line)) {
            TokenMatch match;
            match.lineIndex = lineIndex;
            match.columnSpan = *span;
            match.offset = pos + span->begin;
            match.literal = std::string(line.substr(span->begin, span->length()));
            const char* first = match.literal.data();
            (void)std::from_chars(first, first + match.literal.size(), match.currentSpeed);
            return match;
        }

        if (options_.stopAtMotion && isMotionLine(line)) {
            spdlog::trace("[SpeedLocator] Motion at line {} ends the search window", lineIndex + 1);
            break;
        }

        // Advance past the terminator: "\r\n", "\n" or a lone "\r"
        pos = eol;
        if (pos < text.size() && text[pos] == '\r') {
            ++pos;
            if (pos < text.size() && text[pos] == '\n')
                ++pos;
        } else if (pos < text.size()) {
            ++pos;
        }
        ++lineIndex;
    }
    return std::nullopt;
}

std::optional<TokenMatch> SpeedTokenLocator::locate(const std::filesystem::path& file,
                                                    std::string_view text) const {
    auto match = locate(text);
    if (match)
        match->filePath = file;
    return match;
}

} // namespace spindle::gcode
