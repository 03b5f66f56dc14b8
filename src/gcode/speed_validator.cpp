#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <spindle/gcode/speed_validator.h>

namespace spindle::gcode {

SpeedValidator::SpeedValidator(SpeedRange range) : range_(range) {}

Result<SpeedValidator> SpeedValidator::create(SpeedRange range) {
    if (!std::isfinite(range.minRpm) || !std::isfinite(range.maxRpm) || range.minRpm <= 0.0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid speed range [{}, {}]: bounds must be finite and "
                                 "greater than zero",
                                 range.minRpm, range.maxRpm)};
    }
    if (range.minRpm > range.maxRpm) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Invalid speed range: min_rpm {} exceeds max_rpm {}",
                                 range.minRpm, range.maxRpm)};
    }
    return SpeedValidator(range);
}

Result<double> SpeedValidator::validate(double speed) const {
    if (!std::isfinite(speed)) {
        spdlog::info("[SpeedValidator] Rejected non-finite speed");
        return Error{ErrorCode::InvalidSpeed, "Spindle speed must be a finite number"};
    }
    if (speed <= 0.0) {
        spdlog::info("[SpeedValidator] Rejected non-positive speed {}", speed);
        return Error{ErrorCode::InvalidSpeed,
                     fmt::format("Spindle speed must be greater than zero (got {})", speed)};
    }
    if (speed < range_.minRpm || speed > range_.maxRpm) {
        spdlog::info("[SpeedValidator] Rejected {} outside [{}, {}]", speed, range_.minRpm,
                     range_.maxRpm);
        return Error{ErrorCode::OutOfRangeSpeed,
                     fmt::format("Spindle speed must be between {} and {} RPM (got {})",
                                 formatSpeed(range_.minRpm), formatSpeed(range_.maxRpm),
                                 formatSpeed(speed))};
    }
    spdlog::debug("[SpeedValidator] Spindle speed validated: {}", speed);
    return speed;
}

Result<double> parseSpeed(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);

    if (text.empty()) {
        return Error{ErrorCode::InvalidSpeed, "Invalid input. Please enter a valid number"};
    }

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Error{ErrorCode::InvalidSpeed,
                     "Invalid input '" + std::string(text) + "'. Please enter a valid number"};
    }
    return value;
}

namespace {

// "1.25e-05" -> "0.0000125", "1e+16" -> "10000000000000000". The digits are
// the shortest round-trip ones fmt produced; only the point moves.
std::string expandExponent(const std::string& sci) {
    const auto e = sci.find_first_of("eE");
    if (e == std::string::npos)
        return sci;

    std::string mantissa = sci.substr(0, e);
    int exponent = 0;
    const char* expBegin = sci.data() + e + 1;
    if (*expBegin == '+')
        ++expBegin;
    (void)std::from_chars(expBegin, sci.data() + sci.size(), exponent);

    std::string sign;
    if (!mantissa.empty() && mantissa.front() == '-') {
        sign = "-";
        mantissa.erase(0, 1);
    }
    auto point = mantissa.find('.');
    int intDigits = static_cast<int>(point == std::string::npos ? mantissa.size() : point);
    if (point != std::string::npos)
        mantissa.erase(point, 1);

    const int newPoint = intDigits + exponent;
    std::string digits;
    if (newPoint <= 0) {
        digits = "0." + std::string(static_cast<std::size_t>(-newPoint), '0') + mantissa;
    } else if (static_cast<std::size_t>(newPoint) >= mantissa.size()) {
        digits = mantissa + std::string(static_cast<std::size_t>(newPoint) - mantissa.size(), '0');
    } else {
        digits = mantissa.substr(0, static_cast<std::size_t>(newPoint)) + "." +
                 mantissa.substr(static_cast<std::size_t>(newPoint));
    }
    return sign + digits;
}

} // namespace

std::string formatSpeed(double speed) {
    double integral = 0.0;
    if (std::isfinite(speed) && std::modf(speed, &integral) == 0.0 &&
        std::fabs(integral) < 9.0e15) {
        return fmt::format("{}", static_cast<std::int64_t>(integral));
    }
    if (!std::isfinite(speed))
        return fmt::format("{}", speed);
    // G-code literals have no exponent form
    return expandExponent(fmt::format("{}", speed));
}

} // namespace spindle::gcode
