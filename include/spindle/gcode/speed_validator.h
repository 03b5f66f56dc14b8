#pragma once

#include <string>
#include <string_view>
#include <spindle/core/types.h>

namespace spindle::gcode {

// Inclusive accepted speed range in RPM
struct SpeedRange {
    double minRpm{1.0};
    double maxRpm{24000.0};
};

/**
 * Accepts a requested spindle speed when it lies within [minRpm, maxRpm].
 *
 * Non-finite, negative and zero speeds are always rejected with InvalidSpeed,
 * whatever the configured bounds; finite values outside the range fail with
 * OutOfRangeSpeed.
 */
class SpeedValidator {
public:
    explicit SpeedValidator(SpeedRange range);

    /**
     * Build a validator, rejecting ranges with a non-positive minimum or min > max.
     */
    static Result<SpeedValidator> create(SpeedRange range);

    Result<double> validate(double speed) const;

    const SpeedRange& range() const { return range_; }

private:
    SpeedRange range_;
};

/**
 * Parse operator input such as "12000" or " 8500.5 " into a number.
 * Fails with InvalidSpeed on empty input or trailing garbage; range checks are
 * left to SpeedValidator.
 */
Result<double> parseSpeed(std::string_view text);

/**
 * Canonical decimal representation written into programs: integral speeds
 * without a decimal point ("12000"), others in shortest round-trip digits.
 * Never uses exponent notation: 1e-05 is written "0.00001".
 */
std::string formatSpeed(double speed);

} // namespace spindle::gcode
