#pragma once

#include "SurveyStar.Core/exception.h"
#include "forward_type.h"

#include <fmt/format.h>
#include <string>
#include <string_view>

namespace sstar::core {

/// @brief Closed numeric range [lower, upper], e.g. an age band
/// @tparam TYPE The numerical type
template <Numerical TYPE> class Interval {
  public:
    /// @brief Initialises a new instance of the Interval class, the [0, 0] range
    Interval() = default;

    /// @brief Initialises a new instance of the Interval class
    /// @param lower_value Lower bound value, inclusive
    /// @param upper_value Upper bound value, inclusive
    /// @throws SurveyStarException for lower bound greater than upper bound.
    explicit Interval(TYPE lower_value, TYPE upper_value)
        : lower_{lower_value}, upper_{upper_value} {
        if (lower_ > upper_) {
            throw SurveyStarException(fmt::format("Invalid interval: {}-{}", lower_, upper_));
        }
    }

    TYPE lower() const noexcept { return lower_; }

    TYPE upper() const noexcept { return upper_; }

    TYPE length() const noexcept { return upper_ - lower_; }

    /// @brief Determines whether a value lies within the bounds, both inclusive.
    bool contains(TYPE value) const noexcept { return lower_ <= value && value <= upper_; }

    /// @brief Determines whether another range lies entirely within this one.
    bool contains(const Interval<TYPE> &other) const noexcept {
        return contains(other.lower_) && contains(other.upper_);
    }

    /// @brief Determines whether two ranges share at least one value.
    bool overlaps(const Interval<TYPE> &other) const noexcept {
        return lower_ <= other.upper_ && other.lower_ <= upper_;
    }

    /// @brief Gets the "lower-upper" text representation
    std::string to_string() const noexcept { return fmt::format("{}-{}", lower_, upper_); }

    auto operator<=>(const Interval<TYPE> &rhs) const = default;

  private:
    TYPE lower_{};
    TYPE upper_{};
};

/// @brief Continuous measure range, age and income bands
using DoubleInterval = Interval<double>;

/// @brief Converts a "lower-upper" text, e.g. "19-25" or "-1.5-0", to a DoubleInterval.
///
/// @details The delimiter is searched after the first character, so the lower
/// bound can carry a sign. Surrounding white space is ignored; any other trailing
/// text is rejected.
///
/// @param value The text to parse.
/// @param delimiter The bounds delimiter.
/// @return The new DoubleInterval instance.
/// @throws std::invalid_argument for text not in the lower-upper format or inverted bounds.
DoubleInterval parse_double_interval(const std::string_view &value, char delimiter = '-');
} // namespace sstar::core
