#include "interval.h"
#include "string_util.h"

#include <cmath>
#include <stdexcept>

namespace sstar::core {

namespace {
double parse_bound(const std::string &text, const std::string_view &value) {
    auto consumed = std::size_t{};
    auto bound = 0.0;
    try {
        bound = std::stod(text, &consumed);
    } catch (const std::logic_error &e) {
        throw std::invalid_argument(
            fmt::format("Failed to parse interval bound '{}' in: '{}', {}", text, value, e.what()));
    }

    if (consumed != text.size() || !std::isfinite(bound)) {
        throw std::invalid_argument(
            fmt::format("Invalid interval bound '{}' in: '{}'", text, value));
    }

    return bound;
}
} // namespace

DoubleInterval parse_double_interval(const std::string_view &value, char delimiter) {
    auto text = trim(std::string{value});
    auto pos = text.size() > 1 ? text.find(delimiter, 1) : std::string::npos;
    if (pos == std::string::npos) {
        throw std::invalid_argument(
            fmt::format("Input value:'{}' does not have the right format: xx{}xx.", value,
                        delimiter));
    }

    auto lower = parse_bound(trim(text.substr(0, pos)), value);
    auto upper = parse_bound(trim(text.substr(pos + 1)), value);
    if (lower > upper) {
        throw std::invalid_argument(fmt::format("Inverted interval bounds in: '{}'", value));
    }

    return DoubleInterval{lower, upper};
}
} // namespace sstar::core
