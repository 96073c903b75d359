#include "code.h"
#include "string_util.h"

#include <fmt/format.h>

#include <charconv>
#include <cmath>
#include <limits>

namespace sstar::core {

Code::Code(std::int64_t value) noexcept : value_{value} {}

Code::Code(std::string symbol) noexcept : value_{std::move(symbol)} {}

Code Code::parse(std::string_view text) {
    auto trimmed = trim(std::string{text});
    auto digits = std::string_view{trimmed};
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }

    if (!digits.empty()) {
        std::int64_t value{};
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
        if (ec == std::errc{} && ptr == digits.data() + digits.size()) {
            return Code{value};
        }
    }

    return Code{std::move(trimmed)};
}

Code Code::from_value(double value) {
    constexpr auto lowest = static_cast<double>(std::numeric_limits<std::int64_t>::lowest());
    constexpr auto highest = static_cast<double>(std::numeric_limits<std::int64_t>::max());
    if (std::isfinite(value) && value == std::trunc(value) && value >= lowest && value < highest) {
        return Code{static_cast<std::int64_t>(value)};
    }

    return Code{fmt::format("{}", value)};
}

bool Code::is_numeric() const noexcept { return std::holds_alternative<std::int64_t>(value_); }

bool Code::is_symbolic() const noexcept { return std::holds_alternative<std::string>(value_); }

std::int64_t Code::numeric() const { return std::get<std::int64_t>(value_); }

const std::string &Code::symbol() const { return std::get<std::string>(value_); }

std::string Code::to_string() const {
    if (is_numeric()) {
        return std::to_string(std::get<std::int64_t>(value_));
    }

    return std::get<std::string>(value_);
}

std::size_t Code::hash() const noexcept {
    return std::hash<std::variant<std::int64_t, std::string>>{}(value_);
}

std::strong_ordering Code::operator<=>(const Code &rhs) const noexcept {
    if (is_numeric() != rhs.is_numeric()) {
        return is_numeric() ? std::strong_ordering::less : std::strong_ordering::greater;
    }

    if (is_numeric()) {
        return std::get<std::int64_t>(value_) <=> std::get<std::int64_t>(rhs.value_);
    }

    auto cmp = std::get<std::string>(value_).compare(std::get<std::string>(rhs.value_));
    if (cmp < 0) {
        return std::strong_ordering::less;
    }

    return cmp > 0 ? std::strong_ordering::greater : std::strong_ordering::equal;
}

bool Code::operator==(const Code &rhs) const noexcept { return value_ == rhs.value_; }

std::ostream &operator<<(std::ostream &stream, const Code &code) {
    stream << code.to_string();
    return stream;
}

} // namespace sstar::core
