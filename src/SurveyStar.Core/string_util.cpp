#include "string_util.h"

#include <algorithm>
#include <cctype>

namespace sstar::core {

std::string trim(std::string value) noexcept {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.pop_back();
    }

    std::size_t pos = 0;
    while (pos < value.size() && std::isspace(static_cast<unsigned char>(value[pos]))) {
        ++pos;
    }

    return value.substr(pos);
}

std::string to_lower(const std::string_view &value) noexcept {
    std::string result = std::string(value);
    std::transform(value.begin(), value.end(), result.begin(),
                   [](char c) { return static_cast<char>(std::tolower(c)); });

    return result;
}

std::string to_upper(const std::string_view &value) noexcept {
    std::string result = std::string(value);
    std::transform(value.begin(), value.end(), result.begin(),
                   [](char c) { return static_cast<char>(std::toupper(c)); });

    return result;
}

std::vector<std::string_view> split_string(const std::string_view &value,
                                           std::string_view delims) noexcept {
    std::vector<std::string_view> output;
    std::size_t first = 0;

    while (first < value.size()) {
        const auto second = value.find_first_of(delims, first);
        if (first != second) {
            output.emplace_back(value.substr(first, second - first));
        }

        if (second == std::string_view::npos) {
            break;
        }

        first = second + 1;
    }

    return output;
}

std::string to_title_case(const std::string_view &identifier, std::string_view delims) {
    auto result = std::string{};
    for (const auto &word : split_string(identifier, delims)) {
        if (!result.empty()) {
            result.push_back(' ');
        }

        auto text = to_lower(word);
        text.front() = static_cast<char>(std::toupper(static_cast<unsigned char>(text.front())));
        result.append(text);
    }

    return result;
}

std::string quote_field(const std::string_view &text, char delimiter) {
    auto needs_quotes = std::any_of(text.cbegin(), text.cend(), [delimiter](char ch) {
        return ch == delimiter || ch == '"' || ch == '\r' || ch == '\n';
    });

    if (!needs_quotes) {
        return std::string{text};
    }

    auto quoted = std::string{"\""};
    for (const auto ch : text) {
        if (ch == '"') {
            quoted.push_back('"');
        }

        quoted.push_back(ch);
    }

    quoted.push_back('"');
    return quoted;
}

bool case_insensitive::comparator::operator()(const std::string_view &left,
                                              const std::string_view &right) const {
    return std::lexicographical_compare(
        left.cbegin(), left.cend(), right.cbegin(), right.cend(),
        [](char a, char b) { return std::tolower(a) < std::tolower(b); });
}

bool case_insensitive::equal_char(char left, char right) noexcept {
    return left == right || std::tolower(left) == std::tolower(right);
}

bool case_insensitive::equals(const std::string_view &left,
                              const std::string_view &right) noexcept {
    return left.size() == right.size() &&
           std::equal(left.cbegin(), left.cend(), right.cbegin(), right.cend(), equal_char);
}

int case_insensitive::index_of(const std::vector<std::string> &source,
                               const std::string_view &element) noexcept {
    auto it = std::find_if(source.cbegin(), source.cend(), [&element](const std::string &other) {
        return case_insensitive::equals(element, other);
    });

    if (it != source.cend()) {
        return static_cast<int>(std::distance(source.cbegin(), it));
    }

    return -1;
}
} // namespace sstar::core
