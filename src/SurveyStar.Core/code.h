#pragma once
#include <compare>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>

namespace sstar::core {

/// @brief Coded attribute value, either a numeric or a symbolic code
///
/// @details Codebooks may mix integer codes with symbolic ones, while survey
/// extracts store most codes as integers. The Code type keeps the distinction
/// explicit and defines a total order: every numeric code sorts before every
/// symbolic code, numeric codes compare by value and symbolic codes compare
/// lexicographically.
class Code {
  public:
    /// @brief Initialises a new instance of the Code class, numeric zero.
    Code() = default;

    /// @brief Initialises a new numeric Code instance
    /// @param value The numeric code value
    explicit Code(std::int64_t value) noexcept;

    /// @brief Initialises a new symbolic Code instance
    /// @param symbol The symbolic code text
    explicit Code(std::string symbol) noexcept;

    /// @brief Converts a codebook text code to its Code equivalent.
    /// @param text The code text, leading and trailing white-spaces are ignored
    /// @return A numeric code if the whole text is a base-10 integer; otherwise, a symbolic code.
    static Code parse(std::string_view text);

    /// @brief Converts a fact relation cell value to its Code equivalent.
    /// @param value The cell value
    /// @return A numeric code for integral values; otherwise, a symbolic code.
    static Code from_value(double value);

    /// @brief Determines whether this is a numeric code
    /// @return true for numeric codes; otherwise, false.
    bool is_numeric() const noexcept;

    /// @brief Determines whether this is a symbolic code
    /// @return true for symbolic codes; otherwise, false.
    bool is_symbolic() const noexcept;

    /// @brief Gets the numeric code value
    /// @return The numeric value
    /// @throws std::bad_variant_access for symbolic codes.
    std::int64_t numeric() const;

    /// @brief Gets the symbolic code text
    /// @return The symbolic text
    /// @throws std::bad_variant_access for numeric codes.
    const std::string &symbol() const;

    /// @brief Convert this instance to a string representation
    /// @return The equivalent string representation
    std::string to_string() const;

    /// @brief Gets the code hash value
    /// @return The hash code value
    std::size_t hash() const noexcept;

    /// @brief Compare two Code instances
    /// @param rhs The Code to compare to this instance.
    /// @return The comparison result
    std::strong_ordering operator<=>(const Code &rhs) const noexcept;

    /// @brief Determines whether two codes have the same kind and value.
    /// @param rhs The Code to compare to this instance.
    /// @return true if the codes are the same; otherwise, false.
    bool operator==(const Code &rhs) const noexcept;

    /// @brief Output streams operator for Code type.
    /// @param stream The stream to output
    /// @param code The Code instance
    /// @return The output stream
    friend std::ostream &operator<<(std::ostream &stream, const Code &code);

  private:
    std::variant<std::int64_t, std::string> value_{std::int64_t{0}};
};

} // namespace sstar::core

namespace std {

/// @brief Hash code function for Code type to be used in unordered containers
template <> struct hash<sstar::core::Code> {
    size_t operator()(const sstar::core::Code &code) const noexcept { return code.hash(); }
};

} // namespace std
