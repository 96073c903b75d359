#pragma once

#include "SurveyStar.Core/exception.h"

#include <string>

namespace sstar {

/// @brief Fatal error raised when a required measure column is absent from the fact relation
class MissingMeasureError : public core::SurveyStarException {
  public:
    /// @brief Initialises a new instance of the MissingMeasureError class.
    /// @param measure The missing measure column name
    /// @param location Source location (defaults to current location)
    explicit MissingMeasureError(std::string measure,
                                 const source_location location = source_location::current());

    /// @brief Gets the missing measure column name
    /// @return The column name
    const std::string &measure() const noexcept;

  private:
    std::string measure_;
};

/// @brief Fatal error raised for a structurally malformed fact relation or codebook
class MalformedInputError : public core::SurveyStarException {
  public:
    /// @brief Initialises a new instance of the MalformedInputError class.
    /// @param entity The malformed entity identification
    /// @param reason The reason the entity is malformed
    /// @param location Source location (defaults to current location)
    MalformedInputError(std::string entity, const std::string &reason,
                        const source_location location = source_location::current());

    /// @brief Gets the malformed entity identification
    /// @return The entity identification
    const std::string &entity() const noexcept;

  private:
    std::string entity_;
};

} // namespace sstar
