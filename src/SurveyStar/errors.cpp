#include "errors.h"

#include <fmt/format.h>

namespace sstar {

MissingMeasureError::MissingMeasureError(std::string measure, const source_location location)
    : core::SurveyStarException{
          fmt::format("Required measure column '{}' not found in fact relation.", measure),
          location},
      measure_{std::move(measure)} {}

const std::string &MissingMeasureError::measure() const noexcept { return measure_; }

MalformedInputError::MalformedInputError(std::string entity, const std::string &reason,
                                         const source_location location)
    : core::SurveyStarException{fmt::format("Malformed {}: {}", entity, reason), location},
      entity_{std::move(entity)} {}

const std::string &MalformedInputError::entity() const noexcept { return entity_; }

} // namespace sstar
