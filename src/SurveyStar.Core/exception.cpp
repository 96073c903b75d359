#include "exception.h"

#include <fmt/format.h>

namespace sstar::core {

SurveyStarException::SurveyStarException(const std::string &what_arg,
                                         const source_location location)
    : std::runtime_error{what_arg}, location_{location} {
    what_arg_ = fmt::format("{}:{}: {}", file_name(), line(), std::runtime_error::what());
}

const char *SurveyStarException::what() const noexcept { return what_arg_.c_str(); }

std::uint_least32_t SurveyStarException::line() const noexcept { return location_.line(); }

std::uint_least32_t SurveyStarException::column() const noexcept { return location_.column(); }

const char *SurveyStarException::file_name() const noexcept { return location_.file_name(); }

const char *SurveyStarException::function_name() const noexcept {
    return location_.function_name();
}

} // namespace sstar::core
