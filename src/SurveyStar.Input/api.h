#pragma once

#include "codebook_parser.h"
#include "configuration.h"
#include "csvparser.h"
#include "poco.h"
#include "result_writer.h"

namespace sstar {
/// \brief SurveyStar external collaborators: file loaders, configuration and writers
namespace input {}
} // namespace sstar
