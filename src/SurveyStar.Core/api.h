#pragma once

#include "code.h"
#include "column_builder.h"
#include "column_numeric.h"
#include "datatable.h"
#include "exception.h"
#include "interval.h"
#include "scoped_timer.h"
#include "string_util.h"
#include "thread_util.h"
#include "version.h"
#include "visitor.h"

namespace sstar {
/// \brief Top-level namespace for SurveyStar Core C++ API
namespace core {}
} // namespace sstar
