#pragma once

#include "access_analysis.h"
#include "bucketizer.h"
#include "codebook.h"
#include "column_visitors.h"
#include "diagnostics.h"
#include "dimension_table.h"
#include "errors.h"
#include "fact_projector.h"
#include "star_schema.h"
#include "weighted_aggregator.h"

/// @brief Top-level namespace for the SurveyStar dimensional analysis engine
namespace sstar {}
