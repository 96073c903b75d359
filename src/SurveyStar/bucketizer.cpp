#include "bucketizer.h"
#include "column_visitors.h"
#include "errors.h"

#include "SurveyStar.Core/column_numeric.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <stdexcept>

namespace sstar {

namespace {

std::optional<double> clamp_value(std::optional<double> value) {
    if (!value.has_value() || std::isnan(*value)) {
        return std::nullopt;
    }

    return std::max(*value, 0.0);
}

double interpolate_quantile(const std::vector<double> &sorted, double probability) {
    auto h = static_cast<double>(sorted.size() - 1) * probability;
    auto lower = static_cast<std::size_t>(std::floor(h));
    if (lower + 1 >= sorted.size()) {
        return sorted.back();
    }

    // exact order statistic, an infinite neighbour must not be weighted by zero
    auto fraction = h - static_cast<double>(lower);
    if (fraction == 0.0 || sorted[lower] == sorted[lower + 1]) {
        return sorted[lower];
    }

    return sorted[lower] + fraction * (sorted[lower + 1] - sorted[lower]);
}

const core::DataTableColumn &source_column(const core::DataTable &table,
                                           const std::string &source) {
    auto column = table.column_if_exists(source);
    if (!column.has_value()) {
        throw MalformedInputError("fact relation",
                                  fmt::format("bucket source column '{}' not found", source));
    }

    return column->get();
}

void append_labels(core::DataTable &table, const std::string &target,
                   std::vector<std::string> labels) {
    table.add(std::make_unique<core::StringDataTableColumn>(target, std::move(labels)));
}

} // namespace

std::vector<BucketBand> default_age_bands() {
    return {
        BucketBand{.range = core::DoubleInterval{0.0, 18.0}, .label = "0-18"},
        BucketBand{.range = core::DoubleInterval{19.0, 25.0}, .label = "19-25"},
        BucketBand{.range = core::DoubleInterval{26.0, 35.0}, .label = "26-35"},
        BucketBand{.range = core::DoubleInterval{36.0, 50.0}, .label = "36-50"},
        BucketBand{.range = core::DoubleInterval{51.0, 65.0}, .label = "51-65"},
        BucketBand{.range = core::DoubleInterval{66.0, 100.0}, .label = "65+"},
    };
}

FixedEdgeBucketizer::FixedEdgeBucketizer(std::vector<BucketBand> bands, std::string unknown_label)
    : bands_{std::move(bands)}, unknown_label_{std::move(unknown_label)} {
    if (bands_.empty()) {
        throw std::invalid_argument("Fixed-edge bucketizer requires at least one band.");
    }
}

const std::vector<BucketBand> &FixedEdgeBucketizer::bands() const noexcept { return bands_; }

const std::string &FixedEdgeBucketizer::unknown_label() const noexcept { return unknown_label_; }

std::vector<std::string> FixedEdgeBucketizer::labels() const {
    auto result = std::vector<std::string>{};
    for (const auto &band : bands_) {
        if (std::find(result.cbegin(), result.cend(), band.label) == result.cend()) {
            result.emplace_back(band.label);
        }
    }

    if (std::find(result.cbegin(), result.cend(), unknown_label_) == result.cend()) {
        result.emplace_back(unknown_label_);
    }

    return result;
}

std::string FixedEdgeBucketizer::assign(std::optional<double> value) const {
    auto clamped = clamp_value(value);
    if (!clamped.has_value()) {
        return unknown_label_;
    }

    for (const auto &band : bands_) {
        if (band.range.contains(*clamped)) {
            return band.label;
        }
    }

    return unknown_label_;
}

std::vector<std::string>
FixedEdgeBucketizer::assign(const std::vector<std::optional<double>> &values) const {
    auto result = std::vector<std::string>{};
    result.reserve(values.size());
    for (const auto &value : values) {
        result.emplace_back(assign(value));
    }

    return result;
}

std::vector<FallbackBand> default_fallback_bands() {
    return {
        FallbackBand{.upper_edge = 0.0, .label = "No Income"},
        FallbackBand{.upper_edge = 20000.0, .label = "Very Low"},
        FallbackBand{.upper_edge = 40000.0, .label = "Low"},
        FallbackBand{.upper_edge = 60000.0, .label = "Middle"},
        FallbackBand{.upper_edge = 100000.0, .label = "High"},
        FallbackBand{.upper_edge = std::numeric_limits<double>::infinity(), .label = "Very High"},
    };
}

std::string to_string(BucketingPath path) {
    switch (path) {
    case BucketingPath::quantile:
        return "quantile";
    case BucketingPath::fallback:
        return "fallback";
    default:
        return "unknown";
    }
}

QuantileBucketizer::QuantileBucketizer() : QuantileBucketizer(QuantileBucketOptions{}) {}

QuantileBucketizer::QuantileBucketizer(QuantileBucketOptions options)
    : options_{std::move(options)} {
    if (options_.quantiles < 1) {
        throw std::invalid_argument("Quantile bucketizer requires at least one quantile.");
    }

    if (options_.labels.size() != options_.quantiles) {
        throw std::invalid_argument(
            fmt::format("Quantile labels size mismatch, expected: {}, actual: {}.",
                        options_.quantiles, options_.labels.size()));
    }

    if (options_.fallback.empty() || !std::isinf(options_.fallback.back().upper_edge)) {
        throw std::invalid_argument("Fallback bands must end with an unbounded upper edge.");
    }

    auto unordered = std::adjacent_find(options_.fallback.cbegin(), options_.fallback.cend(),
                                        [](const auto &left, const auto &right) {
                                            return left.upper_edge >= right.upper_edge;
                                        });
    if (unordered != options_.fallback.cend()) {
        throw std::invalid_argument("Fallback bands upper edges must be strictly increasing.");
    }
}

const QuantileBucketOptions &QuantileBucketizer::options() const noexcept { return options_; }

std::optional<std::vector<double>>
QuantileBucketizer::try_quantile_edges(std::vector<double> positive) const {
    if (positive.empty()) {
        return std::nullopt;
    }

    std::sort(positive.begin(), positive.end());
    auto distinct = std::set<double>(positive.cbegin(), positive.cend());
    if (distinct.size() < options_.quantiles) {
        return std::nullopt;
    }

    auto edges = std::vector<double>{};
    edges.reserve(options_.quantiles + 1);
    for (std::size_t k = 0; k <= options_.quantiles; k++) {
        auto probability = static_cast<double>(k) / static_cast<double>(options_.quantiles);
        edges.emplace_back(interpolate_quantile(positive, probability));
    }

    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
    if (edges.size() < 2) {
        return std::nullopt;
    }

    return edges;
}

const std::string &QuantileBucketizer::fallback(double value) const {
    for (const auto &band : options_.fallback) {
        if (value <= band.upper_edge) {
            return band.label;
        }
    }

    return options_.fallback.back().label;
}

BucketingResult QuantileBucketizer::assign(const std::vector<std::optional<double>> &values) const {
    auto clamped = std::vector<std::optional<double>>{};
    clamped.reserve(values.size());
    auto positive = std::vector<double>{};
    for (const auto &value : values) {
        auto v = clamp_value(value);
        if (v.has_value() && *v > 0.0) {
            positive.emplace_back(*v);
        }

        clamped.emplace_back(v);
    }

    auto result = BucketingResult{};
    result.labels.reserve(values.size());
    if (positive.empty()) {
        result.path = BucketingPath::quantile;
        result.categories = {options_.zero_label, options_.missing_label};
        for (const auto &v : clamped) {
            result.labels.emplace_back(v.has_value() ? options_.zero_label
                                                     : options_.missing_label);
        }

        return result;
    }

    auto edges = try_quantile_edges(std::move(positive));
    if (!edges.has_value()) {
        result.path = BucketingPath::fallback;
        for (const auto &band : options_.fallback) {
            result.categories.emplace_back(band.label);
        }

        result.categories.emplace_back(options_.missing_label);
        for (const auto &v : clamped) {
            result.labels.emplace_back(v.has_value() ? fallback(*v) : options_.missing_label);
        }

        return result;
    }

    auto buckets = edges->size() - 1;
    result.path = BucketingPath::quantile;
    result.edges = std::move(edges.value());
    result.categories.emplace_back(options_.zero_label);
    result.categories.insert(result.categories.end(), options_.labels.cbegin(),
                             options_.labels.cbegin() + static_cast<std::ptrdiff_t>(buckets));
    result.categories.emplace_back(options_.missing_label);

    auto first_upper = result.edges.cbegin() + 1;
    for (const auto &v : clamped) {
        if (!v.has_value()) {
            result.labels.emplace_back(options_.missing_label);
        } else if (*v == 0.0) {
            result.labels.emplace_back(options_.zero_label);
        } else {
            auto it = std::lower_bound(first_upper, result.edges.cend(), *v);
            auto index = static_cast<std::size_t>(std::distance(first_upper, it));
            result.labels.emplace_back(options_.labels[std::min(index, buckets - 1)]);
        }
    }

    return result;
}

void add_bucket_column(core::DataTable &table, const std::string &source,
                       const std::string &target, const FixedEdgeBucketizer &bucketizer) {
    auto values = read_numeric(source_column(table, source));
    append_labels(table, target, bucketizer.assign(values));
}

BucketingPath add_bucket_column(core::DataTable &table, const std::string &source,
                                const std::string &target, const QuantileBucketizer &bucketizer,
                                DiagnosticLog &log) {
    auto result = bucketizer.assign(read_numeric(source_column(table, source)));
    if (result.path == BucketingPath::fallback) {
        log.warning("Bucketizer",
                    fmt::format("Quantile bucketing of {} not feasible for {} quantiles, using "
                                "fallback bands.",
                                source, bucketizer.options().quantiles));
    } else {
        log.info("Bucketizer", fmt::format("Quantile bucketing of {} into {} bucket(s).", source,
                                           result.edges.empty() ? 0 : result.edges.size() - 1));
    }

    append_labels(table, target, std::move(result.labels));
    return result.path;
}

} // namespace sstar
