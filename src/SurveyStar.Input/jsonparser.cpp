#include "jsonparser.h"

namespace sstar::core {
void from_json(const nlohmann::json &j, Code &p) {
    if (j.is_number_integer()) {
        p = Code{j.get<std::int64_t>()};
    } else if (j.is_number()) {
        p = Code::from_value(j.get<double>());
    } else {
        p = Code::parse(j.get<std::string>());
    }
}

void to_json(nlohmann::json &j, const Code &p) {
    if (p.is_numeric()) {
        j = p.numeric();
    } else {
        j = p.symbol();
    }
}

void from_json(const nlohmann::json &j, DoubleInterval &p) {
    if (j.is_array()) {
        p = DoubleInterval{j.at(std::size_t{0}).get<double>(),
                           j.at(std::size_t{1}).get<double>()};
    } else {
        p = parse_double_interval(j.get<std::string>());
    }
}

void to_json(nlohmann::json &j, const DoubleInterval &p) {
    j = nlohmann::json::array({p.lower(), p.upper()});
}
} // namespace sstar::core

namespace sstar::input {
//--------------------------------------------------------
// Configuration sections POCO types mapping
//--------------------------------------------------------

// Data file information
void to_json(json &j, const FileInfo &p) {
    j = json{{"name", p.name}, {"delimiter", p.delimiter}, {"columns", p.columns}};
}

// Fact relation schema
void to_json(json &j, const SchemaInfo &p) {
    j = json{{"measures", p.measures}, {"exclude", p.exclude}};
}

void from_json(const json &j, SchemaInfo &p) {
    j.at("measures").get_to(p.measures);
    if (j.contains("exclude")) {
        j.at("exclude").get_to(p.exclude);
    }
}

// Bucket columns
void to_json(json &j, const BandInfo &p) { j = json{{"range", p.range}, {"label", p.label}}; }

void from_json(const json &j, BandInfo &p) {
    j.at("range").get_to(p.range);
    j.at("label").get_to(p.label);
}

void to_json(json &j, const FixedBucketInfo &p) {
    j = json{{"source", p.source},
             {"target", p.target},
             {"unknown_label", p.unknown_label},
             {"bands", p.bands}};
}

void from_json(const json &j, FixedBucketInfo &p) {
    j.at("source").get_to(p.source);
    j.at("target").get_to(p.target);
    p.unknown_label = j.value("unknown_label", std::string{"Unknown"});
    j.at("bands").get_to(p.bands);
}

void to_json(json &j, const FallbackBandInfo &p) {
    j = json{{"upper", nullptr}, {"label", p.label}};
    if (p.upper.has_value()) {
        j["upper"] = p.upper.value();
    }
}

void from_json(const json &j, FallbackBandInfo &p) {
    p.upper = std::nullopt;
    if (j.contains("upper") && !j.at("upper").is_null()) {
        p.upper = j.at("upper").get<double>();
    }

    j.at("label").get_to(p.label);
}

void to_json(json &j, const QuantileBucketInfo &p) {
    j = json{{"source", p.source},         {"target", p.target},
             {"quantiles", p.quantiles},   {"labels", p.labels},
             {"zero_label", p.zero_label}, {"missing_label", p.missing_label},
             {"fallback", p.fallback}};
}

void from_json(const json &j, QuantileBucketInfo &p) {
    j.at("source").get_to(p.source);
    j.at("target").get_to(p.target);
    j.at("quantiles").get_to(p.quantiles);
    j.at("labels").get_to(p.labels);
    p.zero_label = j.value("zero_label", std::string{"No Income"});
    p.missing_label = j.value("missing_label", std::string{"Unknown"});
    j.at("fallback").get_to(p.fallback);
}

void to_json(json &j, const BucketsInfo &p) {
    j = json{{"fixed", p.fixed}, {"quantile", p.quantile}};
}

void from_json(const json &j, BucketsInfo &p) {
    if (j.contains("fixed")) {
        j.at("fixed").get_to(p.fixed);
    }

    if (j.contains("quantile")) {
        j.at("quantile").get_to(p.quantile);
    }
}

// Weighted access analysis
void to_json(json &j, const ConditionInfo &p) {
    j = json{{"column", p.column}, {"value", p.value}, {"missing_sentinel", nullptr}};
    if (p.missing_sentinel.has_value()) {
        j["missing_sentinel"] = p.missing_sentinel.value();
    }
}

void from_json(const json &j, ConditionInfo &p) {
    j.at("column").get_to(p.column);
    if (j.contains("value")) {
        j.at("value").get_to(p.value);
    }

    p.missing_sentinel = std::nullopt;
    if (j.contains("missing_sentinel") && !j.at("missing_sentinel").is_null()) {
        p.missing_sentinel = j.at("missing_sentinel").get<core::Code>();
    }
}

void to_json(json &j, const AnalysisInfo &p) {
    j = json{{"weight", p.weight},       {"condition", p.condition},
             {"zero_weight", p.zero_weight}, {"order", p.order},
             {"dimensions", p.dimensions}};
}

void from_json(const json &j, AnalysisInfo &p) {
    j.at("weight").get_to(p.weight);
    j.at("condition").get_to(p.condition);
    p.zero_weight = j.value("zero_weight", std::string{"report_zero"});
    p.order = j.value("order", std::string{"descending"});
    j.at("dimensions").get_to(p.dimensions);
}

// Output information
void to_json(json &j, const OutputInfo &p) {
    j = json{{"folder", p.folder}, {"report", p.report}};
}

void from_json(const json &j, OutputInfo &p) {
    p.folder = j.value("folder", std::string{});
    p.report = j.value("report", true);
}
} // namespace sstar::input
