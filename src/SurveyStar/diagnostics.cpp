#include "diagnostics.h"

#include <fmt/color.h>

#include <algorithm>

namespace sstar {

std::string to_string(DiagnosticLevel level) {
    switch (level) {
    case DiagnosticLevel::info:
        return "info";
    case DiagnosticLevel::warning:
        return "warning";
    case DiagnosticLevel::error:
        return "error";
    default:
        return "unknown";
    }
}

std::string DiagnosticRecord::to_string() const {
    return fmt::format("[{}] {}: {}", sstar::to_string(level), source, message);
}

DiagnosticLog::DiagnosticLog(core::VerboseMode verbosity, bool echo)
    : verbosity_{verbosity}, echo_{echo} {}

void DiagnosticLog::add(DiagnosticRecord record) {
    std::scoped_lock lock(sync_mtx_);
    if (echo_) {
        print(record);
    }

    records_.emplace_back(std::move(record));
}

void DiagnosticLog::info(std::string source, std::string message) {
    add(DiagnosticRecord{DiagnosticLevel::info, std::move(source), std::move(message)});
}

void DiagnosticLog::warning(std::string source, std::string message) {
    add(DiagnosticRecord{DiagnosticLevel::warning, std::move(source), std::move(message)});
}

void DiagnosticLog::error(std::string source, std::string message) {
    add(DiagnosticRecord{DiagnosticLevel::error, std::move(source), std::move(message)});
}

std::vector<DiagnosticRecord> DiagnosticLog::records() const {
    std::scoped_lock lock(sync_mtx_);
    return records_;
}

std::size_t DiagnosticLog::count(DiagnosticLevel level) const {
    std::scoped_lock lock(sync_mtx_);
    return static_cast<std::size_t>(std::count_if(
        records_.cbegin(), records_.cend(), [level](const auto &r) { return r.level == level; }));
}

std::size_t DiagnosticLog::size() const {
    std::scoped_lock lock(sync_mtx_);
    return records_.size();
}

bool DiagnosticLog::has_errors() const { return count(DiagnosticLevel::error) > 0; }

void DiagnosticLog::clear() {
    std::scoped_lock lock(sync_mtx_);
    records_.clear();
}

core::VerboseMode DiagnosticLog::verbosity() const noexcept { return verbosity_; }

void DiagnosticLog::print(const DiagnosticRecord &record) const {
    switch (record.level) {
    case DiagnosticLevel::error:
        fmt::print(fg(fmt::color::red), "{}\n", record.to_string());
        break;
    case DiagnosticLevel::warning:
        fmt::print(fg(fmt::color::dark_salmon), "{}\n", record.to_string());
        break;
    default:
        if (verbosity_ == core::VerboseMode::verbose) {
            fmt::print(fg(fmt::color::cyan), "{}\n", record.to_string());
        }
        break;
    }
}

} // namespace sstar
