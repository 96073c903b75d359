#pragma once
#include <chrono>
#include <string>

#include <fmt/core.h>

namespace sstar::core {

/// @brief Timer to printout scope execution time in milliseconds
class ScopedTimer {
  public:
    /// @brief The time measuring clock
    using ClockType = std::chrono::steady_clock;

    /// @brief Initialise a new instance of the ScopedTimer class.
    /// @param scope The scope name identification
    explicit ScopedTimer(std::string scope) : scope_{std::move(scope)}, start_{ClockType::now()} {}

    ScopedTimer(const ScopedTimer &) = delete;
    ScopedTimer(ScopedTimer &&) = delete;
    auto operator=(const ScopedTimer &) -> ScopedTimer & = delete;
    auto operator=(ScopedTimer &&) -> ScopedTimer & = delete;

    /// @brief Gets the elapsed time since construction
    /// @return The elapsed time in milliseconds
    double elapsed_ms() const {
        auto duration = std::chrono::duration<double, std::milli>(ClockType::now() - start_);
        return duration.count();
    }

    /// @brief Destroys the ScopedTimer instance, printout lifetime duration
    ~ScopedTimer() { fmt::print("{:.3f} ms {}\n", elapsed_ms(), scope_); }

  private:
    std::string scope_;
    const ClockType::time_point start_;
};

} // namespace sstar::core
