#pragma once

#include <cstddef>
#include <future>
#include <numeric>
#include <vector>

#include <oneapi/tbb/parallel_for_each.h>

namespace sstar::core {

/// @brief Run a given function asynchronous
/// @tparam F Function type
/// @tparam ...Ts Function parameters type
/// @param action The action to run
/// @param ...params The action parameters
/// @return The std::future referring to the function call.
template <class F, class... Ts> auto run_async(F &&action, Ts &&...params) {
    return std::async(std::launch::async, std::forward<F>(action), std::forward<Ts>(params)...);
}

/// @brief Parallel for each over the half-open index range [first, last)
/// @tparam UnaryFunction Function type
/// @param first The first index
/// @param last One past the last index
/// @param func The function object to apply to each index
template <class UnaryFunction>
void parallel_for(std::size_t first, std::size_t last, UnaryFunction func) {
    if (last <= first) {
        return;
    }

    auto range = std::vector<std::size_t>(last - first);
    std::iota(range.begin(), range.end(), first);
    tbb::parallel_for_each(range.begin(), range.end(), std::move(func));
}

} // namespace sstar::core
