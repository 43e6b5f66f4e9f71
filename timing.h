#pragma once
#include <chrono>
#include <utility>

namespace geosync {

// Runs func(args...) and returns its result together with the wall time in seconds.
template<typename F, typename... Args>
auto measure_duration(F func, Args&&... args)
    -> std::pair<decltype(func(std::forward<Args>(args)...)), double> {
    auto start = std::chrono::steady_clock::now();
    auto result = func(std::forward<Args>(args)...);
    auto end = std::chrono::steady_clock::now();
    std::chrono::duration<double> elapsed = end - start;
    return {result, elapsed.count()};
}

} // namespace geosync
