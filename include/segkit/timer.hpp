// MIT License
//
// Copyright (c) 2018 Michal Siedlaczek
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

//! \file
//! \author     Michal Siedlaczek
//! \copyright  MIT License

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <numeric>
#include <vector>

namespace sgk {

/// Runs `fn` and returns time of its execution.
///
/// # Examples
/// ```
/// auto slept_for = sgk::run_with_timer<std::chrono::seconds>([]() {});
/// ```
template<class Unit, class Function>
Unit run_with_timer(Function fn)
{
    auto start_time = std::chrono::steady_clock::now();
    fn();
    auto end_time = std::chrono::steady_clock::now();
    return std::chrono::duration_cast<Unit>(end_time - start_time);
}

/// Runs `fn`, passes its execution time to `handler`, and returns
/// the result of `fn`.
template<class Unit, class Function, class Handler>
auto run_with_timer(Function fn, Handler handler) -> decltype(fn())
{
    auto start_time = std::chrono::steady_clock::now();
    auto result = fn();
    auto end_time = std::chrono::steady_clock::now();
    handler(std::chrono::duration_cast<Unit>(end_time - start_time));
    return result;
}

//! Latency distribution of repeated executions.
struct latency_summary {
    std::size_t count = 0;
    double mean = 0.0;
    std::chrono::microseconds p50{0};
    std::chrono::microseconds p75{0};
    std::chrono::microseconds p90{0};
    std::chrono::microseconds p95{0};
    std::chrono::microseconds p99{0};
    std::chrono::microseconds max{0};
};

//! Computes the mean and nearest-rank percentiles of `times`.
inline latency_summary summarize(std::vector<std::chrono::microseconds> times)
{
    latency_summary summary;
    summary.count = times.size();
    if (times.empty()) { return summary; }
    std::sort(times.begin(), times.end());
    auto total = std::accumulate(
        times.begin(), times.end(), std::chrono::microseconds(0));
    summary.mean = static_cast<double>(total.count()) / times.size();
    auto percentile = [&times](std::size_t p) {
        std::size_t rank = (p * times.size() + 99) / 100;
        return times[std::max<std::size_t>(rank, 1) - 1];
    };
    summary.p50 = percentile(50);
    summary.p75 = percentile(75);
    summary.p90 = percentile(90);
    summary.p95 = percentile(95);
    summary.p99 = percentile(99);
    summary.max = times.back();
    return summary;
}

}  // namespace sgk
