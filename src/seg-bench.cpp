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

#include <chrono>
#include <iostream>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

#include <segkit/index.hpp>
#include <segkit/query_executor.hpp>
#include <segkit/timer.hpp>
#include "cli.hpp"

using namespace sgk::cli;

struct repeat_opt {
    int repeat = 1;

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option("--repeat,-r", args->repeat, "Runs of each query")
            ->capture_default_str()
            ->check(CLI::PositiveNumber);
    }
};

int main(int argc, char** argv)
{
    auto [app, args] = sgk::cli::app(
        "Measure query latencies; queries are run concurrently",
        existing_index_dir_opt{},
        score_function_opt{},
        k_opt{},
        threads_opt{},
        repeat_opt{},
        default_field_opt{},
        verbose_opt{},
        queries_pos{});
    CLI11_PARSE(*app, argc, argv);

    auto log = make_logger(args->verbose);
    try {
        tbb::global_control control(
            tbb::global_control::max_allowed_parallelism, args->threads);
        auto index = sgk::index::open(args->index_dir);
        auto snapshot = index->snapshot();
        sgk::query_options options{args->parsed_score_function(), args->k};

        std::vector<sgk::query> queries;
        for_each_query(args->queries,
            std::cin,
            args->default_field,
            [&queries](const sgk::query& q) { queries.push_back(q); });
        std::vector<sgk::query> runs;
        for (int r = 0; r < args->repeat; ++r) {
            runs.insert(runs.end(), queries.begin(), queries.end());
        }
        log->info("Running {} queries on {} threads", runs.size(), args->threads);

        std::vector<std::chrono::microseconds> times(runs.size());
        std::vector<std::size_t> result_counts(runs.size());
        auto elapsed = sgk::run_with_timer<std::chrono::milliseconds>([&]() {
            tbb::parallel_for(tbb::blocked_range<std::size_t>(0, runs.size()),
                [&](const tbb::blocked_range<std::size_t>& range) {
                    for (auto idx = range.begin(); idx != range.end(); ++idx) {
                        times[idx] =
                            sgk::run_with_timer<std::chrono::microseconds>([&]() {
                                result_counts[idx] =
                                    sgk::execute(runs[idx], *snapshot, options)
                                        .size();
                            });
                    }
                });
        });
        log_finished{log}(elapsed);

        auto summary = sgk::summarize(times);
        std::cout << fmt::format("queries\t{}\n", summary.count)
                  << fmt::format("mean\t{:.1f}us\n", summary.mean)
                  << fmt::format("p50\t{}us\n", summary.p50.count())
                  << fmt::format("p75\t{}us\n", summary.p75.count())
                  << fmt::format("p90\t{}us\n", summary.p90.count())
                  << fmt::format("p95\t{}us\n", summary.p95.count())
                  << fmt::format("p99\t{}us\n", summary.p99.count())
                  << fmt::format("max\t{}us\n", summary.max.count());
    } catch (const sgk::error& err) {
        log->critical("{}", err.what());
        return 1;
    } catch (const std::invalid_argument& err) {
        log->critical("{}", err.what());
        return 1;
    }
    return 0;
}
