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

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <segkit/index.hpp>
#include <segkit/timer.hpp>
#include "cli.hpp"

using namespace sgk::cli;

int main(int argc, char** argv)
{
    auto [app, args] = sgk::cli::app(
        "Merge all segments of an index into one, dropping deleted documents",
        existing_index_dir_opt{},
        verbose_opt{});
    CLI11_PARSE(*app, argc, argv);

    auto log = make_logger(args->verbose);
    try {
        auto index = sgk::index::open(args->index_dir);
        auto merged = sgk::run_with_timer<std::chrono::milliseconds>(
            [&]() { return index->merge(); }, log_finished{log});
        if (not merged) { log->info("Nothing to merge"); }
    } catch (const sgk::error& err) {
        log->critical("{}", err.what());
        return 1;
    }
    return 0;
}
