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
#include <string>

#include <CLI/CLI.hpp>
#include <boost/filesystem.hpp>
#include <spdlog/spdlog.h>

#include <segkit/index.hpp>
#include <segkit/segment_writer.hpp>
#include <segkit/timer.hpp>
#include "cli.hpp"

using namespace sgk::cli;

struct batch_opt {
    sgk::document_t batch_size = 100'000;
    bool positions = false;

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option("--batch-size,-b",
               args->batch_size,
               "Max number of documents to build in memory.")
            ->capture_default_str()
            ->check(CLI::PositiveNumber);
        app.add_flag("--positions",
            args->positions,
            "Store term positions (new index only).");
    }
};

int main(int argc, char** argv)
{
    auto [app, args] = sgk::cli::app(
        "Index JSON documents read from the standard input, one per line.",
        index_dir_opt{},
        batch_opt{},
        verbose_opt{});
    CLI11_PARSE(*app, argc, argv);

    auto log = make_logger(args->verbose);
    try {
        auto index = sgk::index::open_or_create(
            args->index_dir, sgk::index_options{args->positions});
        if (index->options().store_positions != args->positions) {
            log->warn("Index stores positions: {}; ignoring --positions",
                index->options().store_positions);
        }
        auto batch_size = args->batch_size;
        auto elapsed = sgk::run_with_timer<std::chrono::milliseconds>(
            [&]() {
                auto writer = index->writer();
                std::size_t total = 0;
                std::size_t line_number = 0;
                std::string line;
                while (std::getline(std::cin, line))
                {
                    ++line_number;
                    if (line.empty()) { continue; }
                    auto doc = parse_document(line);
                    if (not doc) {
                        log->error("Skipping line {}: {}", line_number, doc.error());
                        continue;
                    }
                    writer.add_document(*doc);
                    ++total;
                    if (writer.document_count() == batch_size) {
                        index->add_segment(std::move(writer));
                        writer = index->writer();
                    }
                }
                if (writer.document_count() > 0) {
                    index->add_segment(std::move(writer));
                }
                log->info("Indexed {} documents; the index has {} live documents",
                    total,
                    index->snapshot()->live_count());
            });
        log_finished{log}(elapsed);
    } catch (const sgk::error& err) {
        log->critical("{}", err.what());
        return 1;
    }
    return 0;
}
