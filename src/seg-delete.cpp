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

#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <segkit/index.hpp>
#include "cli.hpp"

using namespace sgk::cli;

struct deletions_opt {
    std::vector<sgk::document_t> documents;
    std::vector<std::string> terms;
    std::vector<std::string> queries;

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option("--doc", args->documents, "Global document IDs");
        app.add_option("--term", args->terms, "Terms as field:token");
        app.add_option("--query", args->queries, "Queries in JSON");
    }
};

int main(int argc, char** argv)
{
    auto [app, args] = sgk::cli::app("Delete documents from an index",
        existing_index_dir_opt{},
        deletions_opt{},
        verbose_opt{});
    CLI11_PARSE(*app, argc, argv);

    auto log = make_logger(args->verbose);
    try {
        auto index = sgk::index::open(args->index_dir);
        for (auto doc : args->documents) {
            if (index->delete_document(doc)) {
                log->info("Deleted document {}", doc);
            } else {
                log->warn("No live document {}", doc);
            }
        }
        for (const auto& text : args->terms) {
            auto count = index->delete_term(term_argument(text));
            log->info("Deleted {} documents containing {}", count, text);
        }
        for (const auto& text : args->queries) {
            auto q = sgk::parse_query(text);
            if (not q) { throw std::invalid_argument(q.error()); }
            auto count = index->delete_query(*q);
            log->info("Deleted {} documents matching {}", count, text);
        }
    } catch (const sgk::error& err) {
        log->critical("{}", err.what());
        return 1;
    } catch (const std::invalid_argument& err) {
        log->critical("{}", err.what());
        return 1;
    }
    return 0;
}
