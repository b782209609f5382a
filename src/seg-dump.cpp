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

#include <iostream>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <segkit/index.hpp>
#include <segkit/postings.hpp>
#include "cli.hpp"

using namespace sgk::cli;

struct dump_opt {
    bool postings = false;
    std::string term;

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_flag("-p,--postings", args->postings, "Print postings");
        app.add_option("--term", args->term, "Only this term (field:token)");
    }
};

void print_postings(const sgk::segment_set::entry& entry, std::size_t term_idx)
{
    const auto& dict_entry = entry.reader.dictionary()[term_idx];
    std::cout << "  " << dict_entry.term << "\t" << dict_entry.info.length;
    for (const auto& p : entry.reader.postings(term_idx))
    {
        std::cout << ' ' << entry.base + p.document << ':' << p.frequency;
        if (not entry.reader.is_live(p.document)) { std::cout << '*'; }
    }
    std::cout << '\n';
}

int main(int argc, char** argv)
{
    auto [app, args] = sgk::cli::app("Print segments of an index",
        existing_index_dir_opt{},
        dump_opt{},
        verbose_opt{});
    CLI11_PARSE(*app, argc, argv);

    auto log = make_logger(args->verbose);
    try {
        auto index = sgk::index::open(args->index_dir);
        auto snapshot = index->snapshot();
        std::cout << "generation\t" << index->generation() << '\n'
                  << "documents\t" << snapshot->document_count() << '\n'
                  << "live\t" << snapshot->live_count() << '\n';
        for (const auto& entry : *snapshot)
        {
            std::cout << "segment " << entry.id << "\tbase " << entry.base
                      << "\tdocuments " << entry.reader.document_count()
                      << "\tlive " << entry.reader.live_count() << "\tterms "
                      << entry.reader.dictionary().size() << "\tpositions "
                      << std::boolalpha << entry.reader.has_positions()
                      << '\n';
            if (not args->term.empty())
            {
                if (auto idx = entry.reader.dictionary().index_of(
                        term_argument(args->term));
                    idx)
                {
                    print_postings(entry, *idx);
                }
            }
            else if (args->postings)
            {
                for (std::size_t idx = 0;
                     idx < entry.reader.dictionary().size();
                     ++idx)
                {
                    print_postings(entry, idx);
                }
            }
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
