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
//! \author Michal Siedlaczek
//! \copyright MIT License

#pragma once

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <tbb/info.h>

#include <segkit/io.hpp>
#include <segkit/query.hpp>
#include <segkit/score.hpp>
#include <segkit/timer.hpp>
#include <segkit/types.hpp>

namespace sgk::cli {

template<class... Options>
class args : public Options... {
public:
    args(Options... opts) : Options(opts)... {}
};

template<typename T>
struct with_default {
    T value;
};

struct index_dir_opt {
    std::string index_dir;

    index_dir_opt(std::string default_dir = ".")
        : index_dir(std::move(default_dir))
    {}

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option("-d,--index-dir", args->index_dir, "Index directory")
            ->capture_default_str();
    }
};

struct existing_index_dir_opt : index_dir_opt {
    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option("-d,--index-dir", args->index_dir, "Index directory")
            ->capture_default_str()
            ->check(CLI::ExistingDirectory);
    }
};

struct score_function_opt {
    std::string score_function;

    score_function_opt(with_default<std::string> default_val = {"tf"})
        : score_function(default_val.value)
    {}

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option("--score", args->score_function, "Score function")
            ->capture_default_str()
            ->check(CLI::IsMember({"none", "tf"}));
    }

    score::score_function parsed_score_function() const
    {
        return score::parse_score_function(score_function).value();
    }
};

struct k_opt {
    std::size_t k = 0;

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option(
               "-k", args->k, "Number of documents to retrieve (0: all)")
            ->capture_default_str();
    }
};

struct threads_opt {
    int threads = tbb::info::default_concurrency();

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option("--threads,-j", args->threads, "Number of threads")
            ->capture_default_str()
            ->check(CLI::PositiveNumber);
    }
};

struct default_field_opt {
    std::string default_field;

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option("--default-field",
            args->default_field,
            "Field of query terms given without one");
    }
};

struct verbose_opt {
    bool verbose = false;

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_flag("-v,--verbose", args->verbose, "Log debug messages");
    }
};

struct queries_pos {
    std::vector<std::string> queries;

    template<class Args>
    void set(CLI::App& app, Args& args)
    {
        app.add_option("queries",
            args->queries,
            "JSON queries; read from stdin, one per line, if none given");
    }
};

template<class... Options>
inline std::pair<std::unique_ptr<CLI::App>, std::unique_ptr<args<Options...>>>
app(const std::string& description, Options... options)
{
    auto app = std::make_unique<CLI::App>(description);
    auto a = std::make_unique<args<Options...>>(options...);
    (options.set(*app, a), ...);
    return std::make_pair(std::move(app), std::move(a));
}

//! Registers the library logger, writing to stderr.
inline std::shared_ptr<spdlog::logger> make_logger(bool verbose)
{
    auto log = spdlog::stderr_color_mt("segkit");
    log->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    return log;
}

//! Reads a document from a JSON object of fields.
/*!
 * A field value is either a string, tokenized on white spaces, or an array
 * of tokens. Fields keep the order of the input.
 */
inline nonstd::expected<document, std::string>
parse_document(const std::string& line)
{
    nlohmann::ordered_json jdoc;
    try {
        jdoc = nlohmann::ordered_json::parse(line);
    } catch (const nlohmann::json::parse_error& err) {
        return nonstd::make_unexpected(
            fmt::format("invalid document JSON: {}", err.what()));
    }
    if (not jdoc.is_object()) {
        return nonstd::make_unexpected("document must be a JSON object");
    }
    document doc;
    for (auto it = jdoc.begin(); it != jdoc.end(); ++it)
    {
        const auto& value = it.value();
        if (value.is_string()) {
            doc.add(it.key(), io::tokenize(value.get<std::string>()));
        } else if (value.is_array()) {
            std::vector<std::string> tokens;
            for (const auto& token : value) {
                if (not token.is_string()) {
                    return nonstd::make_unexpected(
                        fmt::format("tokens of {} must be strings", it.key()));
                }
                tokens.push_back(token.get<std::string>());
            }
            doc.add(it.key(), std::move(tokens));
        } else {
            return nonstd::make_unexpected(fmt::format(
                "field {} must be a string or an array", it.key()));
        }
    }
    return doc;
}

//! Calls `fn(query)` for each query given as argument, or else for each
//! non-empty line of `in`.
template<class Fn>
void for_each_query(const std::vector<std::string>& queries,
    std::istream& in,
    const std::string& default_field,
    Fn fn)
{
    auto run = [&](const std::string& text) {
        auto q = parse_query(text, default_field);
        if (not q) { throw std::invalid_argument(q.error()); }
        fn(*q);
    };
    if (not queries.empty()) {
        for (const auto& text : queries) { run(text); }
        return;
    }
    std::string line;
    while (std::getline(in, line)) {
        if (not line.empty()) { run(line); }
    }
}

//! Parses `field:token`.
//!
//! \throws std::invalid_argument   if the term is malformed
inline term term_argument(const std::string& text)
{
    auto t = sgk::parse_term(text);
    if (not t) { throw std::invalid_argument(t.error()); }
    return std::move(*t);
}

struct log_finished {
    std::shared_ptr<spdlog::logger> log;
    template<class Unit>
    void operator()(const Unit& time) const
    {
        log->info("Finished in {} ms", time.count());
    }
};

}  // namespace sgk::cli
