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

#define CATCH_CONFIG_MAIN

#include <algorithm>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <catch2/catch.hpp>

#include <segkit/index.hpp>
#include <segkit/io.hpp>
#include <segkit/query.hpp>
#include <segkit/query_executor.hpp>
#include "../unit/common.hpp"

using sgk::scored_document;
using sgk::test::tmpdir;

namespace {

sgk::segment_writer
make_batch(const sgk::index& idx, const std::vector<std::string>& texts)
{
    auto writer = idx.writer();
    for (const auto& text : texts) {
        writer.add_document(sgk::test::text_document("body", text));
    }
    return writer;
}

void add_batch(sgk::index& idx, const std::vector<std::string>& texts)
{
    idx.add_segment(make_batch(idx, texts));
}

sgk::result_list run(const sgk::index& idx, const std::string& text)
{
    auto q = sgk::parse_query(text, "body");
    REQUIRE(q.has_value());
    return sgk::execute(*q, *idx.snapshot());
}

}  // namespace

TEST_CASE("Index lifecycle", "[index][integration]")
{
    GIVEN("an index with two segments")
    {
        auto dir = tmpdir() / "index";
        auto idx = sgk::index::create(dir);
        add_batch(*idx, {"rust safe", "rust fast"});
        add_batch(*idx, {"go fast", "rust rust systems"});

        WHEN("querying")
        {
            THEN("terms match across segments")
            {
                REQUIRE(run(*idx, R"("rust")")
                    == sgk::result_list{{3, 2.0}, {0, 1.0}, {1, 1.0}});
                REQUIRE(run(*idx, R"({"and": ["safe", "fast"]})").empty());
                REQUIRE(run(*idx, R"({"and": ["fast", {"not": "rust"}]})")
                    == sgk::result_list{{2, 1.0}});
            }
        }

        WHEN("a document is deleted and the index reopened")
        {
            REQUIRE(idx->delete_document(3));
            idx.reset();
            auto reopened = sgk::index::open(dir);

            THEN("the deletion persists")
            {
                REQUIRE(run(*reopened, R"("rust")")
                    == sgk::result_list{{0, 1.0}, {1, 1.0}});
                REQUIRE(reopened->snapshot()->live_count() == 3);
            }

            AND_WHEN("segments are merged")
            {
                REQUIRE(reopened->merge());

                THEN("live documents get consecutive IDs")
                {
                    auto snapshot = reopened->snapshot();
                    REQUIRE(snapshot->size() == 1);
                    REQUIRE(snapshot->document_count() == 3);
                    REQUIRE(run(*reopened, R"("fast")")
                        == sgk::result_list{{1, 1.0}, {2, 1.0}});
                    REQUIRE(run(*reopened, R"("systems")").empty());
                }
            }
        }

        WHEN("documents matching a query are deleted")
        {
            auto q = sgk::parse_query(
                R"({"and": ["fast", {"not": "go"}]})", "body");
            REQUIRE(q.has_value());
            REQUIRE(idx->delete_query(*q) == 1);

            THEN("only the matching documents are gone")
            {
                REQUIRE(run(*idx, R"("rust")")
                    == sgk::result_list{{3, 2.0}, {0, 1.0}});
                REQUIRE(run(*idx, R"("fast")") == sgk::result_list{{2, 1.0}});
            }
        }

        WHEN("a document is updated")
        {
            auto before = idx->snapshot();
            idx->update_documents(
                sgk::term("body", "safe"), make_batch(*idx, {"rust safe again"}));

            THEN("the new version replaces the old one in a single generation")
            {
                REQUIRE(idx->generation() == 3);
                REQUIRE(run(*idx, R"("safe")") == sgk::result_list{{4, 1.0}});
                REQUIRE(run(*idx, R"("rust")")
                    == sgk::result_list{{3, 2.0}, {1, 1.0}, {4, 1.0}});
                REQUIRE(before->live_count() == 4);
                REQUIRE(sgk::execute(sgk::term_query("body", "safe"), *before)
                    == sgk::result_list{{0, 1.0}});
            }
        }

        WHEN("all documents with a term are deleted")
        {
            REQUIRE(idx->delete_term(sgk::term("body", "fast")) == 2);

            THEN("queries for the term return nothing")
            {
                REQUIRE(run(*idx, R"("fast")").empty());
                REQUIRE(run(*idx, R"("rust")")
                    == sgk::result_list{{3, 2.0}, {0, 1.0}});
            }
        }
    }
}

TEST_CASE("Many segments", "[index][integration]")
{
    GIVEN("an index built in small batches")
    {
        auto dir = tmpdir() / "index";
        auto idx = sgk::index::create(dir, sgk::index_options{true});
        std::vector<std::string> batch;
        int documents = 0;
        for (int doc = 0; doc < 1000; ++doc)
        {
            batch.push_back(doc % 2 == 0 ? "even number" : "odd number");
            if (batch.size() == 64) {
                add_batch(*idx, batch);
                documents += static_cast<int>(batch.size());
                batch.clear();
            }
        }
        add_batch(*idx, batch);
        documents += static_cast<int>(batch.size());

        WHEN("merged")
        {
            auto before = run(*idx, R"({"and": ["number", {"not": "odd"}]})");
            REQUIRE(idx->merge());
            auto after = run(*idx, R"({"and": ["number", {"not": "odd"}]})");

            THEN("results are the same")
            {
                REQUIRE(documents == 1000);
                REQUIRE(before.size() == 500);
                REQUIRE(before == after);
                REQUIRE(idx->snapshot()->size() == 1);
                REQUIRE((*idx->snapshot())[0].reader.has_positions());
            }
        }
    }
}
