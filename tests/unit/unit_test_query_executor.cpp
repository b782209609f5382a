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

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <segkit/codec_util.hpp>
#include <segkit/deletions.hpp>
#include <segkit/error.hpp>
#include <segkit/memoryview.hpp>
#include <segkit/merger.hpp>
#include <segkit/postings.hpp>
#include <segkit/query.hpp>
#include <segkit/query_executor.hpp>
#include <segkit/segment_format.hpp>
#include <segkit/segment_set.hpp>
#include "common.hpp"

namespace {

using sgk::all_of;
using sgk::any_of;
using sgk::negate;
using sgk::scored_document;
using sgk::term_query;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

sgk::segment_set make_set(std::vector<sgk::segment_reader> readers)
{
    std::vector<std::pair<sgk::segment_id, sgk::segment_reader>> segments;
    std::uint32_t id = 0;
    for (auto& reader : readers) {
        segments.emplace_back(sgk::segment_id(id++), std::move(reader));
    }
    return sgk::segment_set(std::move(segments));
}

sgk::query body(const std::string& token) { return term_query("body", token); }

std::vector<sgk::document_t> documents(const sgk::result_list& results)
{
    std::vector<sgk::document_t> docs;
    for (const auto& r : results) { docs.push_back(r.document); }
    return docs;
}

//! Builds a segment where `x` occurs in documents 0 and 1, and then
//! overwrites the gap of the second document with 0.
sgk::segment_reader segment_with_zero_gap()
{
    sgk::posting_list_encoder first;
    first.add(0, 1);
    auto gap_offset = first.bytes().size();

    sgk::posting_list_encoder encoder;
    encoder.add(0, 1);
    encoder.add(1, 1);
    sgk::segment_builder builder(false);
    builder.add_term(sgk::term("body", "x"), encoder);
    auto bytes = builder.build({1, 1}, 2);

    std::vector<char> header;
    sgk::codec::write_header(header,
        sgk::segment_format::codec_name,
        sgk::segment_format::version_current);
    auto postings_offset = header.size() + 4 + 4 + 8 + 8;
    EXPECT_TRUE(std::equal(encoder.bytes().begin(),
        encoder.bytes().end(),
        bytes.begin() + postings_offset));

    std::vector<char> zero;
    sgk::codec::write_vbyte<sgk::document_t>(zero, 0);
    EXPECT_EQ(zero.size(), 1u);
    bytes[postings_offset + gap_offset] = zero[0];
    bytes.resize(bytes.size() - sgk::codec::footer_length);
    sgk::codec::write_footer(bytes);
    return sgk::segment_reader(sgk::make_memory_view(std::move(bytes)));
}

class query_executor : public ::testing::Test {
protected:
    sgk::segment_set set = make_set({sgk::test::build_segment(
        sgk::test::body_documents({"rust safe", "rust fast"}))});
};

TEST_F(query_executor, term)
{
    ASSERT_THAT(sgk::execute(body("rust"), set),
        ElementsAre(scored_document{0, 1.0}, scored_document{1, 1.0}));
    ASSERT_THAT(sgk::execute(body("java"), set), IsEmpty());
    ASSERT_THAT(sgk::execute(term_query("title", "rust"), set), IsEmpty());
}

TEST_F(query_executor, conjunction)
{
    ASSERT_THAT(sgk::execute(all_of({body("safe"), body("fast")}), set),
        IsEmpty());
    ASSERT_THAT(sgk::execute(all_of({body("rust"), body("fast")}), set),
        ElementsAre(scored_document{1, 2.0}));
}

TEST_F(query_executor, disjunction)
{
    ASSERT_THAT(sgk::execute(any_of({body("safe"), body("fast")}), set),
        ElementsAre(scored_document{0, 1.0}, scored_document{1, 1.0}));
    ASSERT_THAT(sgk::execute(any_of({body("safe"), body("rust")}), set),
        ElementsAre(scored_document{0, 2.0}, scored_document{1, 1.0}));
}

TEST_F(query_executor, negation)
{
    ASSERT_THAT(sgk::execute(all_of({body("rust"), negate(body("fast"))}), set),
        ElementsAre(scored_document{0, 1.0}));
    ASSERT_THAT(sgk::execute(negate(body("safe")), set),
        ElementsAre(scored_document{1, 0.0}));
    ASSERT_THAT(sgk::execute(negate(body("java")), set),
        ElementsAre(scored_document{0, 0.0}, scored_document{1, 0.0}));
    ASSERT_THAT(
        sgk::execute(all_of({negate(body("safe")), negate(body("fast"))}), set),
        IsEmpty());
}

TEST_F(query_executor, boolean_scores)
{
    sgk::query_options options;
    options.score_function = sgk::score::score_function::none;
    ASSERT_THAT(
        sgk::execute(any_of({body("safe"), body("rust")}), set, options),
        ElementsAre(scored_document{0, 0.0}, scored_document{1, 0.0}));
}

TEST(query_executor_ranking, tf_order_and_ties)
{
    auto set = make_set({sgk::test::build_segment(sgk::test::body_documents(
        {"a", "a a a", "b", "a a", "a a a"}))});
    ASSERT_THAT(sgk::execute(body("a"), set),
        ElementsAre(scored_document{1, 3.0},
            scored_document{4, 3.0},
            scored_document{3, 2.0},
            scored_document{0, 1.0}));

    sgk::query_options options;
    options.k = 2;
    ASSERT_THAT(sgk::execute(body("a"), set, options),
        ElementsAre(scored_document{1, 3.0}, scored_document{4, 3.0}));
}

TEST(query_executor_segments, global_ids_and_deletions)
{
    auto first = sgk::test::build_segment(
        sgk::test::body_documents({"rust safe", "rust fast"}));
    auto second = sgk::test::build_segment(
        sgk::test::body_documents({"go fast", "rust"}));
    auto deleted = std::make_shared<sgk::deletion_bitmap>(2);
    deleted->set(0);

    auto set = make_set({first.with_deletions(deleted), second});
    ASSERT_EQ(set.document_count(), 4u);
    ASSERT_EQ(set.live_count(), 3u);
    ASSERT_EQ(set.segment_for(1), std::optional<std::size_t>(0u));
    ASSERT_EQ(set.segment_for(2), std::optional<std::size_t>(1u));
    ASSERT_EQ(set.segment_for(4), std::nullopt);
    ASSERT_EQ(set.global_id(1, 1), 3u);
    ASSERT_FALSE(set.is_live(0));
    ASSERT_TRUE(set.is_live(3));

    ASSERT_THAT(documents(sgk::execute(body("rust"), set)), ElementsAre(1u, 3u));
    ASSERT_THAT(documents(sgk::execute(body("fast"), set)), ElementsAre(1u, 2u));
    ASSERT_THAT(documents(sgk::execute(negate(body("fast")), set)),
        ElementsAre(3u));
}

TEST(query_executor_segments, empty_set)
{
    sgk::segment_set set;
    ASSERT_THAT(sgk::execute(body("rust"), set), IsEmpty());
    ASSERT_THAT(sgk::execute(negate(body("rust")), set), IsEmpty());
}

TEST(query_executor_segments, corrupt_postings_abort_query)
{
    auto set = make_set({sgk::test::build_segment(
                             sgk::test::body_documents({"x", "y"})),
        segment_with_zero_gap()});
    ASSERT_THAT(documents(sgk::execute(body("y"), set)), ElementsAre(1u));
    ASSERT_THROW(sgk::execute(body("x"), set), sgk::corrupt_data);
    ASSERT_THROW(sgk::execute(any_of({body("y"), body("x")}), set),
        sgk::corrupt_data);
    ASSERT_THROW(sgk::execute(negate(body("x")), set), sgk::corrupt_data);
    ASSERT_THROW(sgk::evaluate(body("x"),
                     set[1].reader,
                     sgk::score::score_function::tf),
        sgk::corrupt_data);
}

TEST(query_executor_segments, merge_preserves_results)
{
    auto first = sgk::test::build_segment(sgk::test::body_documents(
        {"a b", "b c", "a a c"}));
    auto second = sgk::test::build_segment(sgk::test::body_documents(
        {"c", "a b c", "b"}));
    auto deleted = std::make_shared<sgk::deletion_bitmap>(3);
    deleted->set(1);
    second = second.with_deletions(deleted);

    sgk::segment_merger merger({first, second});
    auto set = make_set({first, second});
    auto merged = make_set({sgk::segment_reader(
        sgk::make_memory_view(merger.merge()))});

    std::vector<sgk::query> queries{body("a"),
        all_of({body("b"), body("c")}),
        any_of({body("a"), body("c")}),
        all_of({body("c"), negate(body("a"))}),
        negate(body("b"))};
    for (const auto& q : queries)
    {
        auto expected = sgk::execute(q, set);
        for (auto& result : expected)
        {
            auto seg = *set.segment_for(result.document);
            result.document = *merger.mapped_id(
                seg, result.document - set[seg].base);
        }
        std::sort(expected.begin(), expected.end(),
            [](const auto& lhs, const auto& rhs) {
                return lhs.score > rhs.score
                    || (lhs.score == rhs.score && lhs.document < rhs.document);
            });
        ASSERT_EQ(sgk::execute(q, merged), expected) << q;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
