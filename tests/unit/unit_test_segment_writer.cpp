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

#include <vector>

#include <boost/filesystem.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <segkit/error.hpp>
#include <segkit/postings.hpp>
#include <segkit/segment_reader.hpp>
#include <segkit/segment_writer.hpp>
#include "common.hpp"

namespace {

namespace fs = boost::filesystem;
using sgk::term;
using sgk::writer_state;

class segment_writer : public ::testing::Test {
protected:
    fs::path dir = sgk::test::tmpdir();
    sgk::segment_writer writer{};
};

TEST_F(segment_writer, assigns_consecutive_ids)
{
    ASSERT_EQ(writer.add_document(sgk::test::text_document("body", "a b")), 0u);
    ASSERT_EQ(writer.add_document(sgk::test::text_document("body", "b c")), 1u);
    ASSERT_EQ(writer.add_document(sgk::document{}), 2u);
    ASSERT_EQ(writer.document_count(), 3u);
    ASSERT_EQ(writer.term_count(), 3u);
    ASSERT_EQ(writer.occurrences(), 4u);
    ASSERT_EQ(writer.state(), writer_state::open);
}

TEST_F(segment_writer, flush)
{
    writer.add_document(sgk::test::text_document("body", "rust safe rust"));
    writer.add_document(sgk::test::text_document("body", "rust fast"));
    auto info = writer.flush(dir, "seg_0");

    ASSERT_EQ(writer.state(), writer_state::flushed);
    ASSERT_EQ(info.name, "seg_0");
    ASSERT_EQ(info.file, dir / "seg_0.seg");
    ASSERT_EQ(info.document_count, 2u);
    ASSERT_EQ(info.term_count, 3u);
    ASSERT_EQ(info.occurrences, 5u);
    ASSERT_TRUE(fs::exists(info.file));
    ASSERT_FALSE(fs::exists(dir / "seg_0.seg.tmp"));

    auto reader = sgk::segment_reader::open(info.file);
    ASSERT_EQ(reader.document_count(), 2u);
    ASSERT_EQ(reader.document_size(0), 3u);
    ASSERT_EQ(reader.document_size(1), 2u);
    auto rust = sgk::decode_all(*reader.term_postings(term("body", "rust")));
    ASSERT_EQ(rust.size(), 2u);
    ASSERT_EQ(rust[0].document, 0u);
    ASSERT_EQ(rust[0].frequency, 2u);
    ASSERT_EQ(rust[1].document, 1u);
    ASSERT_EQ(rust[1].frequency, 1u);
}

TEST_F(segment_writer, flushed_is_terminal)
{
    writer.add_document(sgk::test::text_document("body", "a"));
    writer.flush(dir, "seg_0");
    ASSERT_THROW(writer.add_document(sgk::test::text_document("body", "b")),
        sgk::invalid_state);
    ASSERT_THROW(writer.flush(dir, "seg_1"), sgk::invalid_state);
    ASSERT_FALSE(fs::exists(dir / "seg_1.seg"));
}

TEST_F(segment_writer, failed_flush_leaves_nothing)
{
    writer.add_document(sgk::test::text_document("body", "a"));
    auto missing = dir / "missing";
    ASSERT_THROW(writer.flush(missing, "seg_0"), sgk::io_failure);
    ASSERT_EQ(writer.state(), writer_state::failed);
    ASSERT_FALSE(fs::exists(missing / "seg_0.seg"));
    ASSERT_FALSE(fs::exists(missing / "seg_0.seg.tmp"));
    ASSERT_THROW(writer.add_document(sgk::test::text_document("body", "b")),
        sgk::invalid_state);
    ASSERT_THROW(writer.flush(dir, "seg_0"), sgk::invalid_state);
    ASSERT_TRUE(fs::is_empty(dir));
}

TEST_F(segment_writer, empty_segment)
{
    auto info = writer.flush(dir, "empty");
    auto reader = sgk::segment_reader::open(info.file);
    ASSERT_EQ(reader.document_count(), 0u);
    ASSERT_TRUE(reader.dictionary().empty());
}

TEST(segment_writer_positions, positions_per_field)
{
    sgk::segment_writer writer(true);
    sgk::document doc;
    doc.add("title", {"rust", "book"});
    doc.add("body", {"rust", "is", "rust"});
    doc.add("title", {"rust"});
    writer.add_document(doc);
    auto info = writer.flush(sgk::test::tmpdir(), "seg");
    ASSERT_TRUE(info.with_positions);

    auto reader = sgk::segment_reader::open(info.file);
    ASSERT_TRUE(reader.has_positions());
    auto title = sgk::decode_all(*reader.term_postings(term("title", "rust")));
    ASSERT_EQ(title.size(), 1u);
    ASSERT_EQ(title[0].frequency, 2u);
    ASSERT_THAT(title[0].positions, ::testing::ElementsAre(0u, 2u));
    auto body = sgk::decode_all(*reader.term_postings(term("body", "rust")));
    ASSERT_THAT(body[0].positions, ::testing::ElementsAre(0u, 2u));
    auto is = sgk::decode_all(*reader.term_postings(term("body", "is")));
    ASSERT_THAT(is[0].positions, ::testing::ElementsAre(1u));
}

TEST(segment_writer_scenario, ten_thousand_documents)
{
    sgk::segment_writer writer;
    for (int doc = 0; doc < 10'000; ++doc) {
        writer.add_document(sgk::test::text_document(
            "body", "shared unique" + std::to_string(doc)));
    }
    auto reader = sgk::segment_reader::open(
        writer.flush(sgk::test::tmpdir(), "large").file);
    auto documents =
        sgk::test::documents_of(reader, term("body", "shared"));
    ASSERT_EQ(documents.size(), 10'000u);
    for (std::size_t idx = 1; idx < documents.size(); ++idx) {
        ASSERT_LT(documents[idx - 1], documents[idx]);
    }
    ASSERT_EQ(reader.term_postings(term("body", "shared"))->size(), 10'000u);
}

}  // namespace

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
