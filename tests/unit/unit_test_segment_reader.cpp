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

#include <memory>
#include <vector>

#include <boost/filesystem.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <segkit/deletions.hpp>
#include <segkit/error.hpp>
#include <segkit/io.hpp>
#include <segkit/segment_reader.hpp>
#include "common.hpp"

namespace {

namespace fs = boost::filesystem;
using sgk::term;
using ::testing::ElementsAre;

class segment_reader : public ::testing::Test {
protected:
    fs::path dir = sgk::test::tmpdir();
    sgk::segment_info info = sgk::test::write_segment(dir,
        "seg_0",
        sgk::test::body_documents({"rust safe", "rust fast", "go fast fast"}));

    std::vector<char> bytes() const { return sgk::io::load_data(info.file); }
};

TEST_F(segment_reader, open_is_idempotent)
{
    auto first = sgk::segment_reader::open(info.file);
    auto second = sgk::segment_reader::open(info.file);
    ASSERT_EQ(first.document_count(), second.document_count());
    ASSERT_EQ(first.dictionary().size(), second.dictionary().size());
    ASSERT_EQ(sgk::test::documents_of(first, term("body", "fast")),
        sgk::test::documents_of(second, term("body", "fast")));
}

TEST_F(segment_reader, properties)
{
    auto reader = sgk::segment_reader::open(info.file);
    ASSERT_EQ(reader.document_count(), 3u);
    ASSERT_EQ(reader.live_count(), 3u);
    ASSERT_FALSE(reader.has_deletions());
    ASSERT_FALSE(reader.has_positions());
    ASSERT_EQ(reader.occurrences(), 7u);
    ASSERT_THAT(reader.document_sizes(), ElementsAre(2u, 2u, 3u));
    ASSERT_THROW(reader.document_size(3), std::out_of_range);
    ASSERT_EQ(reader.bytes().size(), static_cast<std::ptrdiff_t>(bytes().size()));
}

TEST_F(segment_reader, term_postings)
{
    auto reader = sgk::segment_reader::open(info.file);
    ASSERT_THAT(sgk::test::documents_of(reader, term("body", "rust")),
        ElementsAre(0u, 1u));
    ASSERT_THAT(sgk::test::documents_of(reader, term("body", "fast")),
        ElementsAre(1u, 2u));
    auto go = sgk::decode_all(*reader.term_postings(term("body", "go")));
    ASSERT_EQ(go.size(), 1u);
    ASSERT_EQ(go[0].frequency, 1u);
    auto fast = sgk::decode_all(*reader.term_postings(term("body", "fast")));
    ASSERT_EQ(fast[1].frequency, 2u);
}

TEST_F(segment_reader, absent_term)
{
    auto reader = sgk::segment_reader::open(info.file);
    ASSERT_FALSE(reader.term_postings(term("body", "java")).has_value());
    ASSERT_FALSE(reader.term_postings(term("title", "rust")).has_value());
}

TEST_F(segment_reader, postings_by_position)
{
    auto reader = sgk::segment_reader::open(info.file);
    std::size_t total = 0;
    for (std::size_t idx = 0; idx < reader.dictionary().size(); ++idx) {
        total += sgk::decode_all(reader.postings(idx)).size();
    }
    ASSERT_EQ(total, 6u);
}

TEST_F(segment_reader, missing_file)
{
    ASSERT_THROW(sgk::segment_reader::open(dir / "none.seg"), sgk::io_failure);
}

TEST_F(segment_reader, corrupted_byte)
{
    auto data = bytes();
    for (std::size_t pos : {std::size_t{0}, data.size() / 2, data.size() - 1})
    {
        auto corrupted = data;
        corrupted[pos] ^= 0x10;
        ASSERT_THROW(sgk::segment_reader{
                         sgk::make_memory_view(std::move(corrupted))},
            sgk::corrupt_data)
            << "byte " << pos;
    }
}

TEST_F(segment_reader, truncated)
{
    auto data = bytes();
    for (std::size_t size : {std::size_t{0}, std::size_t{10}, data.size() - 1})
    {
        std::vector<char> truncated(data.begin(), data.begin() + size);
        ASSERT_THROW(sgk::segment_reader{
                         sgk::make_memory_view(std::move(truncated))},
            sgk::corrupt_data)
            << "size " << size;
    }
}

TEST_F(segment_reader, with_deletions)
{
    auto reader = sgk::segment_reader::open(info.file);
    auto deleted = std::make_shared<sgk::deletion_bitmap>(3);
    deleted->set(1);
    auto view = reader.with_deletions(deleted);

    ASSERT_TRUE(view.has_deletions());
    ASSERT_EQ(view.live_count(), 2u);
    ASSERT_EQ(view.document_count(), 3u);
    ASSERT_TRUE(view.is_live(0));
    ASSERT_FALSE(view.is_live(1));
    ASSERT_TRUE(view.is_live(2));
    ASSERT_FALSE(view.is_live(3));

    ASSERT_FALSE(reader.has_deletions());
    ASSERT_TRUE(reader.is_live(1));
    ASSERT_EQ(reader.live_count(), 3u);

    ASSERT_THAT(sgk::test::documents_of(view, term("body", "rust")),
        ElementsAre(0u, 1u));
}

TEST_F(segment_reader, deletions_of_wrong_size)
{
    auto reader = sgk::segment_reader::open(info.file);
    ASSERT_THROW(
        reader.with_deletions(std::make_shared<sgk::deletion_bitmap>(4)),
        std::invalid_argument);
}

TEST(deletions, write_and_read)
{
    auto file = sgk::test::tmpdir() / "seg_0_1.del";
    sgk::deletion_bitmap deleted(130);
    deleted.set(0);
    deleted.set(64);
    deleted.set(129);
    sgk::write_deletions(file, deleted);
    ASSERT_EQ(sgk::read_deletions(file), deleted);
}

TEST(deletions, empty_bitmap)
{
    sgk::deletion_bitmap deleted;
    auto bytes = sgk::serialize_deletions(deleted);
    ASSERT_EQ(sgk::deserialize_deletions(sgk::make_memory_view(bytes)), deleted);
}

TEST(deletions, corrupted)
{
    sgk::deletion_bitmap deleted(10);
    deleted.set(3);
    auto bytes = sgk::serialize_deletions(deleted);
    bytes[bytes.size() / 2] ^= 0x01;
    ASSERT_THROW(sgk::deserialize_deletions(sgk::make_memory_view(bytes)),
        sgk::corrupt_data);
    bytes.pop_back();
    ASSERT_THROW(sgk::deserialize_deletions(sgk::make_memory_view(bytes)),
        sgk::corrupt_data);
}

}  // namespace

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
