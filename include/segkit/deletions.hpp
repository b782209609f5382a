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

#pragma once

#include <cstdint>
#include <iterator>
#include <vector>

#include <boost/dynamic_bitset.hpp>
#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <segkit/codec_util.hpp>
#include <segkit/io.hpp>
#include <segkit/memoryview.hpp>

namespace sgk {

//! Deleted documents of a segment: a set bit marks a deleted document.
using deletion_bitmap = boost::dynamic_bitset<std::uint64_t>;

namespace deletions_format {

    constexpr const char* codec_name = "SegkitDeletions";
    constexpr std::int32_t version_current = 1;
    constexpr const char* extension = ".del";

}  // namespace deletions_format

inline std::vector<char> serialize_deletions(const deletion_bitmap& deleted)
{
    std::vector<char> out;
    codec::write_header(
        out, deletions_format::codec_name, deletions_format::version_current);
    codec::write_fixed<std::uint32_t>(
        out, static_cast<std::uint32_t>(deleted.size()));
    codec::write_fixed<std::uint32_t>(
        out, static_cast<std::uint32_t>(deleted.count()));
    std::vector<deletion_bitmap::block_type> blocks;
    boost::to_block_range(deleted, std::back_inserter(blocks));
    for (auto block : blocks) {
        codec::write_fixed<deletion_bitmap::block_type>(out, block);
    }
    codec::write_footer(out);
    return out;
}

//! \throws corrupt_data    if the checksum, size or count do not match
inline deletion_bitmap deserialize_deletions(const memory_view& file)
{
    codec::byte_reader in(codec::check_footer(file));
    codec::check_header(in,
        deletions_format::codec_name,
        deletions_format::version_current,
        deletions_format::version_current);
    auto size = in.read_fixed<std::uint32_t>();
    auto count = in.read_fixed<std::uint32_t>();
    std::size_t block_count = (size + deletion_bitmap::bits_per_block - 1)
        / deletion_bitmap::bits_per_block;
    if (in.remaining()
        != static_cast<std::ptrdiff_t>(
               block_count * sizeof(deletion_bitmap::block_type)))
    {
        throw corrupt_data(fmt::format(
            "deletion bitmap of {} documents cannot have {} bytes",
            size,
            in.remaining()));
    }
    std::vector<deletion_bitmap::block_type> blocks;
    for (std::size_t idx = 0; idx < block_count; ++idx) {
        blocks.push_back(in.read_fixed<deletion_bitmap::block_type>());
    }
    deletion_bitmap deleted(blocks.begin(), blocks.end());
    deleted.resize(size);
    if (deleted.count() != count) {
        throw corrupt_data(fmt::format(
            "expected {} deleted documents but found {}",
            count,
            deleted.count()));
    }
    return deleted;
}

inline void write_deletions(
    const boost::filesystem::path& file, const deletion_bitmap& deleted)
{
    io::write_durably(file, serialize_deletions(deleted));
}

inline deletion_bitmap read_deletions(const boost::filesystem::path& file)
{
    io::enforce_exist(file);
    return deserialize_deletions(make_memory_view(io::load_data(file)));
}

}  // namespace sgk
