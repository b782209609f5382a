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
#include <string>
#include <vector>

#include <fmt/format.h>

#include <segkit/codec_util.hpp>
#include <segkit/postings.hpp>
#include <segkit/term_dictionary.hpp>
#include <segkit/types.hpp>

namespace sgk {

/*!
 * Layout of a segment file:
 *
 *     header("SegkitSegment", version)
 *     flags: u32           bit 0: positions stored
 *     documents: u32
 *     occurrences: u64
 *     postings: u64 length, bytes
 *     dictionary: u64 length, bytes
 *     document sizes: u64 length, vbyte per document
 *     footer
 */
namespace segment_format {

    constexpr const char* codec_name = "SegkitSegment";
    constexpr std::int32_t version_start = 1;
    constexpr std::int32_t version_current = version_start;
    constexpr std::uint32_t positions_flag = 1u;
    constexpr const char* extension = ".seg";

}  // namespace segment_format

//! Assembles the bytes of a segment file.
//!
//! Terms must be added in ascending order, each with its encoded posting
//! list. Used both for flushing a writer and for merging segments.
class segment_builder {
public:
    explicit segment_builder(bool with_positions)
        : with_positions_(with_positions)
    {}

    //! Appends the posting list of the next term.
    //!
    //! \throws std::invalid_argument   if `t` is out of order or the list
    //!                                 is empty
    void add_term(term t, posting_list_encoder& encoder)
    {
        term_info info{static_cast<offset_t>(postings_.size()), encoder.size()};
        dictionary_.add(std::move(t), info);
        const auto& bytes = encoder.bytes();
        postings_.insert(postings_.end(), bytes.begin(), bytes.end());
    }

    std::size_t term_count() const { return dictionary_.size(); }

    //! Produces the complete, checksummed segment file.
    std::vector<char> build(const std::vector<frequency_t>& document_sizes,
        std::uint64_t occurrences)
    {
        std::vector<char> dictionary_bytes;
        dictionary_.build().serialize(dictionary_bytes);
        std::vector<char> sizes_bytes;
        for (auto size : document_sizes) {
            codec::write_vbyte<frequency_t>(sizes_bytes, size);
        }

        std::vector<char> out;
        out.reserve(postings_.size() + dictionary_bytes.size()
            + sizes_bytes.size() + 64);
        codec::write_header(
            out, segment_format::codec_name, segment_format::version_current);
        codec::write_fixed<std::uint32_t>(
            out, with_positions_ ? segment_format::positions_flag : 0u);
        codec::write_fixed<std::uint32_t>(
            out, static_cast<std::uint32_t>(document_sizes.size()));
        codec::write_fixed<std::uint64_t>(out, occurrences);
        write_section(out, postings_);
        write_section(out, dictionary_bytes);
        write_section(out, sizes_bytes);
        codec::write_footer(out);
        return out;
    }

private:
    static void
    write_section(std::vector<char>& out, const std::vector<char>& section)
    {
        codec::write_fixed<std::uint64_t>(out, section.size());
        out.insert(out.end(), section.begin(), section.end());
    }

    bool with_positions_;
    std::vector<char> postings_{};
    term_dictionary_builder dictionary_{};
};

}  // namespace sgk
