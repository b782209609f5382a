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
#include <memory>
#include <optional>
#include <vector>

#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <segkit/assert.hpp>
#include <segkit/codec_util.hpp>
#include <segkit/deletions.hpp>
#include <segkit/error.hpp>
#include <segkit/io.hpp>
#include <segkit/memoryview.hpp>
#include <segkit/postings.hpp>
#include <segkit/segment_format.hpp>
#include <segkit/term_dictionary.hpp>
#include <segkit/types.hpp>

namespace sgk {

//! Read-only access to a single segment.
/*!
 * The segment bytes are validated once, when the reader is constructed:
 * the checksum, the header, the section lengths, and the dictionary.
 * Posting lists are decoded lazily and validated while being decoded.
 *
 * Readers are cheap to copy: all copies share the same immutable data.
 * A deletion bitmap can be attached with with_deletions(), which leaves
 * the original reader unchanged.
 */
class segment_reader {
public:
    //! \throws corrupt_data    if the segment is malformed
    explicit segment_reader(memory_view file)
        : data_(std::make_shared<const segment_data>(parse(std::move(file))))
    {}

    //! Maps the segment file into memory.
    //!
    //! \throws io_failure      if the file cannot be mapped
    //! \throws corrupt_data    if the segment is malformed
    static segment_reader open(const boost::filesystem::path& file)
    {
        io::enforce_exist(file);
        return segment_reader(make_memory_view(file));
    }

    //! Returns the postings of `t`, or `nullopt` if the term is absent.
    std::optional<posting_list_view> term_postings(const term& t) const
    {
        if (auto idx = data_->dictionary.index_of(t); idx) {
            return postings(*idx);
        }
        return std::nullopt;
    }

    //! Returns the postings of the term at position `idx` of the dictionary.
    posting_list_view postings(std::size_t idx) const
    {
        EXPECTS(idx < data_->dictionary.size());
        const auto& info = data_->dictionary[idx].info;
        auto end = idx + 1 < data_->dictionary.size()
            ? data_->dictionary[idx + 1].info.offset
            : static_cast<offset_t>(data_->postings.size());
        return posting_list_view(
            data_->postings.range(info.offset, end - info.offset),
            info.length,
            data_->with_positions,
            data_->document_count);
    }

    //! Returns a reader of the same segment with the given deletions.
    //!
    //! \throws std::invalid_argument   if the bitmap size differs from the
    //!                                 number of documents
    segment_reader
    with_deletions(std::shared_ptr<const deletion_bitmap> deleted) const
    {
        if (deleted != nullptr && deleted->size() != data_->document_count) {
            throw std::invalid_argument(fmt::format(
                "deletion bitmap of size {} for a segment of {} documents",
                deleted->size(),
                data_->document_count));
        }
        segment_reader reader(*this);
        reader.deleted_ = std::move(deleted);
        return reader;
    }

    //! Returns `false` if the document is deleted or out of range.
    bool is_live(document_t doc) const
    {
        if (doc >= data_->document_count) { return false; }
        return deleted_ == nullptr || not deleted_->test(doc);
    }

    //! Returns the number of documents, including deleted ones.
    document_t document_count() const { return data_->document_count; }

    document_t live_count() const
    {
        if (deleted_ == nullptr) { return data_->document_count; }
        return data_->document_count
            - static_cast<document_t>(deleted_->count());
    }

    bool has_deletions() const
    {
        return deleted_ != nullptr && deleted_->any();
    }
    const std::shared_ptr<const deletion_bitmap>& deletions() const
    {
        return deleted_;
    }

    //! Returns the number of tokens in the document.
    frequency_t document_size(document_t doc) const
    {
        return data_->document_sizes.at(doc);
    }
    const std::vector<frequency_t>& document_sizes() const
    {
        return data_->document_sizes;
    }

    const term_dictionary& dictionary() const { return data_->dictionary; }
    bool has_positions() const { return data_->with_positions; }
    std::uint64_t occurrences() const { return data_->occurrences; }

    //! Returns the complete segment file.
    const memory_view& bytes() const { return data_->file; }

private:
    struct segment_data {
        memory_view file;
        memory_view postings;
        term_dictionary dictionary;
        std::vector<frequency_t> document_sizes;
        document_t document_count = 0;
        std::uint64_t occurrences = 0;
        bool with_positions = false;
    };

    static memory_view read_section(codec::byte_reader& in)
    {
        auto length = in.read_fixed<std::uint64_t>();
        if (length > static_cast<std::uint64_t>(in.remaining())) {
            throw corrupt_data(fmt::format(
                "section of {} bytes exceeds the {} remaining bytes",
                length,
                in.remaining()));
        }
        return in.read_view(static_cast<std::ptrdiff_t>(length));
    }

    static segment_data parse(memory_view file)
    {
        segment_data data;
        data.file = file;
        codec::byte_reader in(codec::check_footer(file));
        codec::check_header(in,
            segment_format::codec_name,
            segment_format::version_start,
            segment_format::version_current);
        auto flags = in.read_fixed<std::uint32_t>();
        if ((flags & ~segment_format::positions_flag) != 0) {
            throw corrupt_data(fmt::format("unknown segment flags {:#x}", flags));
        }
        data.with_positions = (flags & segment_format::positions_flag) != 0;
        data.document_count = in.read_fixed<std::uint32_t>();
        data.occurrences = in.read_fixed<std::uint64_t>();
        data.postings = read_section(in);
        data.dictionary = term_dictionary::deserialize(read_section(in));
        auto sizes = read_section(in);
        if (not in.exhausted()) {
            throw corrupt_data(fmt::format(
                "{} unexpected bytes after the last section", in.remaining()));
        }

        if (data.document_count > static_cast<std::uint64_t>(sizes.size())) {
            throw corrupt_data(fmt::format(
                "{} bytes cannot hold sizes of {} documents",
                sizes.size(),
                data.document_count));
        }
        codec::byte_reader sizes_in(sizes);
        data.document_sizes.reserve(data.document_count);
        for (document_t doc = 0; doc < data.document_count; ++doc) {
            data.document_sizes.push_back(sizes_in.read_vbyte<frequency_t>());
        }
        if (not sizes_in.exhausted()) {
            throw corrupt_data("document sizes inconsistent with the count");
        }

        auto postings_size = static_cast<offset_t>(data.postings.size());
        for (const auto& entry : data.dictionary) {
            if (entry.info.offset > postings_size) {
                throw corrupt_data(fmt::format(
                    "postings of {} at {} exceed {} bytes",
                    entry.term,
                    entry.info.offset,
                    postings_size));
            }
            if (entry.info.length > data.document_count) {
                throw corrupt_data(fmt::format(
                    "{} postings of {} in a segment of {} documents",
                    entry.info.length,
                    entry.term,
                    data.document_count));
            }
        }
        return data;
    }

    std::shared_ptr<const segment_data> data_;
    std::shared_ptr<const deletion_bitmap> deleted_{};
};

}  // namespace sgk
