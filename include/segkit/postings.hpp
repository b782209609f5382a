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
#include <limits>
#include <vector>

#include <boost/iterator/iterator_facade.hpp>
#include <fmt/format.h>
#include <gsl/span>

#include <segkit/coding/vbyte.hpp>
#include <segkit/error.hpp>
#include <segkit/memoryview.hpp>
#include <segkit/types.hpp>

namespace sgk {

//! Encodes a single posting list.
/*!
 * Postings are interleaved: for each document, the gap to the previous
 * document (the first document is stored as is), the term frequency, and,
 * if enabled, `frequency` position gaps (the first position is stored as
 * is). All numbers are variable-byte encoded.
 */
class posting_list_encoder {
public:
    explicit posting_list_encoder(bool with_positions = false)
        : with_positions_(with_positions)
    {}

    //! Appends a posting.
    //!
    //! \throws std::invalid_argument   if `document` is not greater than the
    //!                                 previous one, or positions do not
    //!                                 match the frequency
    void add(document_t document,
        frequency_t frequency,
        gsl::span<const position_t> positions = {})
    {
        if (count_ > 0 && document <= last_document_) {
            throw std::invalid_argument(fmt::format(
                "documents must be strictly increasing: {} after {}",
                document,
                last_document_));
        }
        auto gap = count_ > 0 ? document - last_document_ : document;
        auto out = document_codec_.encode(gap, std::back_inserter(bytes_));
        out = frequency_codec_.encode(frequency, out);
        if (with_positions_)
        {
            auto npositions = static_cast<std::ptrdiff_t>(positions.size());
            if (npositions != static_cast<std::ptrdiff_t>(frequency)) {
                throw std::invalid_argument(fmt::format(
                    "expected {} positions but got {}", frequency, npositions));
            }
            position_t previous = 0;
            for (std::ptrdiff_t idx = 0; idx < npositions; ++idx) {
                if (idx > 0 && positions[idx] <= previous) {
                    throw std::invalid_argument(
                        "positions must be strictly increasing");
                }
                out = position_codec_.encode(
                    idx > 0 ? positions[idx] - previous : positions[idx], out);
                previous = positions[idx];
            }
        }
        last_document_ = document;
        ++count_;
    }

    void add(const posting& p) { add(p.document, p.frequency, p.positions); }

    std::uint32_t size() const { return count_; }
    const std::vector<char>& bytes() const { return bytes_; }
    std::vector<char> release() { return std::move(bytes_); }

private:
    bool with_positions_;
    std::vector<char> bytes_{};
    std::uint32_t count_ = 0;
    document_t last_document_ = 0;
    vbyte_codec<document_t> document_codec_{};
    vbyte_codec<frequency_t> frequency_codec_{};
    vbyte_codec<position_t> position_codec_{};
};

//! A lazily decoded, forward-only posting list.
/*!
 * Each call to begin() restarts decoding from the first posting.
 * The end iterator represents the exhausted state. There is no random
 * access nor skipping.
 *
 * Decoding throws corrupt_data if the documents are not strictly increasing,
 * a value overflows, the data ends before `count` postings are decoded,
 * or any bytes remain after the last posting.
 */
class posting_list_view {
public:
    class iterator : public boost::iterator_facade<iterator,
                         const posting,
                         boost::forward_traversal_tag> {
    public:
        iterator() = default;

    private:
        friend class posting_list_view;
        friend class boost::iterator_core_access;

        iterator(memory_view memory,
            std::uint32_t count,
            bool with_positions,
            document_t limit,
            bool at_end)
            : memory_(std::move(memory)),
              pos_(memory_.begin()),
              count_(count),
              with_positions_(with_positions),
              limit_(limit)
        {
            if (at_end) {
                idx_ = count_;
                return;
            }
            decode_next();
        }

        void decode_next()
        {
            if (idx_ == count_) {
                if (pos_ != memory_.end()) {
                    throw corrupt_data(fmt::format(
                        "{} bytes left after the last of {} postings",
                        memory_.end() - pos_,
                        count_));
                }
                return;
            }
            document_t gap;
            pos_ = document_codec_.decode(pos_, memory_.end(), gap);
            if (idx_ > 0)
            {
                if (gap == 0) {
                    throw corrupt_data(fmt::format(
                        "posting {} does not increase document ID {}",
                        idx_,
                        current_.document));
                }
                if (gap > std::numeric_limits<document_t>::max()
                        - current_.document)
                {
                    throw corrupt_data("document ID overflow");
                }
                current_.document += gap;
            }
            else {
                current_.document = gap;
            }
            if (current_.document >= limit_) {
                throw corrupt_data(fmt::format(
                    "document {} out of range [0, {})",
                    current_.document,
                    limit_));
            }
            pos_ = frequency_codec_.decode(
                pos_, memory_.end(), current_.frequency);
            current_.positions.clear();
            if (with_positions_) { decode_positions(); }
        }

        void decode_positions()
        {
            position_t position = 0;
            for (frequency_t idx = 0; idx < current_.frequency; ++idx) {
                position_t gap;
                pos_ = position_codec_.decode(pos_, memory_.end(), gap);
                if (idx > 0 && gap == 0) {
                    throw corrupt_data("positions are not increasing");
                }
                position = idx > 0 ? position + gap : gap;
                current_.positions.push_back(position);
            }
        }

        void increment()
        {
            ++idx_;
            decode_next();
        }

        bool equal(const iterator& other) const { return idx_ == other.idx_; }

        const posting& dereference() const { return current_; }

        memory_view memory_{};
        const char* pos_ = nullptr;
        std::uint32_t count_ = 0;
        std::uint32_t idx_ = 0;
        bool with_positions_ = false;
        document_t limit_ = std::numeric_limits<document_t>::max();
        posting current_{};
        vbyte_codec<document_t> document_codec_{};
        vbyte_codec<frequency_t> frequency_codec_{};
        vbyte_codec<position_t> position_codec_{};
    };
    using const_iterator = iterator;

    posting_list_view() = default;
    //! \param memory          encoded postings
    //! \param count           number of postings
    //! \param with_positions  whether positions are encoded
    //! \param limit           documents must be lower than this
    posting_list_view(memory_view memory,
        std::uint32_t count,
        bool with_positions = false,
        document_t limit = std::numeric_limits<document_t>::max())
        : memory_(std::move(memory)),
          count_(count),
          with_positions_(with_positions),
          limit_(limit)
    {}

    iterator begin() const
    {
        return iterator(memory_, count_, with_positions_, limit_, false);
    }
    iterator end() const
    {
        return iterator(memory_, count_, with_positions_, limit_, true);
    }
    std::uint32_t size() const { return count_; }
    bool empty() const { return count_ == 0; }
    bool with_positions() const { return with_positions_; }
    const memory_view& memory() const { return memory_; }

private:
    memory_view memory_{};
    std::uint32_t count_ = 0;
    bool with_positions_ = false;
    document_t limit_ = std::numeric_limits<document_t>::max();
};

//! Encodes and decodes entire posting lists.
class postings_codec {
public:
    explicit postings_codec(bool with_positions = false)
        : with_positions_(with_positions)
    {}

    bool with_positions() const { return with_positions_; }

    //! Encodes documents (strictly increasing) with their frequencies.
    std::vector<char> encode(gsl::span<const document_t> documents,
        gsl::span<const frequency_t> frequencies) const
    {
        auto count = static_cast<std::ptrdiff_t>(documents.size());
        if (count != static_cast<std::ptrdiff_t>(frequencies.size())) {
            throw std::invalid_argument(fmt::format(
                "got {} documents and {} frequencies",
                count,
                static_cast<std::ptrdiff_t>(frequencies.size())));
        }
        if (with_positions_) {
            throw std::invalid_argument(
                "positions required by a positional codec");
        }
        posting_list_encoder encoder(false);
        for (std::ptrdiff_t idx = 0; idx < count; ++idx) {
            encoder.add(documents[idx], frequencies[idx]);
        }
        return encoder.release();
    }

    std::vector<char> encode(const std::vector<posting>& postings) const
    {
        posting_list_encoder encoder(with_positions_);
        for (const auto& p : postings) { encoder.add(p); }
        return encoder.release();
    }

    posting_list_view decode(memory_view bytes, std::uint32_t count) const
    {
        return posting_list_view(std::move(bytes), count, with_positions_);
    }
};

//! Eagerly decodes all postings of a list.
inline std::vector<posting> decode_all(const posting_list_view& postings)
{
    std::vector<posting> result;
    result.reserve(postings.size());
    for (const posting& p : postings) { result.push_back(p); }
    return result;
}

}  // namespace sgk
