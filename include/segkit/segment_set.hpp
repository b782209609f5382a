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

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <segkit/assert.hpp>
#include <segkit/segment_reader.hpp>
#include <segkit/types.hpp>

namespace sgk {

//! An immutable snapshot of the segments visible to queries.
/*!
 * Each segment is assigned a base: the number of documents (deleted
 * included) in all preceding segments. The global ID of a document is its
 * segment's base plus its local ID, so global IDs do not change when
 * documents are deleted, only when segments are merged.
 */
class segment_set {
public:
    struct entry {
        segment_id id;
        segment_reader reader;
        document_t base;
    };
    using const_iterator = std::vector<entry>::const_iterator;

    segment_set() = default;

    //! \throws std::invalid_argument   if the total number of documents
    //!                                 exceeds the document ID range
    explicit segment_set(
        std::vector<std::pair<segment_id, segment_reader>> segments)
    {
        std::uint64_t base = 0;
        entries_.reserve(segments.size());
        for (auto& [id, reader] : segments)
        {
            auto count = reader.document_count();
            if (base + count > std::numeric_limits<document_t>::max()) {
                throw std::invalid_argument(fmt::format(
                    "too many documents in segment set: {}", base + count));
            }
            entries_.push_back(
                {id, std::move(reader), static_cast<document_t>(base)});
            base += count;
        }
        document_count_ = static_cast<document_t>(base);
    }

    //! Returns the index of the segment containing the global ID, or
    //! `nullopt` if out of range.
    std::optional<std::size_t> segment_for(document_t global) const
    {
        if (global >= document_count_) { return std::nullopt; }
        auto pos = std::upper_bound(entries_.begin(),
            entries_.end(),
            global,
            [](document_t doc, const entry& e) { return doc < e.base; });
        return static_cast<std::size_t>(
            std::distance(entries_.begin(), pos) - 1);
    }

    //! Maps a local ID of the `segment`-th segment to a global ID.
    document_t global_id(std::size_t segment, document_t local) const
    {
        EXPECTS(local < entries_.at(segment).reader.document_count());
        return entries_.at(segment).base + local;
    }

    //! Returns the index of the segment with the given ID, if present.
    std::optional<std::size_t> find(segment_id id) const
    {
        for (std::size_t idx = 0; idx < entries_.size(); ++idx) {
            if (entries_[idx].id == id) { return idx; }
        }
        return std::nullopt;
    }

    bool is_live(document_t global) const
    {
        if (auto idx = segment_for(global); idx) {
            const auto& e = entries_[*idx];
            return e.reader.is_live(global - e.base);
        }
        return false;
    }

    //! Returns the number of documents in all segments, deleted included.
    document_t document_count() const { return document_count_; }

    document_t live_count() const
    {
        document_t count = 0;
        for (const auto& e : entries_) { count += e.reader.live_count(); }
        return count;
    }

    const entry& operator[](std::size_t idx) const { return entries_[idx]; }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

private:
    std::vector<entry> entries_{};
    document_t document_count_ = 0;
};

}  // namespace sgk
