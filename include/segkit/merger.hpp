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
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <spdlog/spdlog.h>

#include <segkit/assert.hpp>
#include <segkit/io.hpp>
#include <segkit/postings.hpp>
#include <segkit/segment_format.hpp>
#include <segkit/segment_reader.hpp>
#include <segkit/segment_writer.hpp>
#include <segkit/types.hpp>

namespace sgk {

//! Merges segments into a single segment, dropping deleted documents.
/*!
 * Live documents keep their relative order: documents of the first segment
 * come first, and within a segment, deleted documents are skipped, so that
 * the remaining ones receive consecutive IDs.
 *
 * Terms are merged with a heap of per-segment dictionary cursors.
 * A term whose postings are all deleted does not appear in the result.
 */
class segment_merger {
public:
    using document_type = document_t;

private:
    static constexpr document_type deleted_document =
        std::numeric_limits<document_type>::max();

    class entry {
    public:
        entry() = default;
        entry(std::size_t segment_idx, std::size_t term_idx, const term* current)
            : segment_idx_(segment_idx), term_idx_(term_idx), current_(current)
        {}

        std::size_t segment_idx() const { return segment_idx_; }
        std::size_t term_idx() const { return term_idx_; }
        const term& current_term() const { return *current_; }

        bool operator<(const entry& rhs) const
        {
            return current_term() > rhs.current_term();
        }

    private:
        std::size_t segment_idx_ = 0;
        std::size_t term_idx_ = 0;
        const term* current_ = nullptr;
    };

    std::vector<segment_reader> segments_;
    std::vector<std::vector<document_type>> mappings_;
    std::vector<frequency_t> document_sizes_;
    std::vector<entry> heap_;
    bool with_positions_;

    std::vector<entry> segments_with_next_term()
    {
        std::vector<entry> result;
        term next_term = heap_.front().current_term();
        while (not heap_.empty() && heap_.front().current_term() == next_term)
        {
            std::pop_heap(heap_.begin(), heap_.end());
            result.push_back(heap_.back());
            heap_.pop_back();
        }
        return result;
    }

    //! Assigns new IDs to live documents and gathers their sizes.
    void map_documents()
    {
        document_type next = 0;
        for (const auto& segment : segments_)
        {
            std::vector<document_type> mapping(segment.document_count());
            for (document_type doc = 0; doc < segment.document_count(); ++doc)
            {
                if (segment.is_live(doc)) {
                    mapping[doc] = next++;
                    document_sizes_.push_back(segment.document_size(doc));
                } else {
                    mapping[doc] = deleted_document;
                }
            }
            mappings_.push_back(std::move(mapping));
        }
        ENSURES(document_sizes_.size() == next);
    }

    //! Writes the live postings of a term; returns its occurrences.
    std::uint64_t
    merge_term(std::vector<entry>& entries, segment_builder& builder) const
    {
        // Sort by segment, i.e., effectively by new document IDs.
        std::sort(entries.begin(),
            entries.end(),
            [](const entry& lhs, const entry& rhs) {
                return lhs.segment_idx() < rhs.segment_idx();
            });

        std::uint64_t occurrences = 0;
        posting_list_encoder encoder(with_positions_);
        for (const entry& e : entries)
        {
            const auto& mapping = mappings_[e.segment_idx()];
            for (const posting& p : segments_[e.segment_idx()].postings(e.term_idx()))
            {
                auto doc = mapping[p.document];
                if (doc == deleted_document) { continue; }
                if (with_positions_) {
                    encoder.add(doc, p.frequency, p.positions);
                } else {
                    encoder.add(doc, p.frequency);
                }
                occurrences += p.frequency;
            }
        }
        if (encoder.size() > 0) {
            builder.add_term(entries.front().current_term(), encoder);
        }
        return occurrences;
    }

public:
    explicit segment_merger(std::vector<segment_reader> segments)
        : segments_(std::move(segments)),
          with_positions_(not segments_.empty()
              && std::all_of(segments_.begin(),
                     segments_.end(),
                     [](const auto& s) { return s.has_positions(); }))
    {
        map_documents();
    }

    //! Returns the number of documents in the merged segment.
    document_type document_count() const
    {
        return static_cast<document_type>(document_sizes_.size());
    }

    bool with_positions() const { return with_positions_; }

    //! Returns the ID of `doc` of the `segment`-th segment after merging,
    //! or `nullopt` if the document is deleted.
    std::optional<document_type>
    mapped_id(std::size_t segment, document_type doc) const
    {
        auto mapped = mappings_.at(segment).at(doc);
        if (mapped == deleted_document) { return std::nullopt; }
        return mapped;
    }

    //! Produces the bytes of the merged segment.
    std::vector<char> merge()
    {
        auto log = spdlog::get("segkit");
        heap_.clear();
        for (std::size_t idx = 0; idx < segments_.size(); ++idx) {
            const auto& dictionary = segments_[idx].dictionary();
            if (not dictionary.empty()) {
                heap_.emplace_back(idx, 0, &dictionary[0].term);
            }
        }
        std::make_heap(heap_.begin(), heap_.end());

        segment_builder builder(with_positions_);
        std::uint64_t all_occurrences = 0;
        while (not heap_.empty())
        {
            std::vector<entry> entries = segments_with_next_term();
            if (log) {
                log->debug("Merging term {} from {} segments",
                    entries.front().current_term(),
                    entries.size());
            }
            all_occurrences += merge_term(entries, builder);
            for (const entry& e : entries)
            {
                const auto& dictionary = segments_[e.segment_idx()].dictionary();
                if (e.term_idx() + 1 < dictionary.size()) {
                    heap_.emplace_back(e.segment_idx(),
                        e.term_idx() + 1,
                        &dictionary[e.term_idx() + 1].term);
                    std::push_heap(heap_.begin(), heap_.end());
                }
            }
        }
        if (log) {
            log->info("Merged {} segments into {} documents and {} terms",
                segments_.size(),
                document_count(),
                builder.term_count());
        }
        return builder.build(document_sizes_, all_occurrences);
    }

    //! Writes the merged segment to `<name>.seg` in `dir`.
    segment_info
    merge(const boost::filesystem::path& dir, const std::string& name)
    {
        auto file = dir / (name + segment_format::extension);
        auto bytes = merge();
        io::write_durably(file, bytes);
        auto merged = segment_reader(make_memory_view(std::move(bytes)));
        return segment_info{name,
            file,
            merged.document_count(),
            merged.dictionary().size(),
            merged.occurrences(),
            merged.has_positions()};
    }
};

}  // namespace sgk
