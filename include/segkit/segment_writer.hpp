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
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/filesystem.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <segkit/assert.hpp>
#include <segkit/error.hpp>
#include <segkit/io.hpp>
#include <segkit/postings.hpp>
#include <segkit/segment_format.hpp>
#include <segkit/types.hpp>

namespace sgk {

//! Summary of a flushed segment.
struct segment_info {
    std::string name;
    boost::filesystem::path file;
    document_t document_count = 0;
    std::size_t term_count = 0;
    std::uint64_t occurrences = 0;
    bool with_positions = false;
};

enum class writer_state { open, flushed, failed };

inline std::ostream& operator<<(std::ostream& os, writer_state state)
{
    switch (state) {
    case writer_state::open: return os << "open";
    case writer_state::flushed: return os << "flushed";
    case writer_state::failed: return os << "failed";
    }
    return os;
}

//! Buffers documents in memory and flushes them into a single segment.
/*!
 * Documents receive consecutive IDs starting at 0. Once flushed (or after
 * a failed flush), the writer accepts neither documents nor another flush.
 *
 * Positions are counted per field: the i-th token of a field has position
 * i, and a field repeated within a document continues where it left off.
 */
class segment_writer {
public:
    using term_id_type = std::uint32_t;

    explicit segment_writer(bool store_positions = false)
        : store_positions_(store_positions)
    {}

    segment_writer(const segment_writer&) = delete;
    segment_writer& operator=(const segment_writer&) = delete;
    segment_writer(segment_writer&&) = default;
    segment_writer& operator=(segment_writer&&) = default;
    ~segment_writer() = default;

    //! Buffers the document and returns its ID within the segment.
    //!
    //! \throws invalid_state   if the writer has been flushed or failed
    document_t add_document(const document& doc)
    {
        enforce_open("add_document");
        if (document_sizes_.size() == std::numeric_limits<document_t>::max()) {
            throw std::length_error("segment is full");
        }
        auto id = static_cast<document_t>(document_sizes_.size());
        document_sizes_.push_back(0);
        std::unordered_map<std::string, position_t> next_position;
        for (const auto& [field, tokens] : doc.fields())
        {
            position_t& position = next_position[field];
            for (const auto& token : tokens) {
                add_term(id, term(field, token), position++);
            }
        }
        return id;
    }

    //! Writes the buffered documents to `<name>.seg` in `dir`.
    //!
    //! Either the complete segment file appears or none does.
    //!
    //! \throws invalid_state   if the writer is not open
    //! \throws io_failure      if the segment cannot be written; the writer
    //!                         is then failed
    segment_info flush(const boost::filesystem::path& dir, const std::string& name)
    {
        enforce_open("flush");
        auto file = dir / (name + segment_format::extension);
        try {
            sort_terms();
            io::write_durably(file, serialize());
        } catch (...) {
            state_ = writer_state::failed;
            if (auto log = spdlog::get("segkit"); log) {
                log->error("Failed to flush segment {}", file.string());
            }
            throw;
        }
        state_ = writer_state::flushed;
        segment_info info{name,
            file,
            document_count(),
            term_count(),
            all_occurrences_,
            store_positions_};
        if (auto log = spdlog::get("segkit"); log) {
            log->info("Flushed segment {}: {} documents, {} terms",
                name,
                info.document_count,
                info.term_count);
        }
        return info;
    }

    writer_state state() const { return state_; }
    bool store_positions() const { return store_positions_; }

    //! Returns the number of buffered documents.
    document_t document_count() const
    {
        return static_cast<document_t>(document_sizes_.size());
    }

    //! Returns the number of distinct terms.
    std::size_t term_count() const { return term_map_.size(); }

    //! Returns the total number of term occurrences.
    std::uint64_t occurrences() const { return all_occurrences_; }

private:
    void enforce_open(const char* operation) const
    {
        if (state_ != writer_state::open) {
            throw invalid_state(fmt::format(
                "cannot {} on a segment writer in state {}",
                operation,
                state_ == writer_state::flushed ? "flushed" : "failed"));
        }
    }

    void add_term(document_t doc, term t, position_t position)
    {
        ++all_occurrences_;
        ++document_sizes_.back();
        auto ti = term_map_.find(t);
        if (ti != term_map_.end())
        {
            auto& postings = postings_[ti->second];
            if (postings.back().document == doc) {
                postings.back().frequency++;
            } else {
                postings.push_back({doc, 1, {}});
            }
            if (store_positions_) {
                postings.back().positions.push_back(position);
            }
        }
        else
        {
            auto term_id = static_cast<term_id_type>(term_map_.size());
            term_map_.emplace(std::move(t), term_id);
            postings_.push_back({{doc, 1, {}}});
            if (store_positions_) {
                postings_.back().back().positions.push_back(position);
            }
        }
    }

    //! Sorts the terms, and the posting lists with them, lexicographically.
    void sort_terms()
    {
        sorted_terms_.clear();
        sorted_terms_.reserve(term_map_.size());
        for (const auto& term_entry : term_map_) {
            sorted_terms_.push_back(term_entry.first);
        }
        std::sort(sorted_terms_.begin(), sorted_terms_.end());

        std::vector<std::vector<posting>> postings;
        postings.reserve(postings_.size());
        for (const auto& t : sorted_terms_)
        {
            auto& term_id = term_map_[t];
            postings.push_back(std::move(postings_[term_id]));
            term_id = static_cast<term_id_type>(postings.size() - 1);
        }
        postings_ = std::move(postings);
        ENSURES(postings_.size() == sorted_terms_.size());
    }

    std::vector<char> serialize() const
    {
        segment_builder builder(store_positions_);
        for (std::size_t idx = 0; idx < sorted_terms_.size(); ++idx)
        {
            posting_list_encoder encoder(store_positions_);
            for (const auto& p : postings_[idx]) { encoder.add(p); }
            builder.add_term(sorted_terms_[idx], encoder);
        }
        return builder.build(document_sizes_, all_occurrences_);
    }

    bool store_positions_;
    writer_state state_ = writer_state::open;
    std::uint64_t all_occurrences_ = 0;
    std::vector<term> sorted_terms_;
    std::vector<std::vector<posting>> postings_;
    std::vector<frequency_t> document_sizes_;
    std::unordered_map<term, term_id_type> term_map_;
};

}  // namespace sgk
