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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include <segkit/assert.hpp>
#include <segkit/codec_util.hpp>
#include <segkit/error.hpp>
#include <segkit/memoryview.hpp>
#include <segkit/types.hpp>

namespace sgk {

//! Location of a posting list within the postings data of a segment.
struct term_info {
    offset_t offset = 0;
    std::uint32_t length = 0;  //!< Number of documents in the posting list.

    bool operator==(const term_info& rhs) const
    {
        return offset == rhs.offset && length == rhs.length;
    }
};

struct dictionary_entry {
    sgk::term term;
    term_info info;
};

//! A sorted mapping from terms to posting list locations.
class term_dictionary {
public:
    using const_iterator = std::vector<dictionary_entry>::const_iterator;

    term_dictionary() = default;

    //! Returns the position of `t` in the dictionary, if present.
    std::optional<std::size_t> index_of(const term& t) const
    {
        auto pos = std::lower_bound(entries_.begin(),
            entries_.end(),
            t,
            [](const dictionary_entry& entry, const term& key) {
                return entry.term < key;
            });
        if (pos == entries_.end() || pos->term != t) { return std::nullopt; }
        return static_cast<std::size_t>(std::distance(entries_.begin(), pos));
    }

    //! Returns the posting list location of `t`, or `nullopt` if absent.
    std::optional<term_info> lookup(const term& t) const
    {
        if (auto idx = index_of(t); idx) { return entries_[*idx].info; }
        return std::nullopt;
    }

    const dictionary_entry& operator[](std::size_t idx) const
    {
        EXPECTS(idx < entries_.size());
        return entries_[idx];
    }
    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    //! Appends the front-coded dictionary to `out`.
    void serialize(std::vector<char>& out) const
    {
        std::vector<std::string> fields;
        for (const auto& entry : entries_) {
            if (fields.empty() || fields.back() != entry.term.field) {
                fields.push_back(entry.term.field);
            }
        }
        codec::write_vbyte<std::uint64_t>(out, fields.size());
        for (const auto& field : fields) { codec::write_string(out, field); }
        codec::write_vbyte<std::uint64_t>(out, entries_.size());

        std::uint64_t field_idx = 0;
        const dictionary_entry* previous = nullptr;
        for (const auto& entry : entries_)
        {
            while (fields[field_idx] != entry.term.field) { ++field_idx; }
            std::size_t shared = 0;
            offset_t offset_gap = entry.info.offset;
            if (previous != nullptr) {
                offset_gap -= previous->info.offset;
                if (previous->term.field == entry.term.field) {
                    shared = shared_prefix(previous->term.token, entry.term.token);
                }
            }
            codec::write_vbyte<std::uint64_t>(out, field_idx);
            codec::write_vbyte<std::uint64_t>(out, shared);
            codec::write_string(
                out, std::string_view(entry.term.token).substr(shared));
            codec::write_vbyte<offset_t>(out, offset_gap);
            codec::write_vbyte<std::uint32_t>(out, entry.info.length);
            previous = &entry;
        }
    }

    //! Reads a dictionary written by serialize().
    //!
    //! \throws corrupt_data    if the data is truncated, or terms are not
    //!                         strictly increasing
    static term_dictionary deserialize(const memory_view& memory)
    {
        codec::byte_reader in(memory);
        auto field_count = in.read_vbyte<std::uint64_t>();
        std::vector<std::string> fields;
        for (std::uint64_t idx = 0; idx < field_count; ++idx) {
            fields.push_back(in.read_string());
        }
        auto entry_count = in.read_vbyte<std::uint64_t>();
        if (entry_count > static_cast<std::uint64_t>(in.remaining())) {
            throw corrupt_data(fmt::format(
                "dictionary declares {} entries in {} bytes",
                entry_count,
                in.remaining()));
        }

        term_dictionary dictionary;
        dictionary.entries_.reserve(entry_count);
        for (std::uint64_t idx = 0; idx < entry_count; ++idx)
        {
            auto field_idx = in.read_vbyte<std::uint64_t>();
            auto shared = in.read_vbyte<std::uint64_t>();
            auto suffix = in.read_string();
            auto offset_gap = in.read_vbyte<offset_t>();
            auto length = in.read_vbyte<std::uint32_t>();
            if (field_idx >= fields.size()) {
                throw corrupt_data(
                    fmt::format("unknown field index {}", field_idx));
            }
            dictionary_entry entry{{fields[field_idx], {}}, {offset_gap, length}};
            if (not dictionary.entries_.empty())
            {
                const auto& previous = dictionary.entries_.back();
                bool same_field = previous.term.field == entry.term.field;
                if (shared > 0
                    && (not same_field || shared > previous.term.token.size()))
                {
                    throw corrupt_data("invalid shared prefix length");
                }
                entry.term.token = previous.term.token.substr(0, shared);
                entry.info.offset += previous.info.offset;
                if (entry.info.offset < previous.info.offset) {
                    throw corrupt_data("posting offset overflow");
                }
            }
            else if (shared > 0) {
                throw corrupt_data("invalid shared prefix length");
            }
            entry.term.token += suffix;
            if (length == 0) {
                throw corrupt_data(
                    fmt::format("empty posting list for {}", entry.term));
            }
            if (not dictionary.entries_.empty()
                && not(dictionary.entries_.back().term < entry.term))
            {
                throw corrupt_data(fmt::format("term {} out of order after {}",
                    entry.term,
                    dictionary.entries_.back().term));
            }
            dictionary.entries_.push_back(std::move(entry));
        }
        if (not in.exhausted()) {
            throw corrupt_data(fmt::format(
                "{} trailing bytes after the dictionary", in.remaining()));
        }
        return dictionary;
    }

private:
    friend class term_dictionary_builder;

    explicit term_dictionary(std::vector<dictionary_entry> entries)
        : entries_(std::move(entries))
    {}

    static std::size_t
    shared_prefix(const std::string& lhs, const std::string& rhs)
    {
        auto mismatch = std::mismatch(lhs.begin(),
            lhs.begin() + std::min(lhs.size(), rhs.size()),
            rhs.begin());
        return std::distance(lhs.begin(), mismatch.first);
    }

    std::vector<dictionary_entry> entries_{};
};

//! Builds a term dictionary in a single pass over sorted terms.
class term_dictionary_builder {
public:
    //! Adds the next term.
    //!
    //! \throws std::invalid_argument   if `t` is not greater than the
    //!                                 previously added term, or the
    //!                                 posting list is empty or precedes the
    //!                                 previous one
    void add(term t, term_info info)
    {
        if (not entries_.empty())
        {
            const auto& last = entries_.back();
            if (not(last.term < t)) {
                throw std::invalid_argument(fmt::format(
                    "terms must be added in ascending order: {} after {}",
                    t,
                    last.term));
            }
            if (info.offset < last.info.offset) {
                throw std::invalid_argument(
                    "posting offsets must not decrease");
            }
        }
        if (info.length == 0) {
            throw std::invalid_argument(
                fmt::format("empty posting list for {}", t));
        }
        entries_.push_back({std::move(t), info});
    }

    std::size_t size() const { return entries_.size(); }

    term_dictionary build() { return term_dictionary(std::move(entries_)); }

private:
    std::vector<dictionary_entry> entries_{};
};

}  // namespace sgk
