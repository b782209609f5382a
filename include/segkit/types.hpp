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

//! \file types.hpp
//! \author Michal Siedlaczek
//! \copyright MIT License

#pragma once

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <boost/functional/hash.hpp>
#include <fmt/format.h>
#include <type_safe/strong_typedef.hpp>

namespace sgk {

namespace ts = type_safe;

using byte = unsigned char;
using document_t = std::uint32_t;
using frequency_t = std::uint32_t;
using position_t = std::uint32_t;
using offset_t = std::uint64_t;

namespace details {

    using segment_base_type = std::uint32_t;

}  // namespace details

//! Identifier of a segment within an index directory.
struct segment_id
    : ts::strong_typedef<segment_id, details::segment_base_type>,
      ts::strong_typedef_op::equality_comparison<segment_id, bool>,
      ts::strong_typedef_op::relational_comparison<segment_id, bool> {
    using strong_typedef::strong_typedef;
    explicit constexpr segment_id() noexcept : strong_typedef(0) {}
    details::segment_base_type as_int() const noexcept
    {
        return ts::get(*this);
    }
};

inline std::ostream& operator<<(std::ostream& os, const segment_id& id)
{
    return os << id.as_int();
}

//! A token within a named field.
//!
//! Terms are ordered by field first, and then by token.
struct term {
    std::string field{};
    std::string token{};

    term() = default;
    term(std::string field, std::string token)
        : field(std::move(field)), token(std::move(token))
    {}

    bool operator==(const term& rhs) const
    {
        return field == rhs.field && token == rhs.token;
    }
    bool operator!=(const term& rhs) const { return not(*this == rhs); }
    bool operator<(const term& rhs) const
    {
        return std::tie(field, token) < std::tie(rhs.field, rhs.token);
    }
    bool operator>(const term& rhs) const { return rhs < *this; }
    bool operator<=(const term& rhs) const { return not(rhs < *this); }
    bool operator>=(const term& rhs) const { return not(*this < rhs); }
};

inline std::ostream& operator<<(std::ostream& o, const term& t)
{
    return o << t.field << ":" << t.token;
}

//! A single entry of a posting list.
struct posting {
    document_t document = 0;
    frequency_t frequency = 0;
    std::vector<position_t> positions{};

    bool operator==(const posting& rhs) const
    {
        return document == rhs.document && frequency == rhs.frequency
            && positions == rhs.positions;
    }
    bool operator!=(const posting& rhs) const { return not(*this == rhs); }
};

inline std::ostream& operator<<(std::ostream& o, const posting& p)
{
    return o << p.document << ":" << p.frequency;
}

//! An ordered sequence of fields, each with its sequence of tokens.
class document {
public:
    using field_type = std::pair<std::string, std::vector<std::string>>;

    document() = default;
    document(std::initializer_list<field_type> fields) : fields_(fields) {}

    document& add(std::string name, std::vector<std::string> tokens)
    {
        fields_.emplace_back(std::move(name), std::move(tokens));
        return *this;
    }

    const std::vector<field_type>& fields() const { return fields_; }
    bool empty() const { return fields_.empty(); }

    //! Total number of tokens in all fields.
    std::size_t size() const
    {
        std::size_t count = 0;
        for (const auto& field : fields_) { count += field.second.size(); }
        return count;
    }

private:
    std::vector<field_type> fields_{};
};

//! A document matched by a query with its score.
struct scored_document {
    document_t document = 0;
    double score = 0.0;

    bool operator==(const scored_document& rhs) const
    {
        return document == rhs.document && score == rhs.score;
    }
};

inline std::ostream& operator<<(std::ostream& o, const scored_document& d)
{
    return o << "(" << d.document << "," << d.score << ")";
}

}  // namespace sgk

template<>
struct fmt::formatter<sgk::term> : fmt::formatter<std::string> {
    template<class FormatContext>
    auto format(const sgk::term& t, FormatContext& ctx) const
    {
        return fmt::formatter<std::string>::format(
            t.field + ":" + t.token, ctx);
    }
};

template<>
struct fmt::formatter<sgk::segment_id> : fmt::formatter<std::uint32_t> {
    template<class FormatContext>
    auto format(const sgk::segment_id& id, FormatContext& ctx) const
    {
        return fmt::formatter<std::uint32_t>::format(id.as_int(), ctx);
    }
};

namespace std {

template<>
struct hash<sgk::term> {
    std::size_t operator()(const sgk::term& t) const
    {
        std::size_t seed = 0;
        boost::hash_combine(seed, t.field);
        boost::hash_combine(seed, t.token);
        return seed;
    }
};

}  // namespace std
