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

#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <nonstd/expected.hpp>

#include <segkit/types.hpp>

namespace sgk {

enum class query_kind { term, all_of, any_of, negation };

//! A boolean query tree over terms.
/*!
 * Leaves are terms; inner nodes are conjunctions (`all_of`), disjunctions
 * (`any_of`), and negations. A negation matches the documents of a segment
 * that its operand does not match.
 */
class query {
public:
    query_kind kind() const { return kind_; }

    //! Returns the term of a leaf.
    const sgk::term& leaf() const { return term_; }

    const std::vector<query>& children() const { return children_; }

    //! Returns the operand of a negation.
    const query& operand() const { return children_.front(); }

    bool operator==(const query& rhs) const
    {
        return kind_ == rhs.kind_ && term_ == rhs.term_
            && children_ == rhs.children_;
    }
    bool operator!=(const query& rhs) const { return not(*this == rhs); }

    friend query term_query(std::string field, std::string token);
    friend query all_of(std::vector<query> children);
    friend query any_of(std::vector<query> children);
    friend query negate(query operand);

private:
    query(query_kind kind, sgk::term t, std::vector<query> children)
        : kind_(kind), term_(std::move(t)), children_(std::move(children))
    {}

    query_kind kind_ = query_kind::term;
    sgk::term term_{};
    std::vector<query> children_{};
};

inline query term_query(std::string field, std::string token)
{
    return query(query_kind::term, term(std::move(field), std::move(token)), {});
}

//! \throws std::invalid_argument   if `children` is empty
inline query all_of(std::vector<query> children)
{
    if (children.empty()) {
        throw std::invalid_argument("conjunction of no queries");
    }
    return query(query_kind::all_of, {}, std::move(children));
}

//! \throws std::invalid_argument   if `children` is empty
inline query any_of(std::vector<query> children)
{
    if (children.empty()) {
        throw std::invalid_argument("disjunction of no queries");
    }
    return query(query_kind::any_of, {}, std::move(children));
}

inline query negate(query operand)
{
    return query(query_kind::negation, {}, {std::move(operand)});
}

inline nlohmann::json to_json(const query& q)
{
    switch (q.kind()) {
    case query_kind::term:
        return {{"term", nlohmann::json::array({q.leaf().field, q.leaf().token})}};
    case query_kind::negation: return {{"not", to_json(q.operand())}};
    case query_kind::all_of:
    case query_kind::any_of: {
        auto children = nlohmann::json::array();
        for (const auto& child : q.children()) {
            children.push_back(to_json(child));
        }
        return {{q.kind() == query_kind::all_of ? "and" : "or", children}};
    }
    }
    throw std::domain_error("query_kind: non-exhaustive switch");
}

inline std::ostream& operator<<(std::ostream& os, const query& q)
{
    return os << to_json(q).dump();
}

//! Parses a term written as `field:token`.
/*!
 * A term without a colon belongs to `default_field`; it is an error if
 * `default_field` is empty. Neither the field nor the token may be empty.
 */
inline nonstd::expected<term, std::string>
parse_term(std::string_view text, std::string_view default_field = "")
{
    auto colon = text.find(':');
    if (colon == std::string_view::npos) {
        if (default_field.empty()) {
            return nonstd::make_unexpected(fmt::format(
                "term {} has no field and no default field is set", text));
        }
        return term(std::string(default_field), std::string(text));
    }
    if (colon == 0 || colon + 1 == text.size()) {
        return nonstd::make_unexpected(fmt::format("invalid term: {}", text));
    }
    return term(std::string(text.substr(0, colon)),
        std::string(text.substr(colon + 1)));
}

//! Reads a query tree from JSON.
/*!
 * Accepted nodes:
 *  - `{"term": ["field", "token"]}`
 *  - `"field:token"`, or `"token"` if `default_field` is not empty
 *  - `{"and": [query, ...]}`
 *  - `{"or": [query, ...]}`
 *  - `{"not": query}`
 */
inline nonstd::expected<query, std::string>
query_from_json(const nlohmann::json& node, std::string_view default_field = "")
{
    if (node.is_string()) {
        auto t = parse_term(node.get_ref<const std::string&>(), default_field);
        if (not t) { return nonstd::make_unexpected(t.error()); }
        return term_query(std::move(t->field), std::move(t->token));
    }
    if (not node.is_object() || node.size() != 1) {
        return nonstd::make_unexpected(fmt::format(
            "query node must be a string or an object with a single key: {}",
            node.dump()));
    }
    auto it = node.begin();
    const std::string& key = it.key();
    const nlohmann::json& value = it.value();
    if (key == "term")
    {
        if (not value.is_array() || value.size() != 2 || not value[0].is_string()
            || not value[1].is_string())
        {
            return nonstd::make_unexpected(
                fmt::format("term must be [field, token]: {}", value.dump()));
        }
        return term_query(value[0].get<std::string>(), value[1].get<std::string>());
    }
    if (key == "not")
    {
        auto operand = query_from_json(value, default_field);
        if (not operand) { return operand; }
        return negate(std::move(*operand));
    }
    if (key == "and" || key == "or")
    {
        if (not value.is_array() || value.empty()) {
            return nonstd::make_unexpected(fmt::format(
                "{} must be a non-empty array: {}", key, value.dump()));
        }
        std::vector<query> children;
        for (const auto& child : value)
        {
            auto parsed = query_from_json(child, default_field);
            if (not parsed) { return parsed; }
            children.push_back(std::move(*parsed));
        }
        return key == "and" ? all_of(std::move(children))
                            : any_of(std::move(children));
    }
    return nonstd::make_unexpected(fmt::format("unknown query node: {}", key));
}

//! Parses the text of a JSON query.
inline nonstd::expected<query, std::string>
parse_query(std::string_view text, std::string_view default_field = "")
{
    nlohmann::json node;
    try {
        node = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& err) {
        return nonstd::make_unexpected(
            fmt::format("invalid query JSON: {}", err.what()));
    }
    return query_from_json(node, default_field);
}

}  // namespace sgk
