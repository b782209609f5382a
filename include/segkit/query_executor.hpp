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
#include <iterator>
#include <stdexcept>
#include <vector>

#include <segkit/query.hpp>
#include <segkit/score.hpp>
#include <segkit/segment_reader.hpp>
#include <segkit/segment_set.hpp>
#include <segkit/types.hpp>
#include <segkit/utils.hpp>

namespace sgk {

struct query_options {
    score::score_function score_function = score::score_function::tf;
    std::size_t k = 0;  //!< Maximum number of results, or 0 for all.
};

using result_list = std::vector<scored_document>;

namespace detail {

    //! Documents in both lists; scores are summed.
    inline result_list intersect(const result_list& lhs, const result_list& rhs)
    {
        result_list result;
        auto left = lhs.begin();
        auto right = rhs.begin();
        while (left != lhs.end() && right != rhs.end())
        {
            if (left->document < right->document) {
                ++left;
            } else if (right->document < left->document) {
                ++right;
            } else {
                result.push_back(
                    {left->document, left->score + right->score});
                ++left;
                ++right;
            }
        }
        return result;
    }

    //! Documents in any of the lists; scores of common documents are summed.
    inline result_list unite(const result_list& lhs, const result_list& rhs)
    {
        result_list result;
        result.reserve(std::max(lhs.size(), rhs.size()));
        auto left = lhs.begin();
        auto right = rhs.begin();
        while (left != lhs.end() && right != rhs.end())
        {
            if (left->document < right->document) {
                result.push_back(*left++);
            } else if (right->document < left->document) {
                result.push_back(*right++);
            } else {
                result.push_back(
                    {left->document, left->score + right->score});
                ++left;
                ++right;
            }
        }
        result.insert(result.end(), left, lhs.end());
        result.insert(result.end(), right, rhs.end());
        return result;
    }

    //! Documents in `lhs` but not in `rhs`, with the scores of `lhs`.
    inline result_list subtract(const result_list& lhs, const result_list& rhs)
    {
        result_list result;
        auto right = rhs.begin();
        for (const auto& entry : lhs)
        {
            while (right != rhs.end() && right->document < entry.document) {
                ++right;
            }
            if (right == rhs.end() || right->document != entry.document) {
                result.push_back(entry);
            }
        }
        return result;
    }

    //! Documents in `[0, document_count)` not in `excluded`, scored 0.
    inline result_list
    complement(const result_list& excluded, document_t document_count)
    {
        result_list result;
        auto next = excluded.begin();
        for (document_t doc = 0; doc < document_count; ++doc)
        {
            if (next != excluded.end() && next->document == doc) {
                ++next;
                continue;
            }
            result.push_back({doc, 0.0});
        }
        return result;
    }

}  // namespace detail

//! Evaluates a query within a single segment.
/*!
 * Deletions are not taken into account: the result contains local IDs in
 * increasing order, deleted documents included.
 *
 * \throws corrupt_data     if a posting list cannot be decoded
 */
inline result_list evaluate(const query& q,
    const segment_reader& segment,
    score::score_function score_function)
{
    switch (q.kind()) {
    case query_kind::term: {
        result_list result;
        auto postings = segment.term_postings(q.leaf());
        if (not postings) { return result; }
        result.reserve(postings->size());
        for (const posting& p : *postings) {
            result.push_back(
                {p.document, score::score_posting(score_function, p.frequency)});
        }
        return result;
    }
    case query_kind::negation:
        return detail::complement(
            evaluate(q.operand(), segment, score_function),
            segment.document_count());
    case query_kind::any_of: {
        result_list result;
        for (const auto& child : q.children()) {
            result = detail::unite(
                result, evaluate(child, segment, score_function));
        }
        return result;
    }
    case query_kind::all_of: {
        std::vector<result_list> included;
        std::vector<result_list> excluded;
        for (const auto& child : q.children())
        {
            if (child.kind() == query_kind::negation) {
                excluded.push_back(
                    evaluate(child.operand(), segment, score_function));
            } else {
                included.push_back(evaluate(child, segment, score_function));
            }
        }
        if (included.empty()) {
            included.push_back(
                detail::complement({}, segment.document_count()));
        }
        std::sort(included.begin(),
            included.end(),
            [](const auto& lhs, const auto& rhs) {
                return lhs.size() < rhs.size();
            });
        result_list result = std::move(included.front());
        for (auto it = std::next(included.begin());
             it != included.end() && not result.empty();
             ++it)
        {
            result = detail::intersect(result, *it);
        }
        for (const auto& list : excluded) {
            result = detail::subtract(result, list);
        }
        return result;
    }
    }
    throw std::domain_error("query_kind: non-exhaustive switch");
}

//! Executes a query against all segments of a snapshot.
/*!
 * Local IDs are mapped to global IDs, and deleted documents are removed.
 * Results are ordered by decreasing score, and documents with equal scores
 * by increasing global ID. If `options.k` is positive, only the first
 * `k` results are returned.
 *
 * \throws corrupt_data     if a posting list cannot be decoded
 */
inline result_list execute(const query& q,
    const segment_set& segments,
    const query_options& options = {})
{
    top_k_accumulator<document_t, double> top(options.k);
    for (const auto& entry : segments)
    {
        for (const auto& result :
            evaluate(q, entry.reader, options.score_function))
        {
            if (entry.reader.is_live(result.document)) {
                top.accumulate(entry.base + result.document, result.score);
            }
        }
    }
    result_list results;
    results.reserve(top.size());
    for (const auto& [document, value] : top.sorted()) {
        results.push_back({document, value});
    }
    return results;
}

}  // namespace sgk
