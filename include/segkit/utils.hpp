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
#include <utility>
#include <vector>

namespace sgk {

//! Accumulates the top-k entries by value, breaking ties by key.
/*!
 * Entries are ordered by decreasing value, and entries of equal value by
 * increasing key, so the result is deterministic. When `k` is 0, every
 * entry is kept.
 */
template<class Key, class Value>
class top_k_accumulator {
public:
    using key_type = Key;
    using value_type = Value;
    using entry_type = std::pair<key_type, value_type>;

private:
    std::size_t k_;
    std::vector<entry_type> top_;

    static bool result_order(const entry_type& lhs, const entry_type& rhs)
    {
        return lhs.second > rhs.second
            || (lhs.second == rhs.second && lhs.first < rhs.first);
    };

public:
    //! Initilizes an empty accumulator.
    /*!
     * @param k The size of the accumulator, or 0 for no limit.
     */
    explicit top_k_accumulator(std::size_t k) : k_(k){};

    //! Accumulates the given entry.
    /*!
     * If fewer than `k` entries are accumulated, or the entry precedes the
     * last accumulated one, it is accumulated, and the last one dropped.
     *
     * \return  `true` if accumulated
     */
    bool accumulate(key_type key, value_type value)
    {
        entry_type entry(key, value);
        if (k_ == 0 || top_.size() < k_) {
            top_.push_back(entry);
            if (k_ > 0) { std::push_heap(top_.begin(), top_.end(), result_order); }
            return true;
        }
        if (result_order(entry, top_.front())) {
            std::pop_heap(top_.begin(), top_.end(), result_order);
            top_.back() = entry;
            std::push_heap(top_.begin(), top_.end(), result_order);
            return true;
        }
        return false;
    }

    //! Produces the sorted list of the accumulated entries.
    std::vector<entry_type> sorted() const
    {
        std::vector<entry_type> sorted = top_;
        std::sort(sorted.begin(), sorted.end(), result_order);
        return sorted;
    }

    const std::vector<entry_type>& unsorted() const { return top_; }

    std::size_t size() const { return top_.size(); }
    std::size_t k() const { return k_; }
};

}  // namespace sgk
