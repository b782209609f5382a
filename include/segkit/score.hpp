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
//! \author Michal Siedlaczek
//! \copyright MIT License

#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <nonstd/expected.hpp>

#include <segkit/types.hpp>

//! Scoring functions and utilities.
namespace sgk::score {

//! Scoring model applied by the query executor.
//!
//! The model is an explicit configuration value: independent
//! implementations compared result-by-result must agree on it.
enum class score_function {
    none,  //!< Boolean retrieval: every match scores 0.
    tf     //!< Sum of matched term frequencies.
};

//! A scorer for pure boolean matching.
struct boolean_scorer {
    double operator()(frequency_t /* tf */) const { return 0.0; }
};

//! A scorer counting term frequencies within scored documents.
struct count_scorer {
    //! Returns the term frequency.
    double operator()(frequency_t tf) const { return static_cast<double>(tf); }
};

inline nonstd::expected<score_function, std::string>
parse_score_function(std::string_view name)
{
    if (name == "none") {
        return score_function::none;
    }
    if (name == "tf") {
        return score_function::tf;
    }
    return nonstd::make_unexpected(
        fmt::format("cannot parse {} as a score function", name));
}

inline std::string name_of(score_function fn)
{
    switch (fn) {
    case score_function::none: return "none";
    case score_function::tf: return "tf";
    }
    return "";
}

inline std::ostream& operator<<(std::ostream& os, score_function fn)
{
    return os << name_of(fn);
}

//! Scores a single posting with the given function.
inline double score_posting(score_function fn, frequency_t tf)
{
    switch (fn) {
    case score_function::none: return boolean_scorer{}(tf);
    case score_function::tf: return count_scorer{}(tf);
    }
    throw std::domain_error("score_function: non-exhaustive switch");
}

}  // namespace sgk::score
