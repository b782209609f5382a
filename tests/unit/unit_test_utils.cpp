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

#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <segkit/utils.hpp>

namespace {

using entry = std::pair<int, double>;
using ::testing::ElementsAre;

TEST(top_k_accumulator, keeps_best)
{
    sgk::top_k_accumulator<int, double> top(3);
    ASSERT_TRUE(top.accumulate(0, 1.0));
    ASSERT_TRUE(top.accumulate(1, 5.0));
    ASSERT_TRUE(top.accumulate(2, 3.0));
    ASSERT_TRUE(top.accumulate(3, 4.0));
    ASSERT_FALSE(top.accumulate(4, 0.5));
    ASSERT_EQ(top.size(), 3u);
    ASSERT_THAT(top.sorted(),
        ElementsAre(entry{1, 5.0}, entry{3, 4.0}, entry{2, 3.0}));
}

TEST(top_k_accumulator, ties_by_key)
{
    sgk::top_k_accumulator<int, double> top(2);
    top.accumulate(7, 1.0);
    top.accumulate(3, 1.0);
    top.accumulate(5, 1.0);
    ASSERT_FALSE(top.accumulate(9, 1.0));
    ASSERT_THAT(top.sorted(), ElementsAre(entry{3, 1.0}, entry{5, 1.0}));
}

TEST(top_k_accumulator, unlimited)
{
    sgk::top_k_accumulator<int, double> top(0);
    for (int key = 0; key < 100; ++key) {
        ASSERT_TRUE(top.accumulate(key, key % 3));
    }
    auto sorted = top.sorted();
    ASSERT_EQ(sorted.size(), 100u);
    ASSERT_EQ(sorted.front(), (entry{2, 2.0}));
    ASSERT_EQ(sorted.back(), (entry{99, 0.0}));
}

}  // namespace

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
