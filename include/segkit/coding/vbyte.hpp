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

#include <cstdint>
#include <iterator>
#include <limits>
#include <type_traits>

#include <fmt/format.h>

#include <segkit/error.hpp>

namespace sgk {

//! Variable-byte integer codec.
//!
//! Seven payload bits per byte, least significant group first; the last
//! byte of a value has its high bit set.
template<class T>
struct vbyte_codec {
    using value_type = T;
    using unsigned_type = std::make_unsigned_t<T>;
    static constexpr std::uint8_t maxv = 128;
    static constexpr int max_bytes = (sizeof(T) * 8 + 6) / 7;

    std::ptrdiff_t max_encoded_size(std::ptrdiff_t count) const
    {
        return count * max_bytes;
    }

    template<class OutputIterator>
    OutputIterator encode(T value, OutputIterator out) const
    {
        auto v = static_cast<unsigned_type>(value);
        while (true)
        {
            auto last_byte = v < maxv;
            *out = static_cast<char>(v % maxv + maxv * last_byte);
            ++out;
            if (last_byte) { break; }
            v /= maxv;
        }
        return out;
    }

    template<class InputIterator, class OutputIterator>
    OutputIterator
    encode(InputIterator lo, InputIterator hi, OutputIterator out) const
    {
        for (; lo != hi; ++lo) { out = encode(*lo, out); }
        return out;
    }

    //! Decodes a single value from `[in, end)`.
    //!
    //! \throws corrupt_data    if the input ends before the last byte of
    //!                         the value, or the value does not fit in `T`
    template<class InputIterator>
    InputIterator decode(InputIterator in, InputIterator end, T& out) const
    {
        std::uint64_t n = 0;
        unsigned int shift = 0;
        while (true)
        {
            if (in == end) {
                throw corrupt_data("truncated variable-byte value");
            }
            auto b = static_cast<unsigned char>(*in);
            ++in;
            std::uint64_t val = b & 0b01111111u;
            if (shift > 0 && (val >> (64 - shift)) != 0) {
                throw corrupt_data("variable-byte value overflow");
            }
            n |= val << shift;
            if ((b & 0b10000000u) != 0) { break; }
            shift += 7;
            if (shift >= 64) {
                throw corrupt_data("variable-byte value overflow");
            }
        }
        if (n > std::numeric_limits<unsigned_type>::max()) {
            throw corrupt_data(fmt::format(
                "variable-byte value {} exceeds {} bytes", n, sizeof(T)));
        }
        out = static_cast<T>(n);
        return in;
    }

    template<class InputIterator, class OutputIterator>
    InputIterator decode(
        InputIterator in, InputIterator end, OutputIterator out, int n) const
    {
        for (int idx = 0; idx < n; ++idx)
        {
            T value;
            in = decode(in, end, value);
            *out++ = value;
        }
        return in;
    }
};

}  // namespace sgk
