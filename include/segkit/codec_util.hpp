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
#include <string>
#include <string_view>
#include <vector>

#include <boost/crc.hpp>
#include <fmt/format.h>

#include <segkit/coding/vbyte.hpp>
#include <segkit/error.hpp>
#include <segkit/memoryview.hpp>

//! Framing of persisted files: codec header, fixed-width fields, and a
//! checksummed footer.
namespace sgk::codec {

constexpr std::uint32_t codec_magic = 0x3FD76C17;
constexpr std::uint32_t footer_magic = ~codec_magic;
constexpr std::ptrdiff_t footer_length = 16;

template<class T>
void write_fixed(std::vector<char>& out, T value)
{
    auto v = static_cast<std::uint64_t>(value);
    for (std::size_t idx = 0; idx < sizeof(T); ++idx) {
        out.push_back(static_cast<char>((v >> (8 * idx)) & 0xFFu));
    }
}

template<class T>
void write_vbyte(std::vector<char>& out, T value)
{
    vbyte_codec<T>{}.encode(value, std::back_inserter(out));
}

inline void write_string(std::vector<char>& out, std::string_view str)
{
    write_vbyte<std::uint64_t>(out, str.size());
    out.insert(out.end(), str.begin(), str.end());
}

inline std::uint32_t crc32(const char* data, std::size_t size)
{
    boost::crc_32_type crc;
    crc.process_bytes(data, size);
    return crc.checksum();
}

//! Sequential reader of bytes from a memory view.
//!
//! Every read past the end throws corrupt_data.
class byte_reader {
public:
    explicit byte_reader(memory_view memory) : memory_(std::move(memory)) {}

    template<class T>
    T read_fixed()
    {
        ensure_available(sizeof(T));
        std::uint64_t v = 0;
        for (std::size_t idx = 0; idx < sizeof(T); ++idx) {
            auto b = static_cast<unsigned char>(memory_[pos_ + idx]);
            v |= static_cast<std::uint64_t>(b) << (8 * idx);
        }
        pos_ += sizeof(T);
        return static_cast<T>(v);
    }

    template<class T>
    T read_vbyte()
    {
        T value{};
        auto first = memory_.begin() + pos_;
        auto next = vbyte_codec<T>{}.decode(first, memory_.end(), value);
        pos_ += next - first;
        return value;
    }

    std::string read_string()
    {
        auto size = read_vbyte<std::uint64_t>();
        ensure_available(size);
        std::string str(memory_.data() + pos_, size);
        pos_ += size;
        return str;
    }

    memory_view read_view(std::ptrdiff_t size)
    {
        ensure_available(size);
        auto view = memory_.range(pos_, size);
        pos_ += size;
        return view;
    }

    std::ptrdiff_t position() const { return pos_; }
    std::ptrdiff_t remaining() const { return memory_.size() - pos_; }
    bool exhausted() const { return remaining() == 0; }

private:
    void ensure_available(std::uint64_t size) const
    {
        if (size > static_cast<std::uint64_t>(remaining())) {
            throw corrupt_data(fmt::format(
                "unexpected end of data: requested {} bytes, {} remaining",
                size,
                remaining()));
        }
    }

    memory_view memory_;
    std::ptrdiff_t pos_ = 0;
};

inline void
write_header(std::vector<char>& out, std::string_view codec, std::int32_t version)
{
    if (codec.size() >= 128) {
        throw std::invalid_argument(fmt::format(
            "codec must be simple ASCII less than 128 characters, got {}",
            codec));
    }
    write_fixed<std::uint32_t>(out, codec_magic);
    write_string(out, codec);
    write_fixed<std::int32_t>(out, version);
}

//! Reads the header and returns the version.
//!
//! \throws corrupt_data    on magic or codec mismatch, or a version outside
//!                         of `[min_version, max_version]`
inline std::int32_t check_header(byte_reader& in,
    std::string_view codec,
    std::int32_t min_version,
    std::int32_t max_version)
{
    auto magic = in.read_fixed<std::uint32_t>();
    if (magic != codec_magic) {
        throw corrupt_data(fmt::format(
            "codec header mismatch: actual={:#x}, expected={:#x}",
            magic,
            codec_magic));
    }
    auto actual_codec = in.read_string();
    if (actual_codec != codec) {
        throw corrupt_data(fmt::format(
            "codec mismatch: actual={}, expected={}", actual_codec, codec));
    }
    auto version = in.read_fixed<std::int32_t>();
    if (version < min_version || version > max_version) {
        throw corrupt_data(fmt::format(
            "format either too new or too old: {} <= {} <= {} doesn't hold",
            min_version,
            version,
            max_version));
    }
    return version;
}

//! Appends the footer: magic, algorithm ID, and CRC-32 of all preceding
//! bytes (including the magic and algorithm ID).
inline void write_footer(std::vector<char>& out)
{
    write_fixed<std::uint32_t>(out, footer_magic);
    write_fixed<std::uint32_t>(out, 0);
    write_fixed<std::uint64_t>(out, crc32(out.data(), out.size()));
}

//! Validates the footer and the checksum of the entire file.
//!
//! \returns    the view of the data without the footer
inline memory_view check_footer(const memory_view& file)
{
    if (file.size() < footer_length) {
        throw corrupt_data(fmt::format(
            "misplaced codec footer (file truncated?): length={}, "
            "footer_length={}",
            file.size(),
            footer_length));
    }
    byte_reader footer(file.range(file.size() - footer_length, footer_length));
    auto magic = footer.read_fixed<std::uint32_t>();
    if (magic != footer_magic) {
        throw corrupt_data(fmt::format(
            "codec footer mismatch: actual={:#x} vs expected={:#x}",
            magic,
            footer_magic));
    }
    auto algorithm_id = footer.read_fixed<std::uint32_t>();
    if (algorithm_id != 0) {
        throw corrupt_data(fmt::format(
            "codec footer mismatch: unknown algorithm_id: {}", algorithm_id));
    }
    auto expected = footer.read_fixed<std::uint64_t>();
    if ((expected & 0xFFFFFFFF00000000ull) != 0) {
        throw corrupt_data(
            fmt::format("Illegal CRC-32 checksum: {}", expected));
    }
    auto actual = crc32(file.data(), file.size() - 8);
    if (actual != expected) {
        throw corrupt_data(fmt::format(
            "checksum failed: expected={:#x}, actual={:#x}", expected, actual));
    }
    return file.range(0, file.size() - footer_length);
}

}  // namespace sgk::codec
