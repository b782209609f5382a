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

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <segkit/error.hpp>

namespace sgk::io {

namespace fs = boost::filesystem;
using boost::filesystem::path;

inline void enforce_exist(const path& file)
{
    if (not fs::exists(file)) {
        throw io_failure("File not found: " + file.generic_string());
    }
}

inline std::vector<char> load_data(const path& data_file)
{
    enforce_exist(data_file);
    std::ifstream in(data_file.c_str(), std::ios::binary);
    in.seekg(0, std::ios::end);
    std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);
    std::vector<char> data_container(size);
    if (size > 0 && not in.read(data_container.data(), size)) {
        throw io_failure("Failed reading " + data_file.string());
    }
    return data_container;
}

//! Flushes the file (or directory) at `p` to durable storage.
inline void fsync(const path& p)
{
    int flags = fs::is_directory(p) ? O_RDONLY | O_DIRECTORY : O_RDONLY;
    int fd = ::open(p.c_str(), flags);
    if (fd < 0) {
        throw io_failure(fmt::format(
            "cannot open {} for sync: {}", p.string(), std::strerror(errno)));
    }
    int result = ::fsync(fd);
    int sync_errno = errno;
    ::close(fd);
    if (result != 0) {
        throw io_failure(fmt::format(
            "fsync failed for {}: {}", p.string(), std::strerror(sync_errno)));
    }
}

//! Writes `data` to `target` such that either the complete file or nothing
//! becomes visible under `target`.
//!
//! Data is written to a temporary sibling file, synced, renamed, and the
//! parent directory is synced. On failure the temporary file is removed.
inline void write_durably(const path& target, const std::vector<char>& data)
{
    path tmp = target;
    tmp += ".tmp";
    try {
        {
            std::ofstream out(tmp.c_str(), std::ios::binary | std::ios::trunc);
            if (not out) {
                throw io_failure("cannot create " + tmp.string());
            }
            out.write(data.data(), data.size());
            out.flush();
            if (not out) { throw io_failure("failed writing " + tmp.string()); }
        }
        fsync(tmp);
        boost::system::error_code ec;
        fs::rename(tmp, target, ec);
        if (ec) {
            throw io_failure(fmt::format("cannot rename {} to {}: {}",
                tmp.string(), target.string(), ec.message()));
        }
        fsync(target.parent_path().empty() ? path(".") : target.parent_path());
    } catch (...) {
        boost::system::error_code ignored;
        fs::remove(tmp, ignored);
        throw;
    }
}

inline void write_durably(const path& target, const std::string& data)
{
    write_durably(target, std::vector<char>(data.begin(), data.end()));
}

//! Splits text on white spaces, skipping empty tokens.
inline std::vector<std::string> tokenize(const std::string& text)
{
    std::vector<std::string> tokens;
    boost::algorithm::split(tokens,
        text,
        boost::algorithm::is_space(),
        boost::algorithm::token_compress_on);
    tokens.erase(std::remove(tokens.begin(), tokens.end(), std::string()),
        tokens.end());
    return tokens;
}

}  // namespace sgk::io
