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

#include <mutex>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include <segkit/io.hpp>
#include <segkit/memoryview.hpp>
#include <segkit/segment_reader.hpp>
#include <segkit/segment_writer.hpp>
#include <segkit/types.hpp>

namespace sgk::test {

//! Unique temporary directories, removed with all their contents when
//! the registry is destroyed.
class temporary_directories {
public:
    temporary_directories() = default;
    temporary_directories(const temporary_directories&) = delete;
    temporary_directories& operator=(const temporary_directories&) = delete;

    ~temporary_directories()
    {
        for (const auto& dir : dirs_) {
            boost::system::error_code ec;
            boost::filesystem::remove_all(dir, ec);
        }
    }

    boost::filesystem::path create()
    {
        auto dir = boost::filesystem::temp_directory_path()
            / boost::filesystem::unique_path();
        boost::filesystem::create_directory(dir);
        std::lock_guard<std::mutex> lock(mutex_);
        dirs_.push_back(dir);
        return dir;
    }

private:
    std::vector<boost::filesystem::path> dirs_;
    std::mutex mutex_;
};

//! Creates a temporary directory removed when the test program exits.
inline boost::filesystem::path tmpdir()
{
    static temporary_directories dirs;
    return dirs.create();
}

//! A document with a single, white-space tokenized field.
inline document text_document(const std::string& field, const std::string& text)
{
    return document{{field, io::tokenize(text)}};
}

inline std::vector<document> body_documents(const std::vector<std::string>& texts)
{
    std::vector<document> documents;
    for (const auto& text : texts) {
        documents.push_back(text_document("body", text));
    }
    return documents;
}

//! Writes the documents into a new segment file in `dir`.
inline segment_info write_segment(const boost::filesystem::path& dir,
    const std::string& name,
    const std::vector<document>& documents,
    bool positions = false)
{
    segment_writer writer(positions);
    for (const auto& doc : documents) { writer.add_document(doc); }
    return writer.flush(dir, name);
}

//! Builds an in-memory segment of the documents.
inline segment_reader build_segment(const std::vector<document>& documents,
    bool positions = false)
{
    temporary_directories dirs;
    auto info = write_segment(dirs.create(), "test", documents, positions);
    return segment_reader(make_memory_view(io::load_data(info.file)));
}

//! Returns the documents of the term's posting list, or nothing if absent.
inline std::vector<document_t>
documents_of(const segment_reader& reader, const term& t)
{
    std::vector<document_t> documents;
    if (auto postings = reader.term_postings(t); postings) {
        for (const auto& p : *postings) { documents.push_back(p.document); }
    }
    return documents;
}

}  // namespace sgk::test
