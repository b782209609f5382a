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

#include <memory>
#include <type_traits>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/iostreams/device/mapped_file.hpp>

#include <segkit/error.hpp>

namespace sgk {

//! A read-only view of a contiguous memory area.
/*!
 * The constructor accepts different types of memory sources that implement
 * memory access details: in-memory buffers or memory mapped files. These
 * types are hidden with type erasure: only the constructor is a template,
 * and `memory_view` can be used polymorphically. Every source shares the
 * ownership of its memory, so a view (or any of its ranges) keeps the data
 * alive.
 */
class memory_view {
public:
    using iterator = const char*;

    template<class source_type,
        class = std::enable_if_t<
            not std::is_same<std::decay_t<source_type>, memory_view>::value>>
    explicit memory_view(source_type source)
        : self_(std::make_shared<model<source_type>>(std::move(source)))
    {}

    memory_view() = default;
    memory_view(const memory_view&) = default;
    memory_view(memory_view&& other) = default;
    memory_view& operator=(const memory_view&) = default;
    memory_view& operator=(memory_view&&) noexcept = default;
    ~memory_view() = default;

    const char* data() const { return self_ ? self_->data() : nullptr; }
    std::ptrdiff_t size() const { return self_ ? self_->size() : 0; }
    bool empty() const { return size() == 0; }

    const char& operator[](std::ptrdiff_t n) const { return data()[n]; }

    //! Returns a new memory view of `size` bytes starting at `first`.
    //!
    //! \throws corrupt_data    if the range exceeds this view
    memory_view range(std::ptrdiff_t first, std::ptrdiff_t size) const
    {
        if (first < 0 || size < 0 || first + size > this->size()) {
            throw corrupt_data("memory range out of bounds");
        }
        return self_->range(first, size);
    }

    iterator begin() const { return data(); }
    iterator end() const { return data() + size(); }

    struct concept
    {
        concept() = default;
        concept(const concept&) = default;
        concept(concept&&) noexcept = default;
        concept& operator=(const concept&) = default;
        concept& operator=(concept&&) noexcept = default;
        virtual ~concept() = default;
        virtual const char* data() const = 0;
        virtual std::ptrdiff_t size() const = 0;
        virtual memory_view
        range(std::ptrdiff_t first, std::ptrdiff_t size) const = 0;
    };

    template<class source_type>
    class model : public concept {
    public:
        explicit model(source_type source) : source_(std::move(source)) {}
        const char* data() const override { return source_.data(); }
        std::ptrdiff_t size() const override { return source_.size(); }
        memory_view
        range(std::ptrdiff_t first, std::ptrdiff_t size) const override
        {
            return memory_view(source_.range(first, size));
        }

    private:
        source_type source_;
    };

private:
    std::shared_ptr<concept> self_;
};

//! A memory source owning an in-memory buffer.
class vector_memory_source {
public:
    explicit vector_memory_source(std::vector<char> buffer)
        : buffer_(std::make_shared<const std::vector<char>>(std::move(buffer))),
          size_(buffer_->size())
    {}
    const char* data() const { return buffer_->data() + first_; }
    std::ptrdiff_t size() const { return size_; }
    vector_memory_source range(std::ptrdiff_t first, std::ptrdiff_t size) const
    {
        return vector_memory_source(buffer_, first_ + first, size);
    }

private:
    vector_memory_source(std::shared_ptr<const std::vector<char>> buffer,
        std::ptrdiff_t first,
        std::ptrdiff_t size)
        : buffer_(std::move(buffer)), first_(first), size_(size)
    {}

    std::shared_ptr<const std::vector<char>> buffer_;
    std::ptrdiff_t first_ = 0;
    std::ptrdiff_t size_ = 0;
};

//! A memory source for mapped files.
class mapped_file_memory_source {
public:
    explicit mapped_file_memory_source(const boost::filesystem::path& file)
        : file_(std::make_shared<boost::iostreams::mapped_file_source>())
    {
        try {
            if (boost::filesystem::file_size(file) > 0) {
                file_->open(file.string());
                size_ = file_->size();
            }
        } catch (const std::exception& err) {
            throw io_failure(
                "cannot map " + file.string() + ": " + err.what());
        }
    }
    const char* data() const
    {
        return file_->is_open() ? file_->data() + first_ : nullptr;
    }
    std::ptrdiff_t size() const { return size_; }
    mapped_file_memory_source
    range(std::ptrdiff_t first, std::ptrdiff_t size) const
    {
        return mapped_file_memory_source(file_, first_ + first, size);
    }

private:
    mapped_file_memory_source(
        std::shared_ptr<boost::iostreams::mapped_file_source> file,
        std::ptrdiff_t first,
        std::ptrdiff_t size)
        : file_(std::move(file)), first_(first), size_(size)
    {}

    std::shared_ptr<boost::iostreams::mapped_file_source> file_;
    std::ptrdiff_t first_ = 0;
    std::ptrdiff_t size_ = 0;
};

inline memory_view make_memory_view(std::vector<char> buffer)
{
    return memory_view(vector_memory_source(std::move(buffer)));
}

inline memory_view make_memory_view(const boost::filesystem::path& file)
{
    return memory_view(mapped_file_memory_source(file));
}

}  // namespace sgk
