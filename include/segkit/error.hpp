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

#include <stdexcept>
#include <string>

namespace sgk {

//! Base class of all errors reported by segkit.
class error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! An operation was called in a lifecycle state that does not allow it,
//! e.g., adding a document to a writer that has already been flushed.
class invalid_state : public error {
public:
    using error::error;
};

//! Persisted bytes failed to decode or violate an index invariant.
class corrupt_data : public error {
public:
    using error::error;
};

//! Reading or writing the underlying storage failed.
//! Never retried by the library.
class io_failure : public error {
public:
    using error::error;
};

}  // namespace sgk
