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

#include <debug_assert.hpp>
#include <spdlog/spdlog.h>

#define EXPECTS(Expr)                                                          \
    DEBUG_ASSERT(                                                              \
        Expr,                                                                  \
        sgk::contract_handler{},                                               \
        debug_assert::level<1>{},                                              \
        "function input contract violated")

#define ENSURES(Expr)                                                          \
    DEBUG_ASSERT(                                                              \
        Expr,                                                                  \
        sgk::contract_handler{},                                               \
        debug_assert::level<1>{},                                              \
        "function output contract violated")

namespace sgk {

//! Handler of contract checks; enabled in all builds.
/*!
 * A violation is reported to the `segkit` logger if the application
 * registered one, and to the standard error otherwise. The program is then
 * aborted.
 */
struct contract_handler : debug_assert::set_level<1> {
    static void handle(const debug_assert::source_location& loc,
        const char* expression,
        const char* message) noexcept
    {
        if (auto log = spdlog::get("segkit"); log) {
            log->critical("{}:{}: {}: {}",
                loc.file_name,
                loc.line_number,
                message,
                expression);
            log->flush();
        } else {
            debug_assert::default_handler::handle(loc, expression, message);
        }
    }
};

}  // namespace sgk
