/*
 * Copyright (c) 2015 Plausible Labs Cooperative, Inc.
 * All rights reserved.
 *
 * Permission is hereby granted, free of charge, to any person
 * obtaining a copy of this software and associated documentation
 * files (the "Software"), to deal in the Software without
 * restriction, including without limitation the rights to use,
 * copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the
 * Software is furnished to do so, subject to the following
 * conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES
 * OF MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT
 * HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY,
 * WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 * FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR
 * OTHER DEALINGS IN THE SOFTWARE.
 */

#ifndef PLUNWIND_MACROS_H
#define PLUNWIND_MACROS_H

#if defined(__cplusplus)
#   define PLUW_EXPORT extern "C"
#   define PLUW_C_BEGIN_DECLS extern "C" {
#   define PLUW_C_END_DECLS }
#else
#   define PLUW_EXPORT extern
#   define PLUW_C_BEGIN_DECLS
#   define PLUW_C_END_DECLS
#endif

#if defined(__cplusplus)
#   define PLUW_CPP_BEGIN_NS namespace plunwind {
#   define PLUW_CPP_END_NS }

/** Begin the plunwind::async namespace; used by the async-safe support code. */
#   define PLUW_CPP_BEGIN_ASYNC_NS PLUW_CPP_BEGIN_NS namespace async {
#   define PLUW_CPP_END_ASYNC_NS } PLUW_CPP_END_NS

/** Begin the plunwind::arm namespace; used by the 32-bit ARM backend. */
#   define PLUW_CPP_BEGIN_ARM_NS PLUW_CPP_BEGIN_NS namespace arm {
#   define PLUW_CPP_END_ARM_NS } PLUW_CPP_END_NS
#endif

/** Marks a function that never returns to its caller. */
#define PLUW_NORETURN __attribute__((noreturn))

#endif /* PLUNWIND_MACROS_H */
