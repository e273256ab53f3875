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

#ifndef PLUNWIND_ASYNC_H
#define PLUNWIND_ASYNC_H

#include <stdio.h> // for snprintf
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <stdbool.h>
#include <stdint.h>
#include <assert.h>
#include <sys/types.h>

#include "PLUnwindMacros.h"

// assert() support. We prefer to leave assertions on in release builds, but need
// to disable them in async-safe code paths.
#ifdef PLUW_RELEASE_BUILD

#define PLUW_ASSERT(expr)

#else

#define PLUW_ASSERT(expr) assert(expr)

#endif /* PLUW_RELEASE_BUILD */

/**
 * Compile-time assertion. @a name must be a unique identifier within the enclosing scope.
 */
#define PLUW_ASSERT_STATIC(name, expr) static_assert((expr), #name)

/**
 * @internal
 *
 * Unconditionally write a single formatted log line to stderr. Lines are capped at 128 bytes (stack
 * space is scarce). The formatting relies on snprintf(), and is not strictly async-safe; the output
 * path itself only uses write(2).
 */
#define PLUW_LOG_LINE(msg, args...) {\
    char __tmp_output[128];\
    snprintf(__tmp_output, sizeof(__tmp_output), "[PLUnwind] "); \
    plunwind_async_writen(STDERR_FILENO, __tmp_output, strlen(__tmp_output));\
    \
    snprintf(__tmp_output, sizeof(__tmp_output), ":%d: ", __LINE__); \
    plunwind_async_writen(STDERR_FILENO, __func__, strlen(__func__));\
    plunwind_async_writen(STDERR_FILENO, __tmp_output, strlen(__tmp_output));\
    \
    snprintf(__tmp_output, sizeof(__tmp_output), msg, ## args); \
    plunwind_async_writen(STDERR_FILENO, __tmp_output, strlen(__tmp_output));\
    \
    __tmp_output[0] = '\n'; \
    plunwind_async_writen(STDERR_FILENO, __tmp_output, 1); \
}

// Debug output support. This implemention should not be enabled in release builds
#ifdef PLUW_RELEASE_BUILD

#define PLUW_DEBUG(msg, args...)

#else

#define PLUW_DEBUG(msg, args...) PLUW_LOG_LINE(msg, ## args)

#endif /* PLUW_RELEASE_BUILD */

/**
 * Report an unrecoverable error and terminate the process. Unlike PLUW_DEBUG, the message
 * is emitted in release builds.
 */
#define PLUW_FATAL(msg, args...) {\
    PLUW_LOG_LINE(msg, ## args); \
    abort(); \
}

/**
 * @ingroup plunwind_async
 * Error return codes.
 */
typedef enum  {
    /** Success */
    PLUNWIND_ESUCCESS = 0,
    
    /** The output file can not be opened or written to */
    PLUNWIND_OUTPUT_ERR,
    
    /** Internal error */
    PLUNWIND_EINTERNAL,

    /** The register number is not supported by the target register set. */
    PLUNWIND_EBADREG,
} plunwind_error_t;

PLUW_C_BEGIN_DECLS

const char *plunwind_async_strerror (plunwind_error_t error);

void *plunwind_async_memcpy (void *dest, const void *source, size_t n);
void *plunwind_async_memset (void *dest, uint8_t value, size_t n);

ssize_t plunwind_async_writen (int fd, const void *data, size_t len);

PLUW_C_END_DECLS

#endif /* PLUNWIND_ASYNC_H */
