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

#include "PLUnwindAsync.h"
#include "PLUnwindAsyncFile.hpp"

using namespace plunwind::async;

/**
 * @internal
 * @ingroup plunwind_async
 * @{
 */

/**
 * Return an error description for the given plunwind_error_t.
 */
const char *plunwind_async_strerror (plunwind_error_t error) {
    switch (error) {
        case PLUNWIND_ESUCCESS:
            return "No error";
        case PLUNWIND_OUTPUT_ERR:
            return "Output file can not be opened (or written to)";
        case PLUNWIND_EINTERNAL:
            return "Internal error";
        case PLUNWIND_EBADREG:
            return "Unsupported register number";
    }
    
    /* Should be unreachable */
    return "Unhandled error code";
}

/**
 * An intentionally naive async-safe implementation of memcpy(). memcpy() itself is not declared to be async-safe,
 * though in reality, it is.
 *
 * @param dest Destination.
 * @param source Source.
 * @param n Number of bytes to copy.
 */
void *plunwind_async_memcpy (void *dest, const void *source, size_t n) {
    uint8_t *s = (uint8_t *) source;
    uint8_t *d = (uint8_t *) dest;

    for (size_t count = 0; count < n; count++)
        *d++ = *s++;

    return dest;
}

/**
 * An intentionally naive async-safe implementation of memset().
 *
 * @param dest Destination.
 * @param value Value to be written to every byte of @a dest.
 * @param n Number of bytes to set.
 */
void *plunwind_async_memset (void *dest, uint8_t value, size_t n) {
    uint8_t *d = (uint8_t *) dest;
    
    for (size_t count = 0; count < n; count++)
        *d++ = value;

    return dest;
}

/**
 * Write @a len bytes to @a fd, looping until all bytes are written or an error occurs.
 *
 * @sa AsyncFile::writen
 */
ssize_t plunwind_async_writen (int fd, const void *data, size_t len) {
    return AsyncFile::writen(fd, data, len);
}

/**
 * @} plunwind_async
 */
