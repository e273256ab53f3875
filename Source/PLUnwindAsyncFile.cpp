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

#include "PLUnwindAsyncFile.hpp"

#include <unistd.h>
#include <errno.h>

using namespace plunwind::async;

/**
 * @internal
 * @ingroup plunwind_async
 * @{
 */

/**
 * Write @a len bytes to fd, looping until all bytes are written
 * or an error occurs.
 *
 * @param fd Open, writable file descriptor.
 * @param data The buffer to be written to @a fd.
 * @param len The total size of @a data, in bytes.
 *
 * @return Returns @len on success, or -1 on failure.
 */
ssize_t AsyncFile::writen (int fd, const void *data, size_t len) {
    const uint8_t *p = (const uint8_t *) data;
    size_t left = len;
    ssize_t written = 0;
    
    while (left > 0) {
        if ((written = ::write(fd, p, left)) <= 0) {
            if (written < 0 && errno == EINTR) {
                written = 0;
            } else {
                return -1;
            }
        }
        
        left -= written;
        p += written;
    }
    
    return len - left;
}

/**
 * Construct a new AsyncFile instance.
 *
 * @param fd Open, writable file descriptor.
 * @param output_limit Maximum number of bytes that will be written to @a fd. Specify
 * 0 to disable any limits. Once the limit is reached, all data will be dropped.
 */
AsyncFile::AsyncFile (int fd, off_t output_limit) : _fd(fd), _limit_bytes(output_limit), _total_bytes(0), _buflen(0) {}

/**
 * @internal
 *
 * Return the size of the internal buffer; the maximum number of bytes that will be
 * held before AsyncFile::write flushes to the file descriptor.
 *
 * @warning Intended for unit tests that need to know how much data triggers a flush.
 */
size_t AsyncFile::buffer_size (void) {
    return sizeof(_buffer);
}

/**
 * Write all bytes from @a data to the file buffer. Returns true on success,
 * or false if an error occurs or the output limit would be exceeded.
 *
 * @param data The buffer to be written.
 * @param len The total size of @a data, in bytes.
 */
bool AsyncFile::write (const void *data, size_t len) {
    /* Check and update output limit */
    if (_limit_bytes != 0 && (off_t) len + _total_bytes > _limit_bytes) {
        return false;
    } else if (_limit_bytes != 0) {
        _total_bytes += len;
    }
    
    /* Flush first if the new data would overflow the buffer */
    if (_buflen + len > sizeof(_buffer)) {
        if (AsyncFile::writen(_fd, _buffer, _buflen) < 0) {
            PLUW_DEBUG("Error occured writing register output: %s", strerror(errno));
            return false;
        }
        
        _buflen = 0;
    }
    
    if (len + _buflen <= sizeof(_buffer)) {
        plunwind_async_memcpy(_buffer + _buflen, data, len);
        _buflen += len;
        return true;
    }

    /* Larger than the whole buffer; write it through */
    if (AsyncFile::writen(_fd, data, len) < 0) {
        PLUW_DEBUG("Error occured writing register output: %s", strerror(errno));
        return false;
    }
    
    return true;
}

/**
 * Flush all buffered bytes to the file descriptor.
 */
bool AsyncFile::flush (void) {
    if (_buflen == 0)
        return true;
    
    if (AsyncFile::writen(_fd, _buffer, _buflen) < 0) {
        PLUW_DEBUG("Error occured writing register output: %s", strerror(errno));
        return false;
    }
    
    _buflen = 0;
    return true;
}

/**
 * Flush any pending data and close the backing file descriptor.
 */
bool AsyncFile::close (void) {
    if (!this->flush())
        return false;
    
    if (::close(_fd) != 0) {
        PLUW_DEBUG("Error closing file: %s", strerror(errno));
        return false;
    }
    
    return true;
}

/**
 * @} plunwind_async
 */
