/**
 * Copyright (C) 2026 The byteseeker Authors
 *
 * This program is free software: you can redistribute it and/or  modify
 * it under the terms of the GNU General Public License, version 2,
 * as published by the Free Software Foundation.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef __BS_BYTE_STREAM_H__
#define __BS_BYTE_STREAM_H__

#include <stddef.h>
#include <stdint.h>

namespace byteseeker {

// Seekable byte stream used by ByteSeeker.
// Implementations must support absolute positioning and exact-length reads.
// A read that hits the end of the stream before filling the buffer is an
// IO_FAILURE, never a partial result. All methods return BSError codes.
class ByteStream
{
public:
    ByteStream();
    virtual ~ByteStream();

    ByteStream(const ByteStream &) = delete;
    ByteStream& operator=(const ByteStream &) = delete;

    // Move the stream cursor to an absolute offset.
    virtual int SeekTo(size_t offset) = 0;
    // Move the stream cursor to the end and report the position.
    virtual int SeekToEnd(size_t &length) = 0;
    // Read exactly len bytes from the current position.
    virtual int ReadExact(uint8_t *buff, size_t len) = 0;

    int ReadExactAt(size_t offset, uint8_t *buff, size_t len);
    // Length probe: seek to the end, then rewind to offset 0.
    int TotalLength(size_t &length);

    // errno (or implementation specific code) of the last failure
    int ErrorNo() const;

    // Exclusive binding. A stream can only be bound to one seeker at a time.
    int  Bind();
    void Unbind();
    bool IsBound() const;

protected:
    int SetError(int err_no);

    int err_no;

private:
    bool bound;
};

}

#endif
