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

#ifndef __BS_MEMORY_STREAM_H__
#define __BS_MEMORY_STREAM_H__

#include <string>
#include <vector>

#include "byte_stream.h"

namespace byteseeker {

// In-memory stream with a cursor. Either owns a copy of the bytes or
// borrows a caller buffer that must outlive the stream.
class MemoryStream : public ByteStream
{
public:
    explicit MemoryStream(const std::string &bytes);
    explicit MemoryStream(const std::vector<uint8_t> &bytes);
    MemoryStream(const uint8_t *bytes, size_t len);
    virtual ~MemoryStream();

    virtual int SeekTo(size_t offset);
    virtual int SeekToEnd(size_t &length);
    virtual int ReadExact(uint8_t *buff, size_t len);

    size_t Position() const;
    size_t Size() const;

private:
    std::vector<uint8_t> owned;
    const uint8_t *data;
    size_t size;
    size_t pos;
};

}

#endif
