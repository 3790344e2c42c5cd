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

#include <errno.h>
#include <string.h>

#include "memory_stream.h"
#include "error.h"

namespace byteseeker {

MemoryStream::MemoryStream(const std::string &bytes)
    : owned(bytes.begin(), bytes.end())
    , pos(0)
{
    data = owned.data();
    size = owned.size();
}

MemoryStream::MemoryStream(const std::vector<uint8_t> &bytes)
    : owned(bytes)
    , pos(0)
{
    data = owned.data();
    size = owned.size();
}

MemoryStream::MemoryStream(const uint8_t *bytes, size_t len)
    : data(bytes)
    , size(len)
    , pos(0)
{
    if(data == NULL)
        size = 0;
}

MemoryStream::~MemoryStream()
{
}

// Seeking past the end is allowed; a following read fails.
int MemoryStream::SeekTo(size_t offset)
{
    pos = offset;
    return BSError::SUCCESS;
}

int MemoryStream::SeekToEnd(size_t &length)
{
    pos = size;
    length = size;
    return BSError::SUCCESS;
}

int MemoryStream::ReadExact(uint8_t *buff, size_t len)
{
    if(pos > size || size - pos < len)
    {
        pos = size;
        return SetError(EIO);
    }

    if(len > 0)
        memcpy(buff, data + pos, len);
    pos += len;
    return BSError::SUCCESS;
}

size_t MemoryStream::Position() const
{
    return pos;
}

size_t MemoryStream::Size() const
{
    return size;
}

}
