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

#include <stdlib.h>
#include <string.h>

#include "seek_buffer.h"
#include "error.h"

namespace byteseeker {

SeekBuffer::SeekBuffer()
    : buff(NULL)
    , buff_len(0)
    , data_len(0)
{
}

SeekBuffer::~SeekBuffer()
{
    if(buff != NULL)
        free(buff);
}

int SeekBuffer::Allocate(size_t size)
{
    if(buff != NULL)
    {
        free(buff);
        buff = NULL;
    }
    buff_len = 0;
    data_len = 0;

    // A zero-capacity buffer is valid; it just never holds a window.
    if(size == 0)
        return BSError::SUCCESS;

    buff = reinterpret_cast<uint8_t*>(malloc(size));
    if(buff == NULL)
        return BSError::NO_MEMORY;

    buff_len = size;
    data_len = size;
    return BSError::SUCCESS;
}

int SeekBuffer::Truncate(size_t len)
{
    if(len > buff_len)
        return BSError::INVALID_ARG;
    data_len = len;
    return BSError::SUCCESS;
}

void SeekBuffer::Restore()
{
    data_len = buff_len;
}

uint8_t* SeekBuffer::Data()
{
    return buff;
}

const uint8_t* SeekBuffer::Data() const
{
    return buff;
}

size_t SeekBuffer::Length() const
{
    return data_len;
}

size_t SeekBuffer::Capacity() const
{
    return buff_len;
}

size_t SeekBuffer::Find(uint8_t ch, size_t from) const
{
    if(from >= data_len)
        return data_len;

    const void *p = memchr(buff + from, ch, data_len - from);
    if(p == NULL)
        return data_len;
    return static_cast<const uint8_t*>(p) - buff;
}

size_t SeekBuffer::RFind(uint8_t ch, size_t end) const
{
    if(end > data_len)
        end = data_len;

    for(size_t i = end; i > 0; i--)
    {
        if(buff[i-1] == ch)
            return i - 1;
    }
    return end;
}

bool SeekBuffer::Equals(const uint8_t *bytes, size_t len) const
{
    if(len != data_len)
        return false;
    if(len == 0)
        return true;
    return memcmp(buff, bytes, len) == 0;
}

}
