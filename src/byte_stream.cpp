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

#include "byte_stream.h"
#include "error.h"

namespace byteseeker {

ByteStream::ByteStream()
    : err_no(0)
    , bound(false)
{
}

ByteStream::~ByteStream()
{
}

int ByteStream::ReadExactAt(size_t offset, uint8_t *buff, size_t len)
{
    int rval = SeekTo(offset);
    if(rval != BSError::SUCCESS)
        return rval;
    return ReadExact(buff, len);
}

int ByteStream::TotalLength(size_t &length)
{
    int rval = SeekToEnd(length);
    if(rval != BSError::SUCCESS)
        return rval;
    return SeekTo(0);
}

int ByteStream::ErrorNo() const
{
    return err_no;
}

int ByteStream::SetError(int err)
{
    err_no = err;
    return BSError::IO_FAILURE;
}

int ByteStream::Bind()
{
    if(bound)
        return BSError::NOT_ALLOWED;
    bound = true;
    return BSError::SUCCESS;
}

void ByteStream::Unbind()
{
    bound = false;
}

bool ByteStream::IsBound() const
{
    return bound;
}

}
