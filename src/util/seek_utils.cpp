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

#include "byteseeker.h"
#include "util/seek_utils.h"

namespace byteseeker {

static int last_line_range(ByteSeeker &seeker, size_t &start, size_t &end)
{
    size_t pos;
    end = seeker.Length();

    int rval = seeker.SeekBack("\n", pos);
    if(rval == BSError::BYTE_NOT_FOUND)
    {
        start = 0;
        return BSError::SUCCESS;
    }
    if(rval != BSError::SUCCESS)
        return rval;

    if(pos + 1 < seeker.Length())
    {
        start = pos + 1;
        return BSError::SUCCESS;
    }

    // stream ends with a line break
    end = pos;
    rval = seeker.SeekBack("\n", pos);
    if(rval == BSError::SUCCESS)
        start = pos + 1;
    else if(rval == BSError::BYTE_NOT_FOUND)
        start = 0;
    else
        return rval;
    return BSError::SUCCESS;
}

int read_last_line(ByteSeeker &seeker, std::string &line)
{
    line.clear();
    int rval = seeker.Reset();
    if(rval != BSError::SUCCESS)
        return rval;
    if(seeker.Length() == 0)
        return BSError::BYTE_NOT_FOUND;

    size_t start = 0;
    size_t end = 0;
    rval = last_line_range(seeker, start, end);
    if(rval == BSError::SUCCESS)
        rval = seeker.ReadRange(start, end - start, line);

    int reset_rval = seeker.Reset();
    if(rval != BSError::SUCCESS)
        return rval;
    return reset_rval;
}

int count_occurrences(ByteSeeker &seeker, const std::string &pattern, size_t &count)
{
    count = 0;
    int rval = seeker.Reset();
    if(rval != BSError::SUCCESS)
        return rval;

    size_t pos;
    while((rval = seeker.Seek(pattern, pos)) == BSError::SUCCESS)
        count++;

    if(rval == BSError::BYTE_NOT_FOUND)
        rval = BSError::SUCCESS;

    int reset_rval = seeker.Reset();
    if(rval != BSError::SUCCESS)
        return rval;
    return reset_rval;
}

}
