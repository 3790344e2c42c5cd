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

#ifndef __BS_SEEK_UTILS_H__
#define __BS_SEEK_UTILS_H__

#include <stddef.h>
#include <string>

namespace byteseeker {

class ByteSeeker;

// Read the last line of the stream without the trailing line break.
// If the stream ends with a line break, the line before it is returned.
// If no line break precedes the last line, the line starts at offset 0.
// The seeker is reset before and after. Fails with BYTE_NOT_FOUND on an
// empty stream.
int read_last_line(ByteSeeker &seeker, std::string &line);

// Count non-overlapping occurrences of pattern from a reset seeker.
int count_occurrences(ByteSeeker &seeker, const std::string &pattern, size_t &count);

}

#endif
