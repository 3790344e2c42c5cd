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

#ifndef __BS_ERROR_H__
#define __BS_ERROR_H__

namespace byteseeker {

// byteseeker status codes
// The list might grow over time. Callers should not assume it is closed.
class BSError {
public:
    enum bs_error {
        SUCCESS = 0,
        // Underlying stream read/seek failed; see ByteStream::ErrorNo().
        IO_FAILURE = 1,
        // Pattern does not occur in the unsearched region of the direction.
        BYTE_NOT_FOUND = 2,
        // Pattern is empty or longer than the seeker capacity.
        UNSUPPORTED_LENGTH = 3,
        INVALID_ARG = 4,
        NOT_ALLOWED = 5,
        OPEN_FAILURE = 6,
        NO_MEMORY = 7,
        NOT_INITIALIZED = 8,

        // UNKNOWN_ERROR should be the last enum.
        UNKNOWN_ERROR
    };

    static const int MAX_ERROR_CODE;
    static const char* error_str[];
    static const char* get_error_str(int err);
};

}

#endif
