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

#ifndef __BS_CONSTS_H__
#define __BS_CONSTS_H__

#include <stddef.h>

namespace byteseeker {

class CONSTS {
public:
    // Search directions
    static const int SEEK_FORWARD;
    static const int SEEK_BACKWARD;

    // Default window size and maximum pattern length
    static const size_t DEFAULT_CHUNK_SIZE;

    // Do not bind the stream exclusively. Caller guarantees no aliasing.
    static const int OPTION_SHARED_STREAM;
    // Log every window load and exhaustion at debug level
    static const int OPTION_LOG_WINDOWS;

    static bool ValidDirection(int direction);
    static const char* DirectionStr(int direction);
};

}

#endif
