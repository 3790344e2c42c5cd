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

#include "byteseeker_consts.h"

namespace byteseeker {

const int CONSTS::SEEK_FORWARD = 0;
const int CONSTS::SEEK_BACKWARD = 1;

const size_t CONSTS::DEFAULT_CHUNK_SIZE = 1024;

const int CONSTS::OPTION_SHARED_STREAM = 0x1;
const int CONSTS::OPTION_LOG_WINDOWS = 0x2;

bool CONSTS::ValidDirection(int direction)
{
    return direction == SEEK_FORWARD || direction == SEEK_BACKWARD;
}

const char* CONSTS::DirectionStr(int direction)
{
    if(direction == SEEK_FORWARD)
        return "forward";
    else if(direction == SEEK_BACKWARD)
        return "backward";
    return "unknown";
}

}
