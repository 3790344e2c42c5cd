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

#include "error.h"

namespace byteseeker {

const int BSError::MAX_ERROR_CODE = UNKNOWN_ERROR;
const char* BSError::error_str[] = {
    "success",
    "stream io failure",
    "byte not found",
    "pattern length is zero or exceeds seeker capacity",
    "invalid argument",
    "stream already bound to another seeker",
    "stream open failure",
    "no memory",
    "not initialized",

    ///////////////////////////////////
    "unknown error",
};

const char* BSError::get_error_str(int err)
{
    if(err < 0)
        return "seeker error";
    else if(err > MAX_ERROR_CODE)
        return "invalid error code";

    return error_str[err];
}

}
