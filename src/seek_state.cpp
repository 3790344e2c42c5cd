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

#include "seek_state.h"
#include "byteseeker_consts.h"

namespace byteseeker {

SeekState::SeekState()
{
    Reset(0);
}

void SeekState::Reset(size_t stream_len)
{
    lpos = 0;
    rpos = stream_len == 0 ? 0 : stream_len - 1;
    forward_done = false;
    backward_done = false;
}

size_t SeekState::ForwardPos() const
{
    return lpos;
}

size_t SeekState::BackwardPos() const
{
    return rpos;
}

void SeekState::SetForwardPos(size_t pos)
{
    lpos = pos;
}

void SeekState::SetBackwardPos(size_t pos)
{
    rpos = pos;
}

bool SeekState::IsExhausted(int direction) const
{
    if(direction == CONSTS::SEEK_FORWARD)
        return forward_done;
    return backward_done;
}

void SeekState::SetExhausted(int direction)
{
    if(direction == CONSTS::SEEK_FORWARD)
        forward_done = true;
    else
        backward_done = true;
}

void SeekState::SetAllExhausted()
{
    forward_done = true;
    backward_done = true;
}

}
