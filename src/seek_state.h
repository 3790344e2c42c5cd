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

#ifndef __BS_SEEK_STATE_H__
#define __BS_SEEK_STATE_H__

#include <stddef.h>

namespace byteseeker {

// Cursor state of a seeker.
// The forward cursor is the next unsearched offset from the start. The
// backward cursor is the last unsearched offset from the end (inclusive).
// Each direction has its own sticky exhaustion flag; once set, searches in
// that direction fail without touching the stream until Reset().
class SeekState {
public:
    SeekState();

    void Reset(size_t stream_len);

    size_t ForwardPos() const;
    size_t BackwardPos() const;
    void SetForwardPos(size_t pos);
    void SetBackwardPos(size_t pos);

    bool IsExhausted(int direction) const;
    void SetExhausted(int direction);
    void SetAllExhausted();

private:
    size_t lpos;
    size_t rpos;
    bool forward_done;
    bool backward_done;
};

}

#endif
