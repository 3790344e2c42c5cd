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

#ifndef __BS_SEEK_BUFFER_H__
#define __BS_SEEK_BUFFER_H__

#include <stddef.h>
#include <stdint.h>

namespace byteseeker {

// Reusable fixed-capacity byte buffer. The logical length can be truncated
// for a short window near the stream edge and restored later without
// reallocation. Invariant: Length() <= Capacity().
class SeekBuffer {
public:
    SeekBuffer();
    ~SeekBuffer();

    SeekBuffer(const SeekBuffer &) = delete;
    SeekBuffer& operator=(const SeekBuffer &) = delete;

    // Drops the current allocation and allocates size bytes.
    int Allocate(size_t size);
    int Truncate(size_t len);
    // Restore the logical length to the full capacity
    void Restore();

    uint8_t* Data();
    const uint8_t* Data() const;
    size_t Length() const;
    size_t Capacity() const;

    // Position of the first byte equal to ch in [from, Length()).
    // Returns Length() if not found.
    size_t Find(uint8_t ch, size_t from) const;
    // Position of the last byte equal to ch in [0, end). Returns end if not found.
    size_t RFind(uint8_t ch, size_t end) const;
    bool Equals(const uint8_t *bytes, size_t len) const;

private:
    uint8_t *buff;
    size_t buff_len;
    size_t data_len;
};

}

#endif
