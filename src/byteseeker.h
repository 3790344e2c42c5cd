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

#ifndef __BS_BYTESEEKER_H__
#define __BS_BYTESEEKER_H__

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "byte_stream.h"
#include "byteseeker_consts.h"
#include "error.h"
#include "seek_buffer.h"
#include "seek_state.h"

namespace byteseeker {

typedef struct _BSConfig {
    // Maximum pattern length, also the window size
    size_t capacity;
    // CONSTS::OPTION_* bits
    int options;
} BSConfig;

// Seeker that locates occurrences of a byte pattern in a seekable stream,
// scanning from either end without loading the stream into memory.
//
// The seeker reads fixed-size windows of the stream into an internal buffer,
// scans each window for the edge byte of the pattern (the first byte when
// searching forward, the last byte when searching backward), and verifies
// each candidate by re-reading the full pattern from the stream. A match may
// straddle two windows. Matches consume their span, so repeated calls in one
// direction report non-overlapping occurrences in order.
//
// The two directions keep independent cursors and exhaustion flags. Once a
// direction reports BYTE_NOT_FOUND, it keeps doing so without touching the
// stream until Reset().
//
// The seeker binds the stream exclusively for its lifetime and must not
// outlive it. The stream length is captured once at construction; the stream
// must not grow or shrink while the seeker exists.
class ByteSeeker {
public:
    // capacity: maximum pattern length and window size
    explicit ByteSeeker(ByteStream &stream, size_t capacity = CONSTS::DEFAULT_CHUNK_SIZE);
    ByteSeeker(ByteStream &stream, const BSConfig &config);
    ~ByteSeeker();

    ByteSeeker(const ByteSeeker &) = delete;
    ByteSeeker& operator=(const ByteSeeker &) = delete;

    int Status() const;
    bool is_open() const;
    const char* StatusStr() const;

    // Stream length captured at construction
    size_t Length() const;
    size_t Capacity() const;
    int Options() const;

    // Rewind to the state of a newly constructed seeker. The buffer is reused.
    int Reset();

    // Search pattern in the given direction (CONSTS::SEEK_FORWARD or
    // CONSTS::SEEK_BACKWARD). On success offset is the start of the match,
    // relative to the start of the stream.
    // Returns SUCCESS, BYTE_NOT_FOUND, UNSUPPORTED_LENGTH, IO_FAILURE or
    // INVALID_ARG.
    int Search(const uint8_t *pattern, size_t len, int direction, size_t &offset);
    int Search(const std::string &pattern, int direction, size_t &offset);
    // Run Search nth times and keep the last offset. The first failure is
    // returned as is. nth = 0 performs no search and returns INVALID_ARG.
    int SearchNth(const uint8_t *pattern, size_t len, int direction, size_t nth,
                  size_t &offset);
    int SearchNth(const std::string &pattern, int direction, size_t nth, size_t &offset);

    int Seek(const std::string &pattern, size_t &offset);
    int SeekBack(const std::string &pattern, size_t &offset);
    int SeekNth(const std::string &pattern, size_t nth, size_t &offset);
    int SeekNthBack(const std::string &pattern, size_t nth, size_t &offset);

    // Read len bytes at offset through the bound stream.
    int ReadRange(size_t offset, size_t len, std::string &out);

    size_t ForwardCursor() const;
    size_t BackwardCursor() const;
    bool IsExhausted(int direction) const;

    static int  SetLogLevel(int level);
    static void LogDebug();
    static void SetLogFile(const std::string &log_file);
    static void CloseLogFile();

private:
    void Init();
    int  AllocateBuffers();
    int  ProbeLength();
    int  SearchWhole(const uint8_t *pattern, size_t len, size_t &offset);
    int  SearchForward(const uint8_t *pattern, size_t len, size_t &offset);
    int  SearchBackward(const uint8_t *pattern, size_t len, size_t &offset);
    int  LoadWindow(size_t start, size_t win_len);
    int  MatchInPlace(size_t pos, const uint8_t *pattern, size_t len, bool &matched);
    int  MarkExhausted(int direction);
    int  IOFailure(int rval, const char *op, size_t pos) const;

    ByteStream &stream;
    size_t length;
    size_t capacity;
    int options;
    int status;
    bool bound;
    // set once the length probe succeeded; the length never changes after
    bool length_known;

    // window loaded for scanning
    SeekBuffer window;
    // candidate verification
    SeekBuffer match_buff;
    SeekState state;
};

}

#endif
