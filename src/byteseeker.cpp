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

#include <string.h>

#include "byteseeker.h"
#include "logger.h"

namespace byteseeker {

ByteSeeker::ByteSeeker(ByteStream &bs, size_t cap)
    : stream(bs)
    , length(0)
    , capacity(cap)
    , options(0)
    , status(BSError::NOT_INITIALIZED)
    , bound(false)
    , length_known(false)
{
    Init();
}

ByteSeeker::ByteSeeker(ByteStream &bs, const BSConfig &config)
    : stream(bs)
    , length(0)
    , capacity(config.capacity)
    , options(config.options)
    , status(BSError::NOT_INITIALIZED)
    , bound(false)
    , length_known(false)
{
    Init();
}

ByteSeeker::~ByteSeeker()
{
    if(bound)
        stream.Unbind();
}

void ByteSeeker::Init()
{
    if(!(options & CONSTS::OPTION_SHARED_STREAM))
    {
        status = stream.Bind();
        if(status != BSError::SUCCESS)
        {
            Logger::Log(LOG_LEVEL_ERROR, "failed to bind stream: %s",
                        BSError::get_error_str(status));
            return;
        }
        bound = true;
    }

    status = AllocateBuffers();
    if(status != BSError::SUCCESS)
        return;

    status = ProbeLength();
    state.Reset(length);
    Logger::Log(LOG_LEVEL_DEBUG, "seeker opened: length %zu capacity %zu options %d",
                length, capacity, options);
}

int ByteSeeker::AllocateBuffers()
{
    int rval = window.Allocate(capacity);
    if(rval == BSError::SUCCESS)
        rval = match_buff.Allocate(capacity);
    if(rval != BSError::SUCCESS)
        Logger::Log(LOG_LEVEL_ERROR, "failed to allocate %zu bytes for seeker buffer", capacity);
    return rval;
}

int ByteSeeker::ProbeLength()
{
    int rval = stream.TotalLength(length);
    if(rval != BSError::SUCCESS)
    {
        Logger::Log(LOG_LEVEL_ERROR, "failed to probe stream length: %s errno %d",
                    BSError::get_error_str(rval), stream.ErrorNo());
        length = 0;
        return rval;
    }
    length_known = true;
    return rval;
}

int ByteSeeker::Status() const
{
    return status;
}

bool ByteSeeker::is_open() const
{
    return status == BSError::SUCCESS;
}

const char* ByteSeeker::StatusStr() const
{
    return BSError::get_error_str(status);
}

size_t ByteSeeker::Length() const
{
    return length;
}

size_t ByteSeeker::Capacity() const
{
    return capacity;
}

int ByteSeeker::Options() const
{
    return options;
}

int ByteSeeker::Reset()
{
    if(!bound && !(options & CONSTS::OPTION_SHARED_STREAM))
    {
        if(stream.Bind() != BSError::SUCCESS)
            return BSError::NOT_ALLOWED;
        bound = true;
    }

    int rval;
    if(window.Capacity() != capacity || match_buff.Capacity() != capacity)
    {
        rval = AllocateBuffers();
        if(rval != BSError::SUCCESS)
        {
            status = rval;
            return rval;
        }
    }

    if(length_known)
    {
        rval = stream.SeekTo(0);
        if(rval != BSError::SUCCESS)
            IOFailure(rval, "rewind", 0);
    }
    else
    {
        rval = ProbeLength();
    }

    status = rval;
    window.Restore();
    state.Reset(length);
    return rval;
}

int ByteSeeker::Search(const uint8_t *pattern, size_t len, int direction, size_t &offset)
{
    if(len == 0 || len > capacity)
        return BSError::UNSUPPORTED_LENGTH;
    if(pattern == NULL || !CONSTS::ValidDirection(direction))
        return BSError::INVALID_ARG;
    if(status != BSError::SUCCESS)
        return status;
    if(state.IsExhausted(direction))
        return BSError::BYTE_NOT_FOUND;

    if(length < len)
        return MarkExhausted(direction);
    if(length == len)
        return SearchWhole(pattern, len, offset);

    if(direction == CONSTS::SEEK_FORWARD)
        return SearchForward(pattern, len, offset);
    return SearchBackward(pattern, len, offset);
}

int ByteSeeker::Search(const std::string &pattern, int direction, size_t &offset)
{
    return Search(reinterpret_cast<const uint8_t*>(pattern.data()), pattern.size(),
                  direction, offset);
}

int ByteSeeker::SearchNth(const uint8_t *pattern, size_t len, int direction, size_t nth,
                          size_t &offset)
{
    int rval = BSError::INVALID_ARG;
    for(size_t i = 0; i < nth; i++)
    {
        rval = Search(pattern, len, direction, offset);
        if(rval != BSError::SUCCESS)
            break;
    }
    return rval;
}

int ByteSeeker::SearchNth(const std::string &pattern, int direction, size_t nth, size_t &offset)
{
    return SearchNth(reinterpret_cast<const uint8_t*>(pattern.data()), pattern.size(),
                     direction, nth, offset);
}

int ByteSeeker::Seek(const std::string &pattern, size_t &offset)
{
    return Search(pattern, CONSTS::SEEK_FORWARD, offset);
}

int ByteSeeker::SeekBack(const std::string &pattern, size_t &offset)
{
    return Search(pattern, CONSTS::SEEK_BACKWARD, offset);
}

int ByteSeeker::SeekNth(const std::string &pattern, size_t nth, size_t &offset)
{
    return SearchNth(pattern, CONSTS::SEEK_FORWARD, nth, offset);
}

int ByteSeeker::SeekNthBack(const std::string &pattern, size_t nth, size_t &offset)
{
    return SearchNth(pattern, CONSTS::SEEK_BACKWARD, nth, offset);
}

// The whole stream is the only candidate. Its span is consumed for both
// cursors whether or not it matches.
int ByteSeeker::SearchWhole(const uint8_t *pattern, size_t len, size_t &offset)
{
    bool matched;
    int rval = MatchInPlace(0, pattern, len, matched);
    if(rval != BSError::SUCCESS)
        return rval;

    state.SetAllExhausted();
    if(!matched)
        return BSError::BYTE_NOT_FOUND;
    offset = 0;
    return BSError::SUCCESS;
}

int ByteSeeker::SearchForward(const uint8_t *pattern, size_t len, size_t &offset)
{
    int rval;
    bool matched;
    const uint8_t lead = pattern[0];

    while(true)
    {
        size_t lpos = state.ForwardPos();
        size_t remaining = length - lpos;
        if(remaining < len)
            return MarkExhausted(CONSTS::SEEK_FORWARD);

        size_t win_len = remaining < capacity ? remaining : capacity;
        bool last = (win_len == remaining);
        rval = LoadWindow(lpos, win_len);
        if(rval != BSError::SUCCESS)
            return rval;

        for(size_t p = window.Find(lead, 0); p < win_len; p = window.Find(lead, p + 1))
        {
            size_t cpos = lpos + p;
            // No room left for the full pattern here or at any later candidate
            if(length - cpos < len)
                return MarkExhausted(CONSTS::SEEK_FORWARD);

            rval = MatchInPlace(cpos, pattern, len, matched);
            if(rval != BSError::SUCCESS)
                return rval;
            if(matched)
            {
                state.SetForwardPos(cpos + len);
                offset = cpos;
                return BSError::SUCCESS;
            }
        }

        if(last)
            return MarkExhausted(CONSTS::SEEK_FORWARD);
        state.SetForwardPos(lpos + win_len);
    }
}

int ByteSeeker::SearchBackward(const uint8_t *pattern, size_t len, size_t &offset)
{
    int rval;
    bool matched;
    const uint8_t tail = pattern[len - 1];

    while(true)
    {
        size_t remaining = state.BackwardPos() + 1;
        if(remaining < len)
            return MarkExhausted(CONSTS::SEEK_BACKWARD);

        size_t win_len = remaining < capacity ? remaining : capacity;
        bool last = (win_len == remaining);
        size_t start = remaining - win_len;
        rval = LoadWindow(start, win_len);
        if(rval != BSError::SUCCESS)
            return rval;

        size_t end = win_len;
        for(size_t p = window.RFind(tail, end); p < end; p = window.RFind(tail, end))
        {
            size_t tail_pos = start + p;
            // The pattern would start before offset 0 here and at any later candidate
            if(tail_pos + 1 < len)
                return MarkExhausted(CONSTS::SEEK_BACKWARD);

            size_t cpos = tail_pos + 1 - len;
            rval = MatchInPlace(cpos, pattern, len, matched);
            if(rval != BSError::SUCCESS)
                return rval;
            if(matched)
            {
                if(cpos == 0)
                    state.SetExhausted(CONSTS::SEEK_BACKWARD);
                else
                    state.SetBackwardPos(cpos - 1);
                offset = cpos;
                return BSError::SUCCESS;
            }
            end = p;
        }

        if(last)
            return MarkExhausted(CONSTS::SEEK_BACKWARD);
        state.SetBackwardPos(start - 1);
    }
}

int ByteSeeker::LoadWindow(size_t start, size_t win_len)
{
    int rval = window.Truncate(win_len);
    if(rval != BSError::SUCCESS)
        return rval;

    rval = stream.ReadExactAt(start, window.Data(), win_len);
    if(rval != BSError::SUCCESS)
        return IOFailure(rval, "window read", start);

    if(options & CONSTS::OPTION_LOG_WINDOWS)
        Logger::Log(LOG_LEVEL_DEBUG, "window [%zu, %zu) loaded", start, start + win_len);
    return BSError::SUCCESS;
}

// Verify the pattern by re-reading it from the stream rather than from the
// window, so a match may straddle two windows.
int ByteSeeker::MatchInPlace(size_t pos, const uint8_t *pattern, size_t len, bool &matched)
{
    matched = false;
    if(pos > length || length - pos < len)
        return BSError::SUCCESS;

    int rval = match_buff.Truncate(len);
    if(rval != BSError::SUCCESS)
        return rval;

    rval = stream.ReadExactAt(pos, match_buff.Data(), len);
    if(rval != BSError::SUCCESS)
        return IOFailure(rval, "verification read", pos);

    matched = match_buff.Equals(pattern, len);
    return BSError::SUCCESS;
}

int ByteSeeker::MarkExhausted(int direction)
{
    state.SetExhausted(direction);
    if(options & CONSTS::OPTION_LOG_WINDOWS)
        Logger::Log(LOG_LEVEL_DEBUG, "%s search exhausted", CONSTS::DirectionStr(direction));
    return BSError::BYTE_NOT_FOUND;
}

int ByteSeeker::IOFailure(int rval, const char *op, size_t pos) const
{
    Logger::Log(LOG_LEVEL_WARN, "%s at offset %zu failed: %s errno %d", op, pos,
                BSError::get_error_str(rval), stream.ErrorNo());
    return rval;
}

int ByteSeeker::ReadRange(size_t offset, size_t len, std::string &out)
{
    if(status != BSError::SUCCESS)
        return status;
    if(offset > length || length - offset < len)
        return BSError::INVALID_ARG;

    out.resize(len);
    if(len == 0)
        return BSError::SUCCESS;

    int rval = stream.ReadExactAt(offset, reinterpret_cast<uint8_t*>(&out[0]), len);
    if(rval != BSError::SUCCESS)
    {
        out.clear();
        return IOFailure(rval, "range read", offset);
    }
    return BSError::SUCCESS;
}

size_t ByteSeeker::ForwardCursor() const
{
    return state.ForwardPos();
}

size_t ByteSeeker::BackwardCursor() const
{
    return state.BackwardPos();
}

bool ByteSeeker::IsExhausted(int direction) const
{
    return state.IsExhausted(direction);
}

int ByteSeeker::SetLogLevel(int level)
{
    return Logger::SetLogLevel(level);
}

void ByteSeeker::LogDebug()
{
    Logger::SetLogLevel(LOG_LEVEL_DEBUG);
}

void ByteSeeker::SetLogFile(const std::string &log_file)
{
    Logger::InitLogFile(log_file);
}

void ByteSeeker::CloseLogFile()
{
    Logger::Close();
}

}
