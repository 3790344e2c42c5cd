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

#ifndef __BS_FILE_STREAM_H__
#define __BS_FILE_STREAM_H__

#include <string>

#include "byte_stream.h"

namespace byteseeker {

// Read-only stream over a regular file descriptor
class FileStream : public ByteStream
{
public:
    explicit FileStream(const std::string &fpath);
    virtual ~FileStream();

    int  Open();
    bool IsOpen() const;
    void Close();

    virtual int SeekTo(size_t offset);
    virtual int SeekToEnd(size_t &length);
    virtual int ReadExact(uint8_t *buff, size_t len);

    const std::string& GetFilePath() const;

private:
    std::string path;
    int fd;
};

}

#endif
