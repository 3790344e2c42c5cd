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

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>

#include "file_stream.h"
#include "error.h"
#include "logger.h"

namespace byteseeker {

FileStream::FileStream(const std::string &fpath)
    : path(fpath)
    , fd(-1)
{
}

FileStream::~FileStream()
{
    Close();
}

int FileStream::Open()
{
    if(fd >= 0)
        return BSError::SUCCESS;

    fd = open(path.c_str(), O_RDONLY);
    if(fd < 0)
    {
        err_no = errno;
        Logger::Log(LOG_LEVEL_WARN, "failed to open %s errno: %d", path.c_str(), err_no);
        return BSError::OPEN_FAILURE;
    }

    return BSError::SUCCESS;
}

bool FileStream::IsOpen() const
{
    return fd >= 0;
}

void FileStream::Close()
{
    if(fd >= 0)
    {
        close(fd);
        fd = -1;
    }
}

int FileStream::SeekTo(size_t offset)
{
    if(fd < 0)
        return SetError(EBADF);
    if(lseek(fd, static_cast<off_t>(offset), SEEK_SET) < 0)
        return SetError(errno);
    return BSError::SUCCESS;
}

int FileStream::SeekToEnd(size_t &length)
{
    if(fd < 0)
        return SetError(EBADF);
    off_t end = lseek(fd, 0, SEEK_END);
    if(end < 0)
        return SetError(errno);
    length = static_cast<size_t>(end);
    return BSError::SUCCESS;
}

int FileStream::ReadExact(uint8_t *buff, size_t len)
{
    if(fd < 0)
        return SetError(EBADF);

    size_t bytes_read = 0;
    while(bytes_read < len)
    {
        ssize_t n = read(fd, buff + bytes_read, len - bytes_read);
        if(n < 0)
        {
            if(errno == EINTR)
                continue;
            return SetError(errno);
        }
        if(n == 0)
        {
            // end of file before the buffer was filled
            return SetError(EIO);
        }
        bytes_read += static_cast<size_t>(n);
    }

    return BSError::SUCCESS;
}

const std::string& FileStream::GetFilePath() const
{
    return path;
}

}
