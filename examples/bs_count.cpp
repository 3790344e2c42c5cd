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

#include <stdlib.h>
#include <iostream>
#include <string>

#include <byteseeker/byteseeker.h>
#include <byteseeker/file_stream.h>

using namespace byteseeker;

// Count a pattern in a file and report the first and last match
int main(int argc, char *argv[])
{
    if(argc != 3) {
        std::cerr << "Usage: " << argv[0] << " file pattern\n";
        exit(1);
    }

    std::string pattern = argv[2];
    FileStream fstream(argv[1]);
    int rval = fstream.Open();
    if(rval != BSError::SUCCESS) {
        std::cerr << "failed to open " << argv[1] << ": " << BSError::get_error_str(rval) << "\n";
        exit(1);
    }

    // The window must hold the whole pattern
    size_t capacity = CONSTS::DEFAULT_CHUNK_SIZE;
    if(pattern.size() > capacity)
        capacity = pattern.size();
    ByteSeeker seeker(fstream, capacity);
    if(!seeker.is_open()) {
        std::cerr << "failed to initialize seeker: " << seeker.StatusStr() << "\n";
        exit(1);
    }

    size_t count = 0;
    size_t offset;
    while((rval = seeker.Seek(pattern, offset)) == BSError::SUCCESS) {
        if(count == 0)
            std::cout << "first match at " << offset << "\n";
        count++;
    }
    if(rval != BSError::BYTE_NOT_FOUND) {
        std::cerr << "search failed: " << BSError::get_error_str(rval) << "\n";
        exit(1);
    }

    if(count > 0) {
        rval = seeker.SeekBack(pattern, offset);
        if(rval == BSError::SUCCESS)
            std::cout << "last match at " << offset << "\n";
        else
            std::cerr << "backward search failed: " << BSError::get_error_str(rval) << "\n";
    }
    std::cout << count << " matches of " << pattern.size() << " bytes in "
              << seeker.Length() << " bytes\n";

    fstream.Close();
    return 0;
}
