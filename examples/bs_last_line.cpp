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
#include <byteseeker/util/seek_utils.h>

using namespace byteseeker;

// Print the last line of a file
int main(int argc, char *argv[])
{
    if(argc != 2) {
        std::cerr << "Usage: " << argv[0] << " file\n";
        exit(1);
    }

    FileStream fstream(argv[1]);
    int rval = fstream.Open();
    if(rval != BSError::SUCCESS) {
        std::cerr << "failed to open " << argv[1] << ": " << BSError::get_error_str(rval) << "\n";
        exit(1);
    }

    ByteSeeker seeker(fstream);
    if(!seeker.is_open()) {
        std::cerr << "failed to initialize seeker: " << seeker.StatusStr() << "\n";
        exit(1);
    }

    std::string line;
    rval = read_last_line(seeker, line);
    if(rval == BSError::SUCCESS) {
        std::cout << line << "\n";
    } else {
        std::cout << "no last line: " << BSError::get_error_str(rval) << "\n";
    }

    fstream.Close();
    return rval == BSError::SUCCESS ? 0 : 1;
}
