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

#include <sys/stat.h>
#include <sys/types.h>

#include <gtest/gtest.h>

#include "../byteseeker.h"
#define BS_TEST_DIR "/var/tmp/byteseeker_test/"

GTEST_API_ int main(int argc, char** argv)
{
    testing::InitGoogleTest(&argc, argv);

    mode_t mode = 0777;
    mkdir(BS_TEST_DIR, mode);

    byteseeker::ByteSeeker::SetLogFile("/var/tmp/byteseeker_test/byteseeker.log");
    int rval = RUN_ALL_TESTS();

    byteseeker::ByteSeeker::CloseLogFile();
    return rval;
}
