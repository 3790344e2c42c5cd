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
#include <stdlib.h>
#include <string>
#include <fstream>

#include <gtest/gtest.h>

#include "../byteseeker.h"
#include "../file_stream.h"
#include "../memory_stream.h"
#include "../error.h"
#include "./test_data.h"

using namespace byteseeker;

namespace {

#define BYTE_STREAM_TEST_DIR "/var/tmp/byteseeker_test"
#define TEST_FILE BYTE_STREAM_TEST_DIR "/_byte_stream_test"

class ByteStreamTest : public ::testing::Test
{
public:
    ByteStreamTest() {
    }
    virtual ~ByteStreamTest() {
    }

    virtual void SetUp() {
        std::string cmd = std::string("mkdir -p ") + BYTE_STREAM_TEST_DIR;
        if(system(cmd.c_str()) != 0) {
        }
    }
    virtual void TearDown() {
        std::string cmd = std::string("rm -rf ") + BYTE_STREAM_TEST_DIR + "/_*";
        if(system(cmd.c_str()) != 0) {
        }
    }

    void WriteFile(const std::string &bytes) {
        std::ofstream out(TEST_FILE, std::ios::out | std::ios::binary | std::ios::trunc);
        ASSERT_EQ(out.is_open(), true);
        out.write(bytes.data(), bytes.size());
        out.close();
    }
};

TEST_F(ByteStreamTest, MemoryStream_test)
{
    MemoryStream mstream(std::string("0123456789"));
    EXPECT_EQ(mstream.Size(), 10u);

    size_t length = 0;
    EXPECT_EQ(mstream.TotalLength(length), BSError::SUCCESS);
    EXPECT_EQ(length, 10u);
    EXPECT_EQ(mstream.Position(), 0u);

    uint8_t buff[16];
    EXPECT_EQ(mstream.ReadExactAt(3, buff, 4), BSError::SUCCESS);
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buff), 4), "3456");
    EXPECT_EQ(mstream.Position(), 7u);
    EXPECT_EQ(mstream.ReadExact(buff, 3), BSError::SUCCESS);
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buff), 3), "789");

    // short reads are errors
    EXPECT_EQ(mstream.ReadExactAt(8, buff, 3), BSError::IO_FAILURE);
    EXPECT_EQ(mstream.ErrorNo(), EIO);
    EXPECT_EQ(mstream.SeekTo(20), BSError::SUCCESS);
    EXPECT_EQ(mstream.ReadExact(buff, 1), BSError::IO_FAILURE);
    EXPECT_EQ(mstream.ReadExactAt(10, buff, 0), BSError::SUCCESS);
}

TEST_F(ByteStreamTest, MemoryStream_borrowed_test)
{
    const uint8_t bytes[] = { 1, 2, 3 };
    MemoryStream mstream(bytes, sizeof(bytes));
    EXPECT_EQ(mstream.Size(), 3u);

    uint8_t buff[3];
    EXPECT_EQ(mstream.ReadExactAt(1, buff, 2), BSError::SUCCESS);
    EXPECT_EQ(buff[0], 2);
    EXPECT_EQ(buff[1], 3);

    MemoryStream empty(NULL, 10);
    EXPECT_EQ(empty.Size(), 0u);
}

TEST_F(ByteStreamTest, Bind_test)
{
    MemoryStream mstream(std::string("abc"));
    EXPECT_EQ(mstream.IsBound(), false);
    EXPECT_EQ(mstream.Bind(), BSError::SUCCESS);
    EXPECT_EQ(mstream.IsBound(), true);
    EXPECT_EQ(mstream.Bind(), BSError::NOT_ALLOWED);
    mstream.Unbind();
    EXPECT_EQ(mstream.IsBound(), false);
    EXPECT_EQ(mstream.Bind(), BSError::SUCCESS);
}

TEST_F(ByteStreamTest, FileStream_test)
{
    WriteFile("line one\nline two\n");

    FileStream fstream(TEST_FILE);
    EXPECT_EQ(fstream.IsOpen(), false);
    EXPECT_EQ(fstream.GetFilePath(), std::string(TEST_FILE));

    uint8_t buff[32];
    EXPECT_EQ(fstream.ReadExact(buff, 1), BSError::IO_FAILURE);
    EXPECT_EQ(fstream.ErrorNo(), EBADF);

    EXPECT_EQ(fstream.Open(), BSError::SUCCESS);
    EXPECT_EQ(fstream.IsOpen(), true);

    size_t length = 0;
    EXPECT_EQ(fstream.TotalLength(length), BSError::SUCCESS);
    EXPECT_EQ(length, 18u);
    EXPECT_EQ(fstream.ReadExactAt(9, buff, 8), BSError::SUCCESS);
    EXPECT_EQ(std::string(reinterpret_cast<char*>(buff), 8), "line two");
    EXPECT_EQ(fstream.ReadExactAt(15, buff, 10), BSError::IO_FAILURE);
    EXPECT_EQ(fstream.ErrorNo(), EIO);

    fstream.Close();
    EXPECT_EQ(fstream.IsOpen(), false);
}

TEST_F(ByteStreamTest, FileStream_open_failure_test)
{
    FileStream fstream(BYTE_STREAM_TEST_DIR "/_no_such_file");
    EXPECT_EQ(fstream.Open(), BSError::OPEN_FAILURE);
    EXPECT_EQ(fstream.ErrorNo(), ENOENT);

    ByteSeeker seeker(fstream);
    EXPECT_EQ(seeker.is_open(), false);
    EXPECT_EQ(seeker.Status(), BSError::IO_FAILURE);
}

TEST_F(ByteStreamTest, FileStream_seeker_test)
{
    TestData data(5);
    std::string bytes = data.get_bytes(10000);
    WriteFile(bytes);

    FileStream fstream(TEST_FILE);
    ASSERT_EQ(fstream.Open(), BSError::SUCCESS);
    ByteSeeker seeker(fstream, 256);
    ASSERT_EQ(seeker.is_open(), true);
    EXPECT_EQ(seeker.Length(), 10000u);

    std::string pattern = data.get_pattern(3, 1);
    std::vector<size_t> expected = naive_forward(bytes, pattern);
    std::vector<size_t> found;
    size_t offset;
    while(seeker.Seek(pattern, offset) == BSError::SUCCESS)
        found.push_back(offset);
    EXPECT_EQ(found, expected);

    expected = naive_backward(bytes, pattern);
    found.clear();
    while(seeker.SeekBack(pattern, offset) == BSError::SUCCESS)
        found.push_back(offset);
    EXPECT_EQ(found, expected);
}

}
