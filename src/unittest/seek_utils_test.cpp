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

#include <string>

#include <gtest/gtest.h>

#include "../byteseeker.h"
#include "../memory_stream.h"
#include "../error.h"
#include "../util/seek_utils.h"

using namespace byteseeker;

namespace {

class SeekUtilsTest : public ::testing::Test
{
public:
    SeekUtilsTest() {
    }
    virtual ~SeekUtilsTest() {
    }

    virtual void SetUp() {
    }
    virtual void TearDown() {
    }

    int LastLine(const std::string &bytes, std::string &line, size_t capacity = 1024) {
        MemoryStream mstream(bytes);
        ByteSeeker seeker(mstream, capacity);
        return read_last_line(seeker, line);
    }
};

TEST_F(SeekUtilsTest, read_last_line_test)
{
    std::string line;
    EXPECT_EQ(LastLine("first\nsecond\nthird", line), BSError::SUCCESS);
    EXPECT_EQ(line, "third");
    EXPECT_EQ(LastLine("first\nsecond\nthird\n", line), BSError::SUCCESS);
    EXPECT_EQ(line, "third");
    EXPECT_EQ(LastLine("only line", line), BSError::SUCCESS);
    EXPECT_EQ(line, "only line");
    EXPECT_EQ(LastLine("only line\n", line), BSError::SUCCESS);
    EXPECT_EQ(line, "only line");
    EXPECT_EQ(LastLine("a\n\n", line), BSError::SUCCESS);
    EXPECT_EQ(line, "");
    EXPECT_EQ(LastLine("\n", line), BSError::SUCCESS);
    EXPECT_EQ(line, "");
    EXPECT_EQ(LastLine("", line), BSError::BYTE_NOT_FOUND);
}

TEST_F(SeekUtilsTest, read_last_line_long_test)
{
    std::string last(5000, 'x');
    std::string bytes = std::string(3000, 'y') + "\n" + last + "\n";

    std::string line;
    EXPECT_EQ(LastLine(bytes, line, 64), BSError::SUCCESS);
    EXPECT_EQ(line, last);
}

TEST_F(SeekUtilsTest, read_last_line_resets_test)
{
    MemoryStream mstream(std::string("a\nb\nc"));
    ByteSeeker seeker(mstream);

    size_t offset;
    EXPECT_EQ(seeker.Seek("\n", offset), BSError::SUCCESS);
    EXPECT_EQ(seeker.Seek("\n", offset), BSError::SUCCESS);

    std::string line;
    EXPECT_EQ(read_last_line(seeker, line), BSError::SUCCESS);
    EXPECT_EQ(line, "c");
    EXPECT_EQ(seeker.ForwardCursor(), 0u);
    EXPECT_EQ(seeker.IsExhausted(CONSTS::SEEK_BACKWARD), false);
    EXPECT_EQ(seeker.Seek("\n", offset), BSError::SUCCESS);
    EXPECT_EQ(offset, 1u);
}

TEST_F(SeekUtilsTest, count_occurrences_test)
{
    MemoryStream mstream(std::string(1023, '0') + "\n\n" + std::string(1024, '0') + "\n\n");
    ByteSeeker seeker(mstream);

    size_t count = 0;
    EXPECT_EQ(count_occurrences(seeker, "\n", count), BSError::SUCCESS);
    EXPECT_EQ(count, 4u);
    EXPECT_EQ(count_occurrences(seeker, "\n\n", count), BSError::SUCCESS);
    EXPECT_EQ(count, 2u);
    EXPECT_EQ(count_occurrences(seeker, "00", count), BSError::SUCCESS);
    EXPECT_EQ(count, 1023u);
    EXPECT_EQ(count_occurrences(seeker, "x", count), BSError::SUCCESS);
    EXPECT_EQ(count, 0u);
    EXPECT_EQ(count_occurrences(seeker, "", count), BSError::UNSUPPORTED_LENGTH);
}

}
