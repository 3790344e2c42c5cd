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
#include <string>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "../logger.h"
#include "../error.h"

using namespace byteseeker;

namespace {

#define LOGGER_TEST_DIR "/var/tmp/byteseeker_test"
#define LOGGER_TEST_FILE LOGGER_TEST_DIR "/_logger_test.log"
#define MAIN_LOG_FILE LOGGER_TEST_DIR "/byteseeker.log"

class LoggerTest : public ::testing::Test
{
public:
    LoggerTest() {
        level = LOG_LEVEL_WARN;
    }
    virtual ~LoggerTest() {
    }

    virtual void SetUp() {
        level = Logger::GetLogLevel();
        std::string cmd = std::string("rm -f ") + LOGGER_TEST_FILE;
        if(system(cmd.c_str()) != 0) {
        }
        Logger::InitLogFile(LOGGER_TEST_FILE);
    }
    virtual void TearDown() {
        Logger::SetLogLevel(level);
        Logger::InitLogFile(MAIN_LOG_FILE);
        std::string cmd = std::string("rm -f ") + LOGGER_TEST_FILE;
        if(system(cmd.c_str()) != 0) {
        }
    }

    std::string ReadLog() {
        Logger::Close();
        std::ifstream in(LOGGER_TEST_FILE);
        std::stringstream content;
        content << in.rdbuf();
        return content.str();
    }

protected:
    int level;
};

TEST_F(LoggerTest, LogLevel_test)
{
    EXPECT_EQ(Logger::SetLogLevel(LOG_LEVEL_WARN), BSError::SUCCESS);
    EXPECT_EQ(Logger::Enabled(LOG_LEVEL_ERROR), true);
    EXPECT_EQ(Logger::Enabled(LOG_LEVEL_WARN), true);
    EXPECT_EQ(Logger::Enabled(LOG_LEVEL_INFO), false);
    EXPECT_EQ(Logger::Enabled(LOG_LEVEL_DEBUG), false);

    EXPECT_EQ(Logger::SetLogLevel(LOG_LEVEL_DEBUG), BSError::SUCCESS);
    EXPECT_EQ(Logger::GetLogLevel(), LOG_LEVEL_DEBUG);
    EXPECT_EQ(Logger::Enabled(LOG_LEVEL_DEBUG), true);

    EXPECT_EQ(Logger::SetLogLevel(4), BSError::INVALID_ARG);
    EXPECT_EQ(Logger::SetLogLevel(-1), BSError::INVALID_ARG);
    EXPECT_EQ(Logger::GetLogLevel(), LOG_LEVEL_DEBUG);
}

TEST_F(LoggerTest, LogFile_test)
{
    EXPECT_EQ(Logger::GetLogStream() != NULL, true);
    EXPECT_EQ(Logger::SetLogLevel(LOG_LEVEL_INFO), BSError::SUCCESS);

    Logger::Log(LOG_LEVEL_ERROR, "window %d failed", 7);
    Logger::Log(LOG_LEVEL_INFO, std::string("info message"));
    Logger::Log(LOG_LEVEL_DEBUG, "debug message %s", "hidden");

    std::string content = ReadLog();
    EXPECT_NE(content.find(" ERROR: window 7 failed"), std::string::npos);
    EXPECT_NE(content.find(" INFO: info message"), std::string::npos);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
}

TEST_F(LoggerTest, InitLogFile_failure_test)
{
    Logger::InitLogFile(LOGGER_TEST_DIR "/_no_such_dir/byteseeker.log");
    EXPECT_EQ(Logger::GetLogStream() == NULL, true);
}

TEST(ErrorTest, get_error_str_test)
{
    EXPECT_STREQ(BSError::get_error_str(BSError::SUCCESS), "success");
    EXPECT_STREQ(BSError::get_error_str(BSError::BYTE_NOT_FOUND), "byte not found");
    EXPECT_STREQ(BSError::get_error_str(BSError::UNSUPPORTED_LENGTH),
                 "pattern length is zero or exceeds seeker capacity");
    EXPECT_STREQ(BSError::get_error_str(BSError::UNKNOWN_ERROR), "unknown error");
    EXPECT_STREQ(BSError::get_error_str(BSError::MAX_ERROR_CODE + 1), "invalid error code");
    EXPECT_STREQ(BSError::get_error_str(-3), "seeker error");
}

}
