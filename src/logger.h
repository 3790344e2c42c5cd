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

#ifndef __BS_LOGGER_H__
#define __BS_LOGGER_H__

#include <fstream>
#include <string>

namespace byteseeker {

#define LOG_LEVEL_ERROR   0
#define LOG_LEVEL_WARN    1
#define LOG_LEVEL_INFO    2
#define LOG_LEVEL_DEBUG   3

class Logger
{
public:
    ~Logger();

    static void Log(int level, const std::string &message);
    // printf-style log
    static void Log(int level, const char *format, ... )
        __attribute__((format(printf, 2, 3)));
    static bool Enabled(int level);
    static void FillDateTime(char *buffer, int bufsize);
    // Send logs to a file instead of stdout/stderr.
    static void InitLogFile(const std::string &logfile);
    // Default is logging errors and warnings only.
    static int SetLogLevel(int level);
    static int GetLogLevel();
    static void Close();
    static std::ofstream* GetLogStream();

private:
    // Singleton; nobody creates an instance.
    Logger();
    static void Write(int level, const char *message);
    static void Rotate();

    static std::string log_file;
    static std::ofstream *log_stream;
    static const char* LOG_LEVEL[4];
    static int log_level_;
    static long roll_size;
};

}

#endif
