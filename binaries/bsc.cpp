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

// A byteseeker command-line client

#include <stdio.h>
#include <stdlib.h>
#include <ctype.h>
#include <string.h>
#include <signal.h>
#include <iostream>
#include <fstream>
#include <string>
#include <readline/readline.h>
#include <readline/history.h>

#include "byteseeker.h"
#include "file_stream.h"
#include "error.h"
#include "version.h"
#include "util/seek_utils.h"

#include "hexbin.h"
#include "expr_parser.h"

using namespace byteseeker;

enum bsc_command {
    COMMAND_NONE = 0,
    COMMAND_QUIT = 1,
    COMMAND_UNKNOWN = 2,
    COMMAND_SHOW = 3,
    COMMAND_SEEK = 4,
    COMMAND_SEEK_BACK = 5,
    COMMAND_SEEK_NTH = 6,
    COMMAND_SEEK_NTH_BACK = 7,
    COMMAND_COUNT = 8,
    COMMAND_LAST_LINE = 9,
    COMMAND_READ = 10,
    COMMAND_RESET = 11,
    COMMAND_HELP = 12,
    COMMAND_PARSING_ERROR = 13,
};

struct BscQuery {
    int id;
    std::string pattern;
    size_t num1;
    size_t num2;
    bool hex_output;
};

volatile sig_atomic_t quit_bsc = 0;
static void HandleSignal(int sig)
{
    switch(sig)
    {
        case SIGTERM:
        case SIGINT:
        case SIGQUIT:
        case SIGHUP:
        case SIGPIPE:
            quit_bsc = 1;
            break;
        default:
            break;
    }
}

static void usage(const char *prog)
{
    std::cout << "Usage: " << prog << " -f file [-c capacity] [-e query] [-s script-file] [-l log-file] [-d]\n";
    std::cout << "\t-f file to search\n";
    std::cout << "\t-c seeker capacity (maximum pattern length and window size)\n";
    std::cout << "\t-e run query on command line\n";
    std::cout << "\t-s run queries in a file\n";
    std::cout << "\t-l log file\n";
    std::cout << "\t-d debug logging, including window loads\n";
    exit(1);
}

static void show_help()
{
    std::cout << "\tseek(E)\t\t\tsearch the next match forwards\n";
    std::cout << "\tseekBack(E)\t\tsearch the next match backwards\n";
    std::cout << "\tseekNth(E,n)\t\tsearch the nth next match forwards\n";
    std::cout << "\tseekNthBack(E,n)\tsearch the nth next match backwards\n";
    std::cout << "\tcount(E)\t\tcount non-overlapping matches in the file\n";
    std::cout << "\tlastLine\t\tprint the last line of the file\n";
    std::cout << "\tread(offset,len)\tprint len bytes at offset\n";
    std::cout << "\treset\t\t\treset both search cursors\n";
    std::cout << "\tshow\t\t\tshow seeker state\n";
    std::cout << "\thelp\t\t\tshow helps\n";
    std::cout << "\tquit\t\t\tquit bsc\n";
    std::cout << "\tE is a pattern expression: \"\\r\\n\", 'abc', bin(0x0d0a), or a concatenation\n";
    std::cout << "\tappend .hex() to lastLine or read to print hex output\n";
}

// Remove spaces outside of quoted literals. Escaped quotes stay in the literal.
static void trim_spaces(const char *cmd, std::string &cmd_trim)
{
    cmd_trim.clear();

    char quote = 0;
    const char *p = cmd;
    while(*p != '\0')
    {
        if(quote != 0)
        {
            cmd_trim.append(1, *p);
            if(*p == '\\' && *(p+1) != '\0')
                cmd_trim.append(1, *++p);
            else if(*p == quote)
                quote = 0;
        }
        else if(*p == '\'' || *p == '\"')
        {
            quote = *p;
            cmd_trim.append(1, *p);
        }
        else if(!isspace(static_cast<unsigned char>(*p)))
        {
            cmd_trim.append(1, *p);
        }

        p++;
    }
}

static bool check_hex_output(std::string &cmd)
{
    size_t pos = cmd.rfind(".hex()");
    if(pos == std::string::npos)
        return false;
    if(pos == cmd.length()-6)
    {
        cmd.erase(pos);
        return true;
    }

    return false;
}

static int parse_number(const std::string &str, size_t &num)
{
    if(str.empty())
        return -1;
    char *end = NULL;
    unsigned long long val = strtoull(str.c_str(), &end, 0);
    if(end == NULL || *end != '\0')
        return -1;
    num = static_cast<size_t>(val);
    return 0;
}

// Split "E,n" on the last ',' outside of quotes.
static int parse_pattern_number(const std::string &args, std::string &pattern, size_t &num)
{
    size_t pos = std::string::npos;
    char quote = 0;
    for(size_t i = 0; i < args.length(); i++)
    {
        if(quote != 0)
        {
            if(args[i] == '\\')
                i++;
            else if(args[i] == quote)
                quote = 0;
        }
        else if(args[i] == '\'' || args[i] == '\"')
        {
            quote = args[i];
        }
        else if(args[i] == ',')
        {
            pos = i;
        }
    }

    if(pos == std::string::npos || pos == 0)
        return -1;
    if(parse_number(args.substr(pos+1), num) < 0)
        return -1;

    ExprParser expr(args.substr(0, pos));
    return expr.Evaluate(pattern);
}

// Arguments of "name(...)" if cmd has that form
static bool call_args(const std::string &cmd, const char *name, std::string &args)
{
    size_t name_len = strlen(name);
    if(cmd.compare(0, name_len, name) != 0 || cmd.length() < name_len + 2)
        return false;
    if(cmd[name_len] != '(' || cmd[cmd.length()-1] != ')')
        return false;
    args = cmd.substr(name_len + 1, cmd.length() - name_len - 2);
    return true;
}

static int parse_command(std::string &cmd, BscQuery &query)
{
    std::string args;

    query.pattern = "";
    query.num1 = 0;
    query.num2 = 0;
    query.hex_output = check_hex_output(cmd);
    if(cmd.length() == 0)
        return COMMAND_UNKNOWN;

    switch(cmd[0])
    {
        case 'q':
            if(cmd.compare("quit") == 0)
                return COMMAND_QUIT;
            break;
        case 's':
            if(cmd.compare("show") == 0)
                return COMMAND_SHOW;
            if(call_args(cmd, "seekNthBack", args))
            {
                if(parse_pattern_number(args, query.pattern, query.num1) < 0)
                    return COMMAND_PARSING_ERROR;
                return COMMAND_SEEK_NTH_BACK;
            }
            if(call_args(cmd, "seekNth", args))
            {
                if(parse_pattern_number(args, query.pattern, query.num1) < 0)
                    return COMMAND_PARSING_ERROR;
                return COMMAND_SEEK_NTH;
            }
            if(call_args(cmd, "seekBack", args))
            {
                ExprParser expr(args);
                if(expr.Evaluate(query.pattern) < 0)
                    return COMMAND_PARSING_ERROR;
                return COMMAND_SEEK_BACK;
            }
            if(call_args(cmd, "seek", args))
            {
                ExprParser expr(args);
                if(expr.Evaluate(query.pattern) < 0)
                    return COMMAND_PARSING_ERROR;
                return COMMAND_SEEK;
            }
            break;
        case 'c':
            if(call_args(cmd, "count", args))
            {
                ExprParser expr(args);
                if(expr.Evaluate(query.pattern) < 0)
                    return COMMAND_PARSING_ERROR;
                return COMMAND_COUNT;
            }
            break;
        case 'l':
            if(cmd.compare("lastLine") == 0)
                return COMMAND_LAST_LINE;
            break;
        case 'r':
            if(cmd.compare("reset") == 0)
                return COMMAND_RESET;
            if(call_args(cmd, "read", args))
            {
                size_t pos = args.find(',');
                if(pos == std::string::npos)
                    return COMMAND_PARSING_ERROR;
                if(parse_number(args.substr(0, pos), query.num1) < 0 ||
                   parse_number(args.substr(pos+1), query.num2) < 0)
                    return COMMAND_PARSING_ERROR;
                return COMMAND_READ;
            }
            break;
        case 'h':
            if(cmd.compare("help") == 0)
                return COMMAND_HELP;
            break;
        default:
            break;
    }

    return COMMAND_UNKNOWN;
}

static void display_bytes(const std::string &bytes, bool hex_output)
{
    if(hex_output)
    {
        std::string hex;
        if(bin_2_hex(bytes, hex) < 0)
            std::cout << "failed to convert to hex\n";
        else
            std::cout << hex << "\n";
    }
    else
    {
        std::cout << bytes << "\n";
    }
}

static void display_offset(int rval, size_t offset)
{
    if(rval == BSError::SUCCESS)
        std::cout << offset << "\n";
    else
        std::cout << BSError::get_error_str(rval) << "\n";
}

static void display_state(const ByteSeeker &seeker)
{
    std::cout << "length: " << seeker.Length() << "\n";
    std::cout << "capacity: " << seeker.Capacity() << "\n";
    std::cout << "forward cursor: " << seeker.ForwardCursor()
              << (seeker.IsExhausted(CONSTS::SEEK_FORWARD) ? " (exhausted)" : "") << "\n";
    std::cout << "backward cursor: " << seeker.BackwardCursor()
              << (seeker.IsExhausted(CONSTS::SEEK_BACKWARD) ? " (exhausted)" : "") << "\n";
}

static int RunCommand(ByteSeeker &seeker, int cmd_id, const BscQuery &query)
{
    int rval = BSError::SUCCESS;
    size_t offset = 0;
    size_t count = 0;
    std::string bytes;

    switch(cmd_id)
    {
        case COMMAND_NONE:
            break;
        case COMMAND_QUIT:
            std::cout << "bye\n";
            quit_bsc = 1;
            break;
        case COMMAND_SEEK:
            rval = seeker.Seek(query.pattern, offset);
            display_offset(rval, offset);
            break;
        case COMMAND_SEEK_BACK:
            rval = seeker.SeekBack(query.pattern, offset);
            display_offset(rval, offset);
            break;
        case COMMAND_SEEK_NTH:
            rval = seeker.SeekNth(query.pattern, query.num1, offset);
            display_offset(rval, offset);
            break;
        case COMMAND_SEEK_NTH_BACK:
            rval = seeker.SeekNthBack(query.pattern, query.num1, offset);
            display_offset(rval, offset);
            break;
        case COMMAND_COUNT:
            rval = count_occurrences(seeker, query.pattern, count);
            if(rval == BSError::SUCCESS)
                std::cout << count << "\n";
            else
                std::cout << BSError::get_error_str(rval) << "\n";
            break;
        case COMMAND_LAST_LINE:
            rval = read_last_line(seeker, bytes);
            if(rval == BSError::SUCCESS)
                display_bytes(bytes, query.hex_output);
            else
                std::cout << BSError::get_error_str(rval) << "\n";
            break;
        case COMMAND_READ:
            rval = seeker.ReadRange(query.num1, query.num2, bytes);
            if(rval == BSError::SUCCESS)
                display_bytes(bytes, query.hex_output);
            else
                std::cout << BSError::get_error_str(rval) << "\n";
            break;
        case COMMAND_RESET:
            rval = seeker.Reset();
            std::cout << BSError::get_error_str(rval) << "\n";
            break;
        case COMMAND_SHOW:
            display_state(seeker);
            break;
        case COMMAND_HELP:
            show_help();
            break;
        case COMMAND_PARSING_ERROR:
            break;
        case COMMAND_UNKNOWN:
        default:
            std::cout << "unknown query\n";
            break;
    }

    return rval;
}

static void bsclient(ByteSeeker &seeker, const std::string &file)
{
    rl_bind_key('\t', rl_complete);

    printf("byteseeker %d.%d.%d shell\n", version[0], version[1], version[2]);
    std::cout << "file: " << file << " (" << seeker.Length() << " bytes)\n";

    int cmd_id;
    BscQuery query;
    std::string cmd;

    while(!quit_bsc)
    {
        char* line = readline(">> ");
        if(line == NULL) break;
        if(line[0] == '\0')
        {
            free(line);
            continue;
        }

        trim_spaces(line, cmd);
        add_history(line);
        free(line);
        if(cmd.length() == 0)
            continue;

        cmd_id = parse_command(cmd, query);
        RunCommand(seeker, cmd_id, query);
    }
}

static int run_query_command(ByteSeeker &seeker, const std::string &command_str)
{
    std::string cmd;
    BscQuery query;

    trim_spaces(command_str.c_str(), cmd);
    if(cmd.length() == 0)
    {
        std::cerr << command_str << " not a valid command\n";
        return BSError::INVALID_ARG;
    }

    int cmd_id = parse_command(cmd, query);
    return RunCommand(seeker, cmd_id, query);
}

static void run_script(ByteSeeker &seeker, const std::string &script_file)
{
    std::ifstream script_in(script_file);
    if(!script_in.is_open())
    {
        std::cerr << "cannot open file " << script_file << "\n";
        return;
    }

    std::string line;
    std::string cmd;
    BscQuery query;

    while(getline(script_in, line))
    {
        trim_spaces(line.c_str(), cmd);
        if(cmd.length() == 0 || cmd[0] == '#')
            continue;

        int cmd_id = parse_command(cmd, query);
        std::cout << cmd << ": ";
        RunCommand(seeker, cmd_id, query);

        if(quit_bsc) break;
    }
    script_in.close();
}

int main(int argc, char *argv[])
{
    signal(SIGINT, HandleSignal);
    signal(SIGTERM, HandleSignal);
    signal(SIGQUIT, HandleSignal);
    signal(SIGPIPE, HandleSignal);
    signal(SIGHUP, HandleSignal);

    const char *file_path = NULL;
    size_t capacity = CONSTS::DEFAULT_CHUNK_SIZE;
    std::string query_cmd = "";
    std::string script_file = "";
    std::string log_file = "";
    bool debug = false;

    for(int i = 1; i < argc; i++)
    {
        if(strcmp(argv[i], "-f") == 0)
        {
            if(++i >= argc)
                usage(argv[0]);
            file_path = argv[i];
        }
        else if(strcmp(argv[i], "-c") == 0)
        {
            if(++i >= argc)
                usage(argv[0]);
            if(parse_number(argv[i], capacity) < 0)
                usage(argv[0]);
        }
        else if(strcmp(argv[i], "-e") == 0)
        {
            if(++i >= argc)
                usage(argv[0]);
            query_cmd = argv[i];
        }
        else if(strcmp(argv[i], "-s") == 0)
        {
            if(++i >= argc)
                usage(argv[0]);
            script_file = argv[i];
        }
        else if(strcmp(argv[i], "-l") == 0)
        {
            if(++i >= argc)
                usage(argv[0]);
            log_file = argv[i];
        }
        else if(strcmp(argv[i], "-d") == 0)
        {
            debug = true;
        }
        else
            usage(argv[0]);
    }

    if(file_path == NULL)
        usage(argv[0]);

    if(!log_file.empty())
        ByteSeeker::SetLogFile(log_file);
    if(debug)
        ByteSeeker::LogDebug();

    FileStream fstream(file_path);
    int rval = fstream.Open();
    if(rval != BSError::SUCCESS)
    {
        std::cerr << "failed to open " << file_path << ": " << BSError::get_error_str(rval)
                  << " (" << strerror(fstream.ErrorNo()) << ")\n";
        ByteSeeker::CloseLogFile();
        exit(1);
    }

    BSConfig config;
    config.capacity = capacity;
    config.options = debug ? CONSTS::OPTION_LOG_WINDOWS : 0;

    int exit_code = 0;
    {
        ByteSeeker seeker(fstream, config);
        if(!seeker.is_open())
        {
            std::cerr << "failed to initialize seeker: " << seeker.StatusStr() << "\n";
            exit_code = 1;
        }
        else if(query_cmd.length() != 0)
        {
            rval = run_query_command(seeker, query_cmd);
            if(rval != BSError::SUCCESS)
                exit_code = 1;
        }
        else if(script_file.length() != 0)
        {
            run_script(seeker, script_file);
        }
        else
        {
            bsclient(seeker, file_path);
        }
    }

    fstream.Close();
    ByteSeeker::CloseLogFile();
    return exit_code;
}
