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

#include "expr_parser.h"
#include "hexbin.h"
#include <cctype>
#include <iostream>

// Grammar:
//    S  ---> E
//    E  ---> bin(E)
//    E  ---> hex(E)
//    E  ---> T
//    E  ---> T E     (concatenation, left-to-right)
//    T  ---> literal string ("abc", 'xyz'), with escapes \n \r \t \0 \\ \' \" \xHH
//    T  ---> hex literal (e.g., 0x0d0a inside bin())
//
// Sample expressions:
//   "\n"
//   "\r\n"
//   bin(0x0d0a)
//   "HTTP/1.1"bin(0x0d0a)

ExprParser::ExprParser(const std::string &exp)
    : pos(0)
    , expr(exp)
{
}

ExprParser::~ExprParser()
{
}

const std::string& ExprParser::Error() const
{
    return err_str;
}

int ExprParser::Evaluate(std::string &result)
{
    result = "";
    pos = 0;
    err_str = "";
    int rval = Parse(result);
    if(rval < 0)
    {
        std::cout << err_str << "\n";
    }
    else if(pos < expr.length())
    {
        err_str = "extra string " + expr.substr(pos) + " found at the end of expression";
        std::cout << err_str << "\n";
        return -1;
    }

    return rval;
}

int ExprParser::ParseEscape(std::string &result)
{
    if(pos >= expr.length())
    {
        err_str = "dangling \\ at the end of " + expr;
        return -1;
    }

    char ch = expr[pos++];
    switch(ch)
    {
        case 'n':
            result.push_back('\n');
            break;
        case 'r':
            result.push_back('\r');
            break;
        case 't':
            result.push_back('\t');
            break;
        case '0':
            result.push_back('\0');
            break;
        case '\\':
        case '\'':
        case '"':
            result.push_back(ch);
            break;
        case 'x': {
            if(pos + 2 > expr.length())
            {
                err_str = "incomplete \\x escape in " + expr;
                return -1;
            }
            std::string bin;
            if(hex_2_bin(expr.substr(pos, 2), bin) != 1)
            {
                err_str = "invalid \\x escape in " + expr;
                return -1;
            }
            result += bin;
            pos += 2;
            break;
        }
        default:
            err_str = std::string("unknown escape \\") + ch + " in " + expr;
            return -1;
    }

    return 0;
}

int ExprParser::ParseLiteral(char quote, std::string &result)
{
    size_t start = pos;
    pos++; // skip the opening quote
    while(pos < expr.length())
    {
        char ch = expr[pos];
        if(ch == quote)
        {
            pos++;
            return 0;
        }
        pos++;
        if(ch == '\\')
        {
            if(ParseEscape(result) < 0)
                return -1;
        }
        else
        {
            result.push_back(ch);
        }
    }

    err_str = "expression " + expr.substr(0, start) + " missing closing " + quote;
    return -1;
}

int ExprParser::Parse(std::string &result)
{
    result.clear();

    while(pos < expr.length())
    {
        std::string sub_result;
        int rval;

        switch(expr[pos])
        {
            case 'b': { // bin(...) expression
                if(expr.compare(pos, 4, "bin(") != 0)
                {
                    err_str = "unrecognized expression " + expr.substr(pos);
                    return -1;
                }

                pos += 4;
                rval = Parse(sub_result);
                if(rval < 0)
                    return rval;

                if(pos >= expr.length() || expr[pos] != ')')
                {
                    err_str = "missing ) at the end of " + expr.substr(0, pos);
                    return -1;
                }
                pos++;

                std::string hex_input = sub_result;
                if(hex_input.rfind("0x", 0) == 0 || hex_input.rfind("0X", 0) == 0)
                    hex_input = hex_input.substr(2);

                if(hex_2_bin(hex_input, sub_result) < 0)
                {
                    err_str = "failed to convert hex string " + hex_input + " to binary format";
                    return -1;
                }
                break;
            }
            case 'h': { // hex(...) expression
                if(expr.compare(pos, 4, "hex(") != 0)
                {
                    err_str = "unrecognized expression " + expr.substr(pos);
                    return -1;
                }

                pos += 4;
                std::string inner;
                rval = Parse(inner);
                if(rval < 0)
                    return rval;

                if(pos >= expr.length() || expr[pos] != ')')
                {
                    err_str = "missing ) at the end of " + expr.substr(0, pos);
                    return -1;
                }
                pos++;

                if(bin_2_hex(inner, sub_result) < 0)
                {
                    err_str = "failed to convert " + inner + " to hex format";
                    return -1;
                }
                break;
            }
            case '"':
            case '\'':
                if(ParseLiteral(expr[pos], sub_result) < 0)
                    return -1;
                break;
            case '0': { // 0x... hex string
                size_t start = pos;
                if(expr.length() > pos + 1 && (expr[pos+1] == 'x' || expr[pos+1] == 'X'))
                {
                    pos += 2;
                    size_t hex_start = pos;
                    while(pos < expr.length() && isxdigit(static_cast<unsigned char>(expr[pos])))
                        pos++;
                    if(hex_start == pos)
                    {
                        err_str = "expected hex digits after 0x";
                        return -1;
                    }
                    sub_result = expr.substr(start, pos - start);
                    break;
                }
                err_str = "unrecognized expression " + expr.substr(pos);
                return -1;
            }
            case ')': // end of parenthesized expression
                return 0;
            default:
                err_str = "unrecognized expression " + expr.substr(pos) + "\n";
                err_str += "                        ^";
                return -1;
        }

        result += sub_result;
    }

    return 0;
}
