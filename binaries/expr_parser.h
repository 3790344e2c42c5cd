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

#ifndef __BS_EXPR_PARSER_H__
#define __BS_EXPR_PARSER_H__

#include <string>

// A simple LL parser for bsc pattern expressions
class ExprParser
{
public:
    ExprParser(const std::string &expr);
    ~ExprParser();
    int Evaluate(std::string &result);
    const std::string& Error() const;

private:
    int Parse(std::string &result);
    int ParseLiteral(char quote, std::string &result);
    int ParseEscape(std::string &result);

    size_t pos;
    std::string expr;
    std::string err_str;
};

#endif
