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

#include "hexbin.h"

static const char HEX_DIGITS[] = "0123456789abcdef";

int bin_2_hex(const std::string &bin, std::string &hex)
{
    hex.clear();
    hex.reserve(bin.size() * 2);
    for(size_t i = 0; i < bin.size(); i++)
    {
        unsigned char ch = static_cast<unsigned char>(bin[i]);
        hex.push_back(HEX_DIGITS[ch >> 4]);
        hex.push_back(HEX_DIGITS[ch & 0x0F]);
    }
    return static_cast<int>(hex.size());
}

static inline int hex_to_half_byte(char hex)
{
    if(hex >= '0' && hex <= '9')
        return hex - '0';
    if(hex >= 'a' && hex <= 'f')
        return hex - 'a' + 10;
    if(hex >= 'A' && hex <= 'F')
        return hex - 'A' + 10;
    return -1;
}

int hex_2_bin(const std::string &hex, std::string &bin)
{
    bin.clear();
    if(hex.size() % 2 != 0)
        return -1;

    bin.reserve(hex.size() / 2);
    for(size_t i = 0; i < hex.size(); i += 2)
    {
        int high = hex_to_half_byte(hex[i]);
        int low = hex_to_half_byte(hex[i+1]);
        if(high < 0 || low < 0)
        {
            bin.clear();
            return -1;
        }
        bin.push_back(static_cast<char>((high << 4) | low));
    }

    return static_cast<int>(bin.size());
}
