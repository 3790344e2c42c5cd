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

#ifndef __BS_HEXBIN_H__
#define __BS_HEXBIN_H__

#include <string>

// Both return the output length, or -1 on malformed input.
int bin_2_hex(const std::string &bin, std::string &hex);
int hex_2_bin(const std::string &hex, std::string &bin);

#endif
