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

#ifndef __BS_TEST_DATA_H__
#define __BS_TEST_DATA_H__

#include <stdint.h>
#include <stdlib.h>
#include <string>
#include <vector>

#include <openssl/evp.h>
#include <openssl/sha.h>

namespace {

// Deterministic pseudorandom streams built from SHA-256 digests of a
// seed and a block counter. Bytes are folded into a small alphabet so
// short patterns occur often and overlap.
class TestData
{
public:
    TestData(uint32_t s, const std::string &alpha = std::string("ab\n0"))
        : seed(s)
        , alphabet(alpha)
    {
    }
    ~TestData() {
    }

    std::string get_bytes(size_t len) {
        std::string bytes;
        bytes.reserve(len);

        unsigned char hash[SHA256_DIGEST_LENGTH];
        unsigned int hash_len = 0;
        uint32_t block[2];
        block[0] = seed;
        block[1] = 0;
        while(bytes.size() < len) {
            if(EVP_Digest(block, sizeof(block), hash, &hash_len, EVP_sha256(), NULL) != 1)
                abort();
            for(unsigned int i = 0; i < hash_len && bytes.size() < len; i++) {
                if(alphabet.empty())
                    bytes.push_back(static_cast<char>(hash[i]));
                else
                    bytes.push_back(alphabet[hash[i] % alphabet.size()]);
            }
            block[1]++;
        }
        return bytes;
    }

    // Pattern of len bytes taken from the same alphabet
    std::string get_pattern(size_t len, uint32_t index) {
        TestData pattern_data(seed ^ (0x9e3779b9u + index), alphabet);
        return pattern_data.get_bytes(len);
    }

private:
    uint32_t seed;
    std::string alphabet;
};

// Non-overlapping occurrences scanning left to right
inline std::vector<size_t> naive_forward(const std::string &bytes, const std::string &pattern)
{
    std::vector<size_t> offsets;
    size_t pos = 0;
    while(pattern.size() > 0 && pos + pattern.size() <= bytes.size()) {
        if(bytes.compare(pos, pattern.size(), pattern) == 0) {
            offsets.push_back(pos);
            pos += pattern.size();
        } else {
            pos++;
        }
    }
    return offsets;
}

// Non-overlapping occurrences scanning right to left
inline std::vector<size_t> naive_backward(const std::string &bytes, const std::string &pattern)
{
    std::vector<size_t> offsets;
    if(pattern.size() == 0 || pattern.size() > bytes.size())
        return offsets;

    size_t end = bytes.size();
    while(end >= pattern.size()) {
        size_t pos = end - pattern.size();
        if(bytes.compare(pos, pattern.size(), pattern) == 0) {
            offsets.push_back(pos);
            end = pos;
        } else {
            end--;
        }
    }
    return offsets;
}

}

#endif
