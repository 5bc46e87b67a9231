// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_CRYPTO_COMMON_H
#define SHARES_CRYPTO_COMMON_H

#include <stdint.h>
#include <stddef.h>

#include <vector>

uint32_t static inline ReadBE32(const unsigned char* ptr)
{
    return ((uint32_t)ptr[0] << 24) |
           ((uint32_t)ptr[1] << 16) |
           ((uint32_t)ptr[2] << 8) |
           ((uint32_t)ptr[3]);
}

void static inline WriteBE32(unsigned char* ptr, uint32_t x)
{
    ptr[0] = (unsigned char)(x >> 24);
    ptr[1] = (unsigned char)(x >> 16);
    ptr[2] = (unsigned char)(x >> 8);
    ptr[3] = (unsigned char)x;
}

/** Maximum encoded size of a 64-bit unsigned varint */
static constexpr size_t MAX_UVARINT_LEN = 10;

/**
 * Append x as an unsigned LEB128 varint (7 bits per byte, least significant
 * group first, high bit set on every byte but the last).
 */
void static inline WriteUVarInt(std::vector<unsigned char>& out, uint64_t x)
{
    while (x >= 0x80) {
        out.push_back((unsigned char)(x | 0x80));
        x >>= 7;
    }
    out.push_back((unsigned char)x);
}

/**
 * Decode an unsigned varint from [ptr, ptr + len).
 * @return number of bytes consumed, or 0 if the input is truncated or
 *         overflows 64 bits
 */
size_t static inline ReadUVarInt(const unsigned char* ptr, size_t len, uint64_t& x)
{
    x = 0;
    unsigned int shift = 0;
    for (size_t i = 0; i < len && i < MAX_UVARINT_LEN; ++i) {
        unsigned char b = ptr[i];
        if (i == MAX_UVARINT_LEN - 1 && b > 1) {
            return 0;
        }
        x |= (uint64_t)(b & 0x7f) << shift;
        if ((b & 0x80) == 0) {
            return i + 1;
        }
        shift += 7;
    }
    return 0;
}

size_t static inline UVarIntSize(uint64_t x)
{
    size_t n = 1;
    while (x >= 0x80) {
        x >>= 7;
        ++n;
    }
    return n;
}

#endif // SHARES_CRYPTO_COMMON_H
