// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/reserved_bytes.h>

#include <crypto/common.h>
#include <util.h>

namespace shares {

ShareResult<std::vector<unsigned char>> EncodeReservedBytes(uint32_t byteIndex, const ShareParams& params)
{
    if (byteIndex >= params.nShareSize) {
        return ShareStatus::Fail(ShareError::INVALID_RESERVED_BYTES,
            strprintf("byte index %u must be less than share size %u", byteIndex, params.nShareSize),
            params.nShareSize, byteIndex);
    }
    std::vector<unsigned char> reservedBytes(params.nCompactShareReservedBytes);
    WriteBE32(reservedBytes.data(), byteIndex);
    return reservedBytes;
}

ShareResult<uint32_t> ParseReservedBytes(const std::vector<unsigned char>& reservedBytes, const ShareParams& params)
{
    if (reservedBytes.size() != params.nCompactShareReservedBytes) {
        return ShareStatus::Fail(ShareError::INVALID_RESERVED_BYTES,
            strprintf("reserved bytes must be %u bytes, got %u", params.nCompactShareReservedBytes, reservedBytes.size()),
            params.nCompactShareReservedBytes, reservedBytes.size());
    }
    uint32_t byteIndex = ReadBE32(reservedBytes.data());
    if (byteIndex >= params.nShareSize) {
        return ShareStatus::Fail(ShareError::INVALID_RESERVED_BYTES,
            strprintf("reserved byte index %u must be less than share size %u", byteIndex, params.nShareSize),
            params.nShareSize, byteIndex);
    }
    return byteIndex;
}

} // namespace shares
