// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/info_byte.h>

#include <util.h>

namespace shares {

ShareResult<InfoByte> InfoByte::Create(uint8_t version, bool isSequenceStart, const ShareParams& params)
{
    if (version > params.nMaxShareVersion) {
        return ShareStatus::Fail(ShareError::INVALID_INFO_BYTE,
            strprintf("version %u must be less than or equal to %u", version, params.nMaxShareVersion),
            params.nMaxShareVersion, version);
    }

    unsigned char prefix = static_cast<unsigned char>(version << 1);
    if (isSequenceStart) {
        return InfoByte(prefix | 1);
    }
    return InfoByte(prefix);
}

ShareResult<InfoByte> InfoByte::Parse(unsigned char raw, const ShareParams& params)
{
    uint8_t version = raw >> 1;
    bool isSequenceStart = (raw & 1) == 1;

    ShareResult<InfoByte> result = Create(version, isSequenceStart, params);
    if (!result) {
        // report the byte as it appeared on the wire
        return ShareStatus::Fail(ShareError::INVALID_INFO_BYTE,
            strprintf("info byte 0x%02x: %s", raw, result.Status().errorMessage),
            params.nMaxShareVersion, raw);
    }
    return result;
}

} // namespace shares
