// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_INFO_BYTE_H
#define SHARES_INFO_BYTE_H

#include <shares/share_errors.h>
#include <shares/share_params.h>

#include <cstdint>

namespace shares {

/**
 * @brief The byte following the namespace ID
 *
 * Layout: (version << 1) | isSequenceStart. The version occupies the upper
 * seven bits and must not exceed ShareParams::nMaxShareVersion.
 */
class InfoByte
{
public:
    static ShareResult<InfoByte> Create(uint8_t version, bool isSequenceStart,
                                        const ShareParams& params = GetShareParams());

    static ShareResult<InfoByte> Parse(unsigned char raw,
                                       const ShareParams& params = GetShareParams());

    /** Share format version (upper seven bits) */
    uint8_t Version() const { return m_raw >> 1; }

    /** Whether this share starts a sequence (lowest bit) */
    bool IsSequenceStart() const { return (m_raw & 1) == 1; }

    unsigned char GetRaw() const { return m_raw; }

    bool operator==(const InfoByte& other) const { return m_raw == other.m_raw; }
    bool operator!=(const InfoByte& other) const { return m_raw != other.m_raw; }

private:
    explicit InfoByte(unsigned char raw) : m_raw(raw) {}

    unsigned char m_raw;
};

} // namespace shares

#endif // SHARES_INFO_BYTE_H
