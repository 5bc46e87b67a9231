// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_SHARE_BUILDER_H
#define SHARES_SHARE_BUILDER_H

#include <shares/namespace_id.h>
#include <shares/share.h>
#include <shares/share_errors.h>
#include <shares/share_params.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace shares {

/**
 * @brief Assembles a single share
 *
 * The constructor writes the namespace ID, the info byte, a zeroed
 * sequence-length slot when building the first share of a sequence, and a
 * zeroed reserved-bytes slot when the namespace uses compact shares. Data is
 * then appended until the share is full.
 */
class ShareBuilder
{
public:
    ShareBuilder(const NamespaceID& namespaceId, uint8_t shareVersion, bool isFirstShare,
                 const ShareParams& params = GetShareParams());

    /** Build against an existing table handle; a null handle is recorded as INVALID_ARGUMENT */
    ShareBuilder(const NamespaceID& namespaceId, uint8_t shareVersion, bool isFirstShare,
                 ShareParamsRef params);

    /** Failure recorded while writing the header, OK otherwise */
    const ShareStatus& Status() const { return m_status; }

    /**
     * Append as much of data as fits.
     * @return the bytes that did not fit
     */
    std::vector<unsigned char> AddData(const std::vector<unsigned char>& data);

    /** Bytes still free in the share */
    size_t AvailableBytes() const;

    /** Whether only the header has been written */
    bool IsEmptyShare() const;

    /** Fill the rest of the share with zeros; returns the number of bytes added */
    size_t ZeroPadIfNecessary();

    /** Store the sequence length; only valid on the first share */
    ShareStatus WriteSequenceLen(uint32_t sequenceLen);

    /** Store byteIndex in the reserved bytes; only valid on compact shares */
    ShareStatus WriteReservedBytes(uint32_t byteIndex);

    /**
     * Point the reserved bytes at the current write position unless a unit
     * start was already recorded.
     */
    ShareStatus MaybeWriteReservedBytes();

    bool IsFirstShare() const { return m_isFirstShare; }
    bool IsCompactShare() const { return m_isCompactShare; }

    /** Current length of the share being built */
    size_t Len() const { return m_rawShareData.size(); }

    /** Wrap the assembled bytes; SIZE_MISMATCH unless the share is full */
    ShareResult<Share> Build() const;

private:
    size_t IndexOfReservedBytes() const;
    bool IsEmptyReservedBytes() const;

    NamespaceID m_namespaceId;
    uint8_t m_shareVersion;
    bool m_isFirstShare;
    bool m_isCompactShare;
    ShareParamsRef m_params;

    std::vector<unsigned char> m_rawShareData;
    ShareStatus m_status;
};

} // namespace shares

#endif // SHARES_SHARE_BUILDER_H
