// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_SHARE_H
#define SHARES_SHARE_H

/**
 * @file share.h
 * @brief Fixed-size namespaced share and its field accessors
 *
 * Layout (big-endian integers):
 *
 *   [0, NamespaceSize)            namespace ID
 *   [NamespaceSize]               info byte: (version << 1) | isSequenceStart
 *   +4 if sequence start          sequence length (uint32)
 *   +ReservedBytes if compact     reserved bytes (index of first unit)
 *   [..., ShareSize)              raw data, zero padded at sequence tail
 *
 * A Share is immutable once constructed. Field accessors parse lazily and
 * report malformed content through ShareResult rather than aborting.
 */

#include <shares/info_byte.h>
#include <shares/namespace_id.h>
#include <shares/share_errors.h>
#include <shares/share_params.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace shares {

class Share
{
public:
    /**
     * @brief Wrap a buffer as a share
     * @return SIZE_MISMATCH unless data is exactly params.nShareSize bytes.
     *         No other validation happens here.
     *
     * The share keeps its own handle to params (see GetShareParamsRef), so a
     * caller-owned table may be destroyed while the share is still in use.
     */
    static ShareResult<Share> Create(std::vector<unsigned char> data,
                                     const ShareParams& params = GetShareParams());

    /** As above, sharing an existing table handle; INVALID_ARGUMENT if params is null */
    static ShareResult<Share> Create(std::vector<unsigned char> data, ShareParamsRef params);

    /** Re-check the size invariant */
    ShareStatus Validate() const;

    ShareResult<NamespaceID> GetNamespaceID() const;

    ShareResult<InfoByte> GetInfoByte() const;

    ShareResult<uint8_t> Version() const;

    /**
     * UNSUPPORTED_VERSION unless the share's version is in supportedVersions.
     * The failure reports the highest supported version as expected and the
     * share's version as actual.
     */
    ShareStatus DoesSupportVersions(const std::vector<uint8_t>& supportedVersions) const;

    /** Whether this is the first share in a sequence */
    ShareResult<bool> IsSequenceStart() const;

    /**
     * Whether this share uses the compact layout (tx or PayForBlob namespace).
     * A buffer too short to hold a namespace is not compact.
     */
    bool IsCompactShare() const;

    /**
     * Sequence length stored in a sequence-start share.
     * Returns 0 for continuation shares, which carry no length.
     */
    ShareResult<uint32_t> SequenceLen() const;

    /**
     * Whether the share is padding: an empty sequence-start share, or a
     * share in the tail-padding or reserved-padding namespace.
     */
    ShareResult<bool> IsPadding() const;

    /**
     * Decoded reserved bytes of a compact share.
     * INVALID_ARGUMENT for sparse shares.
     */
    ShareResult<uint32_t> ReservedBytes() const;

    /**
     * Bytes after the namespace ID, info byte, sequence length and reserved
     * bytes, through the end of the share.
     */
    ShareResult<std::vector<unsigned char>> RawData() const;

    /** Offset where raw data begins for this share's layout */
    ShareResult<size_t> RawDataStartIndex() const;

    const std::vector<unsigned char>& ToBytes() const { return m_data; }

    size_t Len() const { return m_data.size(); }

    const ShareParams& Params() const { return *m_params; }

    std::string ToString() const;

    bool operator==(const Share& other) const { return m_data == other.m_data; }
    bool operator!=(const Share& other) const { return m_data != other.m_data; }

private:
    Share(std::vector<unsigned char> data, ShareParamsRef params)
        : m_data(std::move(data)), m_params(std::move(params)) {}

    bool HasNamespace(const NamespaceID& ns) const;

    std::vector<unsigned char> m_data;
    ShareParamsRef m_params;

    friend std::vector<Share> FromBytes(std::vector<std::vector<unsigned char>> bytes,
                                        const ShareParams& params);
};

/** One buffer per share, in order */
std::vector<std::vector<unsigned char>> ToBytes(const std::vector<Share>& shares);

/**
 * Wrap buffers as shares, in order, WITHOUT checking their size.
 *
 * This is the bulk path for buffers that already passed validation (e.g.
 * ones this node produced). Untrusted buffers must go through
 * Share::Create or be checked with Share::Validate before use.
 */
std::vector<Share> FromBytes(std::vector<std::vector<unsigned char>> bytes,
                             const ShareParams& params = GetShareParams());

} // namespace shares

#endif // SHARES_SHARE_H
