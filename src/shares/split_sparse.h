// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_SPLIT_SPARSE_H
#define SHARES_SPLIT_SPARSE_H

/**
 * @file split_sparse.h
 * @brief Split blobs into sparse shares
 *
 * Every blob becomes its own sequence: a first share holding the sequence
 * length followed by continuation shares. The last share is zero padded.
 */

#include <shares/namespace_id.h>
#include <shares/share.h>
#include <shares/share_errors.h>
#include <shares/share_params.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace shares {

/**
 * @brief Namespaced payload stored in sparse shares
 */
struct Blob {
    /** Namespace the blob is published under */
    NamespaceID namespaceId;

    /** Payload bytes */
    std::vector<unsigned char> data;

    /** Share version used to encode the blob */
    uint8_t shareVersion;

    Blob() : shareVersion(SHARE_VERSION_ZERO) {}

    Blob(const NamespaceID& ns, std::vector<unsigned char> payload, uint8_t version = SHARE_VERSION_ZERO)
        : namespaceId(ns), data(std::move(payload)), shareVersion(version) {}

    std::string ToString() const;

    bool operator==(const Blob& other) const {
        return namespaceId == other.namespaceId &&
               data == other.data &&
               shareVersion == other.shareVersion;
    }
    bool operator!=(const Blob& other) const { return !(*this == other); }
};

/**
 * Number of sparse shares needed for a sequence of sequenceLen bytes
 */
size_t SparseSharesNeeded(uint32_t sequenceLen, const ShareParams& params = GetShareParams());

/**
 * @brief Accumulates sparse shares for a series of blobs
 */
class SparseShareSplitter
{
public:
    explicit SparseShareSplitter(const ShareParams& params = GetShareParams());

    /**
     * Append the shares for one blob.
     * Fails for empty data, a namespace of the wrong width, or an
     * unsupported share version; nothing is appended on failure.
     * The tx and PayForBlob namespaces, and the padding and parity
     * namespaces, are rejected with INVALID_ARGUMENT.
     */
    ShareStatus Write(const Blob& blob);

    /** Whether blobs may be written in namespaceId */
    bool IsBlobNamespace(const NamespaceID& namespaceId) const;

    /**
     * Append count namespace padding shares in the namespace of the last
     * written share. Fails if nothing has been written yet.
     */
    ShareStatus WriteNamespacedPaddedShares(size_t count);

    /** The shares written so far */
    const std::vector<Share>& Export() const { return m_shares; }

    /** Number of shares written so far */
    size_t Count() const { return m_shares.size(); }

private:
    ShareParamsRef m_params;
    std::vector<Share> m_shares;
};

} // namespace shares

#endif // SHARES_SPLIT_SPARSE_H
