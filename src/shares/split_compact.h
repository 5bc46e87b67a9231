// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_SPLIT_COMPACT_H
#define SHARES_SPLIT_COMPACT_H

/**
 * @file split_compact.h
 * @brief Pack transactions into compact shares
 *
 * All transactions written to one splitter form a single sequence. Each
 * transaction is stored as a unit: an unsigned varint length followed by
 * the transaction bytes. Units are packed back to back across shares; the
 * reserved bytes of every share point at the first unit starting in it.
 */

#include <shares/namespace_id.h>
#include <shares/share.h>
#include <shares/share_builder.h>
#include <shares/share_errors.h>
#include <shares/share_params.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace shares {

/**
 * Number of compact shares needed for a sequence of sequenceLen bytes
 */
size_t CompactSharesNeeded(uint32_t sequenceLen, const ShareParams& params = GetShareParams());

/** Prefix tx with its length as an unsigned varint */
std::vector<unsigned char> MarshalDelimitedTx(const std::vector<unsigned char>& tx);

class CompactShareSplitter
{
public:
    /**
     * @param namespaceId must be the tx or PayForBlob namespace
     */
    CompactShareSplitter(const NamespaceID& namespaceId, uint8_t shareVersion,
                         const ShareParams& params = GetShareParams());

    /** Whether the namespace uses compact shares and the version is supported */
    bool IsValid() const;

    /** Append one transaction; empty transactions are rejected */
    ShareStatus WriteTx(const std::vector<unsigned char>& tx);

    /**
     * The shares for everything written so far, with the sequence length
     * filled into the first share and the last share zero padded. Does not
     * change the splitter, so more transactions may be written afterwards.
     */
    ShareResult<std::vector<Share>> Export() const;

    /** Number of shares Export would return */
    size_t Count() const;

    bool IsEmpty() const;

    /** Total bytes of units written so far */
    uint32_t SequenceLen() const { return m_sequenceLen; }

private:
    ShareStatus StackPending();

    NamespaceID m_namespaceId;
    uint8_t m_shareVersion;
    ShareParamsRef m_params;

    std::vector<Share> m_shares;
    ShareBuilder m_pendingShare;
    uint32_t m_sequenceLen;
};

} // namespace shares

#endif // SHARES_SPLIT_COMPACT_H
