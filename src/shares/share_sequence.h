// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_SHARE_SEQUENCE_H
#define SHARES_SHARE_SEQUENCE_H

#include <shares/namespace_id.h>
#include <shares/share.h>
#include <shares/share_errors.h>

#include <cstdint>
#include <string>
#include <vector>

namespace shares {

/**
 * @brief A sequence-start share followed by its continuation shares
 */
struct ShareSequence {
    /** Namespace shared by every share in the sequence */
    NamespaceID namespaceId;

    /** Shares in order, starting with the sequence-start share */
    std::vector<Share> shares;

    /**
     * Raw data of all shares concatenated and cut to the sequence length,
     * so the zero padding of the last share is dropped.
     */
    ShareResult<std::vector<unsigned char>> RawData() const;

    /** Sequence length stored in the first share */
    ShareResult<uint32_t> SequenceLen() const;

    /** Whether the first share is padding */
    ShareResult<bool> IsPadding() const;

    /**
     * A non-padding sequence must consist of exactly as many shares as its
     * sequence length requires.
     */
    ShareStatus ValidSequenceLen() const;

    std::string ToString() const;
};

/**
 * @brief Group shares into sequences
 *
 * Fails with INVALID_SEQUENCE if a continuation share has no preceding
 * sequence-start share, if the namespace changes inside a sequence, or if a
 * sequence has the wrong number of shares. Field errors of individual shares
 * are passed through.
 *
 * @param ignorePadding drop sequences whose first share is padding
 */
ShareResult<std::vector<ShareSequence>> ParseShares(const std::vector<Share>& shares, bool ignorePadding);

} // namespace shares

#endif // SHARES_SHARE_SEQUENCE_H
