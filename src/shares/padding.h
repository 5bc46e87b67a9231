// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_PADDING_H
#define SHARES_PADDING_H

#include <shares/namespace_id.h>
#include <shares/share.h>
#include <shares/share_errors.h>
#include <shares/share_params.h>

#include <cstddef>
#include <vector>

namespace shares {

/**
 * A sequence-start share in namespaceId with a sequence length of zero and
 * an all-zero payload. Used to pad a namespace up to an aligned boundary.
 */
ShareResult<Share> NamespacePaddingShare(const NamespaceID& namespaceId,
                                         const ShareParams& params = GetShareParams());

ShareResult<std::vector<Share>> NamespacePaddingShares(const NamespaceID& namespaceId, size_t n,
                                                       const ShareParams& params = GetShareParams());

/** Padding between the reserved namespaces and the first blob */
ShareResult<Share> ReservedPaddingShare(const ShareParams& params = GetShareParams());

ShareResult<std::vector<Share>> ReservedPaddingShares(size_t n, const ShareParams& params = GetShareParams());

/** Padding after the last blob of a square */
ShareResult<Share> TailPaddingShare(const ShareParams& params = GetShareParams());

ShareResult<std::vector<Share>> TailPaddingShares(size_t n, const ShareParams& params = GetShareParams());

} // namespace shares

#endif // SHARES_PADDING_H
