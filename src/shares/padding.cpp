// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/padding.h>
#include <shares/share_builder.h>

namespace shares {

ShareResult<Share> NamespacePaddingShare(const NamespaceID& namespaceId, const ShareParams& params)
{
    ShareBuilder builder(namespaceId, SHARE_VERSION_ZERO, true, params);
    ShareStatus status = builder.WriteSequenceLen(0);
    if (!status) {
        return status;
    }
    builder.ZeroPadIfNecessary();
    return builder.Build();
}

ShareResult<std::vector<Share>> NamespacePaddingShares(const NamespaceID& namespaceId, size_t n,
                                                       const ShareParams& params)
{
    std::vector<Share> shares;
    if (n == 0) {
        return shares;
    }
    ShareResult<Share> padding = NamespacePaddingShare(namespaceId, params);
    if (!padding) {
        return padding.Status();
    }
    shares.assign(n, *padding);
    return shares;
}

ShareResult<Share> ReservedPaddingShare(const ShareParams& params)
{
    return NamespacePaddingShare(params.reservedPaddingNamespaceID, params);
}

ShareResult<std::vector<Share>> ReservedPaddingShares(size_t n, const ShareParams& params)
{
    return NamespacePaddingShares(params.reservedPaddingNamespaceID, n, params);
}

ShareResult<Share> TailPaddingShare(const ShareParams& params)
{
    return NamespacePaddingShare(params.tailPaddingNamespaceID, params);
}

ShareResult<std::vector<Share>> TailPaddingShares(size_t n, const ShareParams& params)
{
    return NamespacePaddingShares(params.tailPaddingNamespaceID, n, params);
}

} // namespace shares
