// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/split_sparse.h>
#include <shares/padding.h>
#include <shares/share_builder.h>

#include <util.h>

#include <algorithm>
#include <limits>

namespace shares {

std::string Blob::ToString() const
{
    return strprintf("Blob(namespace=%s, size=%u, shareVersion=%u)",
                     namespaceId.GetHex(), data.size(), shareVersion);
}

size_t SparseSharesNeeded(uint32_t sequenceLen, const ShareParams& params)
{
    if (sequenceLen == 0) {
        return 0;
    }

    if (sequenceLen < params.FirstSparseShareContentSize()) {
        return 1;
    }

    size_t bytesAvailable = params.FirstSparseShareContentSize();
    size_t sharesNeeded = 1;
    while (bytesAvailable < sequenceLen) {
        bytesAvailable += params.ContinuationSparseShareContentSize();
        sharesNeeded++;
    }
    return sharesNeeded;
}

SparseShareSplitter::SparseShareSplitter(const ShareParams& params)
    : m_params(GetShareParamsRef(params))
{
}

bool SparseShareSplitter::IsBlobNamespace(const NamespaceID& namespaceId) const
{
    // compact namespaces and the padding and parity sentinels never carry a blob
    return namespaceId != m_params->txNamespaceID &&
           namespaceId != m_params->payForBlobNamespaceID &&
           namespaceId != m_params->reservedPaddingNamespaceID &&
           namespaceId != m_params->tailPaddingNamespaceID &&
           namespaceId != m_params->paritySharesNamespaceID;
}

ShareStatus SparseShareSplitter::Write(const Blob& blob)
{
    if (!m_params->IsSupportedVersion(blob.shareVersion)) {
        return ShareStatus::Fail(ShareError::UNSUPPORTED_VERSION,
            strprintf("unsupported share version: %u", blob.shareVersion),
            m_params->vSupportedShareVersions.empty() ? 0 :
                *std::max_element(m_params->vSupportedShareVersions.begin(), m_params->vSupportedShareVersions.end()),
            blob.shareVersion);
    }
    if (!IsBlobNamespace(blob.namespaceId)) {
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            strprintf("namespace %s cannot hold blobs", blob.namespaceId.GetHex()));
    }
    if (blob.data.empty()) {
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            strprintf("blob in namespace %s has no data", blob.namespaceId.GetHex()));
    }
    if (blob.data.size() > std::numeric_limits<uint32_t>::max()) {
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            strprintf("blob of %u bytes exceeds the maximum sequence length", blob.data.size()),
            std::numeric_limits<uint32_t>::max(), blob.data.size());
    }

    std::vector<Share> blobShares;
    blobShares.reserve(SparseSharesNeeded(static_cast<uint32_t>(blob.data.size()), *m_params));

    // First share carries the sequence length
    ShareBuilder builder(blob.namespaceId, blob.shareVersion, true, m_params);
    ShareStatus status = builder.WriteSequenceLen(static_cast<uint32_t>(blob.data.size()));
    if (!status) {
        return status;
    }

    std::vector<unsigned char> rawData = blob.data;
    while (true) {
        std::vector<unsigned char> rawDataLeftOver = builder.AddData(rawData);
        if (rawDataLeftOver.empty()) {
            builder.ZeroPadIfNecessary();
        }

        ShareResult<Share> share = builder.Build();
        if (!share) {
            return share.Status();
        }
        blobShares.push_back(share.Take());

        if (rawDataLeftOver.empty()) {
            break;
        }
        builder = ShareBuilder(blob.namespaceId, blob.shareVersion, false, m_params);
        rawData = std::move(rawDataLeftOver);
    }

    LogPrint(BCLog::SPLIT, "SparseShareSplitter: %s -> %u shares\n", blob.ToString(), blobShares.size());

    m_shares.insert(m_shares.end(), blobShares.begin(), blobShares.end());
    return ShareStatus::Ok();
}

ShareStatus SparseShareSplitter::WriteNamespacedPaddedShares(size_t count)
{
    if (m_shares.empty()) {
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            "cannot write empty namespaced shares on an empty SparseShareSplitter");
    }
    if (count == 0) {
        return ShareStatus::Ok();
    }

    ShareResult<NamespaceID> lastNamespace = m_shares.back().GetNamespaceID();
    if (!lastNamespace) {
        return lastNamespace.Status();
    }
    ShareResult<std::vector<Share>> padding = NamespacePaddingShares(*lastNamespace, count, *m_params);
    if (!padding) {
        return padding.Status();
    }
    m_shares.insert(m_shares.end(), padding->begin(), padding->end());
    return ShareStatus::Ok();
}

} // namespace shares
