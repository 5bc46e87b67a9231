// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/split_compact.h>

#include <crypto/common.h>
#include <util.h>

#include <limits>

namespace shares {

size_t CompactSharesNeeded(uint32_t sequenceLen, const ShareParams& params)
{
    if (sequenceLen == 0) {
        return 0;
    }

    if (sequenceLen < params.FirstCompactShareContentSize()) {
        return 1;
    }

    size_t bytesAvailable = params.FirstCompactShareContentSize();
    size_t sharesNeeded = 1;
    while (bytesAvailable < sequenceLen) {
        bytesAvailable += params.ContinuationCompactShareContentSize();
        sharesNeeded++;
    }
    return sharesNeeded;
}

std::vector<unsigned char> MarshalDelimitedTx(const std::vector<unsigned char>& tx)
{
    std::vector<unsigned char> delimited;
    delimited.reserve(UVarIntSize(tx.size()) + tx.size());
    WriteUVarInt(delimited, tx.size());
    delimited.insert(delimited.end(), tx.begin(), tx.end());
    return delimited;
}

CompactShareSplitter::CompactShareSplitter(const NamespaceID& namespaceId, uint8_t shareVersion,
                                           const ShareParams& params)
    : m_namespaceId(namespaceId)
    , m_shareVersion(shareVersion)
    , m_params(GetShareParamsRef(params))
    , m_pendingShare(namespaceId, shareVersion, true, m_params)
    , m_sequenceLen(0)
{
}

bool CompactShareSplitter::IsValid() const
{
    return m_pendingShare.Status().IsOk() &&
           m_pendingShare.IsCompactShare() &&
           m_params->IsSupportedVersion(m_shareVersion);
}

ShareStatus CompactShareSplitter::StackPending()
{
    ShareResult<Share> share = m_pendingShare.Build();
    if (!share) {
        return share.Status();
    }
    m_shares.push_back(share.Take());
    m_pendingShare = ShareBuilder(m_namespaceId, m_shareVersion, false, m_params);
    return ShareStatus::Ok();
}

ShareStatus CompactShareSplitter::WriteTx(const std::vector<unsigned char>& tx)
{
    if (!IsValid()) {
        if (!m_pendingShare.Status()) {
            return m_pendingShare.Status();
        }
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            strprintf("namespace %s with share version %u cannot hold compact shares",
                      m_namespaceId.GetHex(), m_shareVersion));
    }

    if (tx.empty()) {
        // a zero length prefix marks the end of a sequence
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT, "cannot write an empty tx");
    }

    std::vector<unsigned char> rawData = MarshalDelimitedTx(tx);
    if (rawData.size() > std::numeric_limits<uint32_t>::max() - m_sequenceLen) {
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            strprintf("tx of %u bytes overflows the sequence length", tx.size()),
            std::numeric_limits<uint32_t>::max() - m_sequenceLen, rawData.size());
    }

    // the unit starts in the pending share, which is never full here
    ShareStatus status = m_pendingShare.MaybeWriteReservedBytes();
    if (!status) {
        return status;
    }

    while (true) {
        std::vector<unsigned char> rawDataLeftOver = m_pendingShare.AddData(rawData);
        if (rawDataLeftOver.empty()) {
            break;
        }
        status = StackPending();
        if (!status) {
            return status;
        }
        rawData = std::move(rawDataLeftOver);
    }

    if (m_pendingShare.AvailableBytes() == 0) {
        status = StackPending();
        if (!status) {
            return status;
        }
    }

    m_sequenceLen += static_cast<uint32_t>(UVarIntSize(tx.size()) + tx.size());
    LogPrint(BCLog::SPLIT, "CompactShareSplitter: wrote tx of %u bytes, sequence length %u, %u shares\n",
             tx.size(), m_sequenceLen, Count());
    return ShareStatus::Ok();
}

ShareResult<std::vector<Share>> CompactShareSplitter::Export() const
{
    std::vector<Share> shares = m_shares;
    if (IsEmpty()) {
        return shares;
    }

    if (!m_pendingShare.IsEmptyShare()) {
        ShareBuilder lastShare = m_pendingShare;
        lastShare.ZeroPadIfNecessary();
        ShareResult<Share> share = lastShare.Build();
        if (!share) {
            return share.Status();
        }
        shares.push_back(share.Take());
    }

    // rewrite the first share with the final sequence length
    std::vector<unsigned char> firstShare = shares.front().ToBytes();
    WriteBE32(&firstShare[m_params->nNamespaceSize + SHARE_INFO_BYTES], m_sequenceLen);
    ShareResult<Share> first = Share::Create(std::move(firstShare), m_params);
    if (!first) {
        return first.Status();
    }
    shares.front() = first.Take();

    return shares;
}

size_t CompactShareSplitter::Count() const
{
    if (m_pendingShare.Status().IsOk() && !m_pendingShare.IsEmptyShare()) {
        return m_shares.size() + 1;
    }
    return m_shares.size();
}

bool CompactShareSplitter::IsEmpty() const
{
    return m_shares.empty() && (!m_pendingShare.Status().IsOk() || m_pendingShare.IsEmptyShare());
}

} // namespace shares
