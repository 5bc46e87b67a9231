// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/share_sequence.h>
#include <shares/split_compact.h>
#include <shares/split_sparse.h>

#include <util.h>

namespace shares {

ShareResult<std::vector<unsigned char>> ShareSequence::RawData() const
{
    std::vector<unsigned char> data;
    for (const Share& share : shares) {
        ShareResult<std::vector<unsigned char>> raw = share.RawData();
        if (!raw) {
            return raw.Status();
        }
        data.insert(data.end(), raw->begin(), raw->end());
    }

    ShareResult<uint32_t> sequenceLen = SequenceLen();
    if (!sequenceLen) {
        return sequenceLen.Status();
    }
    if (data.size() < *sequenceLen) {
        return ShareStatus::Fail(ShareError::TOO_SHORT,
            strprintf("sequence length %u exceeds the %u bytes of raw data in %s",
                      *sequenceLen, data.size(), ToString()),
            *sequenceLen, data.size());
    }
    data.resize(*sequenceLen);
    return data;
}

ShareResult<uint32_t> ShareSequence::SequenceLen() const
{
    if (shares.empty()) {
        return ShareStatus::Fail(ShareError::INVALID_SEQUENCE,
            strprintf("share sequence in namespace %s has no shares", namespaceId.GetHex()));
    }
    return shares.front().SequenceLen();
}

ShareResult<bool> ShareSequence::IsPadding() const
{
    if (shares.empty()) {
        return false;
    }
    if (shares.size() > 1) {
        // padding is always a single share
        return false;
    }
    return shares.front().IsPadding();
}

ShareStatus ShareSequence::ValidSequenceLen() const
{
    if (shares.empty()) {
        return ShareStatus::Fail(ShareError::INVALID_SEQUENCE,
            strprintf("invalid sequence length because share sequence %s has no shares", ToString()));
    }

    ShareResult<bool> isPadding = IsPadding();
    if (!isPadding) {
        return isPadding.Status();
    }
    if (*isPadding) {
        return ShareStatus::Ok();
    }

    const Share& firstShare = shares.front();
    ShareResult<uint32_t> sequenceLen = firstShare.SequenceLen();
    if (!sequenceLen) {
        return sequenceLen.Status();
    }

    size_t sharesNeeded = firstShare.IsCompactShare()
        ? CompactSharesNeeded(*sequenceLen, firstShare.Params())
        : SparseSharesNeeded(*sequenceLen, firstShare.Params());
    if (shares.size() != sharesNeeded) {
        return ShareStatus::Fail(ShareError::INVALID_SEQUENCE,
            strprintf("share sequence has %u shares but needed %u shares", shares.size(), sharesNeeded),
            sharesNeeded, shares.size());
    }
    return ShareStatus::Ok();
}

std::string ShareSequence::ToString() const
{
    return strprintf("ShareSequence(namespace=%s, shares=%u)", namespaceId.GetHex(), shares.size());
}

ShareResult<std::vector<ShareSequence>> ParseShares(const std::vector<Share>& shares, bool ignorePadding)
{
    std::vector<ShareSequence> sequences;
    bool haveCurrent = false;
    ShareSequence current;

    for (size_t i = 0; i < shares.size(); ++i) {
        const Share& share = shares[i];

        ShareStatus valid = share.Validate();
        if (!valid) {
            LogPrint(BCLog::PARSE, "ParseShares: share %u rejected: %s\n", i, valid.ToString());
            return valid;
        }
        ShareResult<bool> isStart = share.IsSequenceStart();
        if (!isStart) {
            LogPrint(BCLog::PARSE, "ParseShares: share %u rejected: %s\n", i, isStart.Status().ToString());
            return isStart.Status();
        }
        ShareResult<NamespaceID> ns = share.GetNamespaceID();
        if (!ns) {
            return ns.Status();
        }

        if (*isStart) {
            if (haveCurrent) {
                sequences.push_back(std::move(current));
            }
            current = ShareSequence();
            current.namespaceId = *ns;
            current.shares.push_back(share);
            haveCurrent = true;
            continue;
        }

        if (!haveCurrent) {
            LogPrint(BCLog::PARSE, "ParseShares: continuation share %u without a sequence start\n", i);
            return ShareStatus::Fail(ShareError::INVALID_SEQUENCE,
                strprintf("share %u is a continuation share without a preceding sequence start share", i));
        }
        if (*ns != current.namespaceId) {
            LogPrint(BCLog::PARSE, "ParseShares: share %u changes namespace inside a sequence\n", i);
            return ShareStatus::Fail(ShareError::INVALID_SEQUENCE,
                strprintf("share %u has namespace %s but its sequence started in namespace %s",
                          i, ns->GetHex(), current.namespaceId.GetHex()));
        }
        current.shares.push_back(share);
    }
    if (haveCurrent) {
        sequences.push_back(std::move(current));
    }

    std::vector<ShareSequence> result;
    result.reserve(sequences.size());
    for (ShareSequence& sequence : sequences) {
        ShareStatus status = sequence.ValidSequenceLen();
        if (!status) {
            LogPrint(BCLog::PARSE, "ParseShares: %s rejected: %s\n", sequence.ToString(), status.ToString());
            return status;
        }
        if (ignorePadding) {
            ShareResult<bool> isPadding = sequence.IsPadding();
            if (!isPadding) {
                return isPadding.Status();
            }
            if (*isPadding) {
                continue;
            }
        }
        result.push_back(std::move(sequence));
    }
    return result;
}

} // namespace shares
