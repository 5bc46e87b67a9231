// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/parse.h>
#include <shares/share_sequence.h>

#include <crypto/common.h>
#include <util.h>

namespace shares {

static ShareStatus CheckVersions(const std::vector<Share>& shares, const ShareParams& params)
{
    for (size_t i = 0; i < shares.size(); ++i) {
        ShareStatus status = shares[i].DoesSupportVersions(params.vSupportedShareVersions);
        if (!status) {
            LogPrint(BCLog::PARSE, "share %u rejected: %s\n", i, status.ToString());
            return status;
        }
    }
    return ShareStatus::Ok();
}

ShareResult<std::vector<std::vector<unsigned char>>> ParseDelimitedUnits(const std::vector<unsigned char>& rawData)
{
    std::vector<std::vector<unsigned char>> units;
    size_t offset = 0;
    while (offset < rawData.size()) {
        uint64_t unitLen = 0;
        size_t consumed = ReadUVarInt(&rawData[offset], rawData.size() - offset, unitLen);
        if (consumed == 0) {
            return ShareStatus::Fail(ShareError::INVALID_UNIT,
                strprintf("malformed unit length prefix at offset %u", offset),
                0, offset);
        }
        // the rest of the raw data is padding
        if (unitLen == 0) {
            break;
        }
        offset += consumed;
        if (unitLen > rawData.size() - offset) {
            return ShareStatus::Fail(ShareError::INVALID_UNIT,
                strprintf("unit of %u bytes at offset %u runs past the end of %u bytes of raw data",
                          unitLen, offset, rawData.size()),
                unitLen, rawData.size() - offset);
        }
        units.emplace_back(rawData.begin() + offset, rawData.begin() + offset + unitLen);
        offset += unitLen;
    }
    return units;
}

ShareResult<std::vector<std::vector<unsigned char>>> ParseTxs(const std::vector<Share>& shares,
                                                              const ShareParams& params)
{
    ShareStatus status = CheckVersions(shares, params);
    if (!status) {
        return status;
    }

    for (size_t i = 0; i < shares.size(); ++i) {
        if (!shares[i].IsCompactShare()) {
            return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
                strprintf("share %u (%s) is not a compact share", i, shares[i].ToString()));
        }
        ShareResult<uint32_t> reserved = shares[i].ReservedBytes();
        if (!reserved) {
            LogPrint(BCLog::PARSE, "ParseTxs: share %u rejected: %s\n", i, reserved.Status().ToString());
            return reserved.Status();
        }
    }

    ShareResult<std::vector<ShareSequence>> sequences = ParseShares(shares, true);
    if (!sequences) {
        return sequences.Status();
    }

    std::vector<std::vector<unsigned char>> txs;
    for (const ShareSequence& sequence : *sequences) {
        ShareResult<std::vector<unsigned char>> rawData = sequence.RawData();
        if (!rawData) {
            return rawData.Status();
        }
        ShareResult<std::vector<std::vector<unsigned char>>> units = ParseDelimitedUnits(*rawData);
        if (!units) {
            LogPrint(BCLog::PARSE, "ParseTxs: %s rejected: %s\n", sequence.ToString(), units.Status().ToString());
            return units.Status();
        }
        txs.insert(txs.end(), units->begin(), units->end());
    }
    return txs;
}

ShareResult<std::vector<Blob>> ParseBlobs(const std::vector<Share>& shares, const ShareParams& params)
{
    ShareStatus status = CheckVersions(shares, params);
    if (!status) {
        return status;
    }

    for (size_t i = 0; i < shares.size(); ++i) {
        if (shares[i].IsCompactShare()) {
            return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
                strprintf("share %u (%s) is a compact share", i, shares[i].ToString()));
        }
    }

    ShareResult<std::vector<ShareSequence>> sequences = ParseShares(shares, true);
    if (!sequences) {
        return sequences.Status();
    }

    std::vector<Blob> blobs;
    blobs.reserve(sequences->size());
    for (const ShareSequence& sequence : *sequences) {
        ShareResult<std::vector<unsigned char>> rawData = sequence.RawData();
        if (!rawData) {
            return rawData.Status();
        }
        ShareResult<uint8_t> version = sequence.shares.front().Version();
        if (!version) {
            return version.Status();
        }
        blobs.emplace_back(sequence.namespaceId, rawData.Take(), *version);
    }
    return blobs;
}

} // namespace shares
