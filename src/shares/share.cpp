// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/share.h>
#include <shares/reserved_bytes.h>

#include <crypto/common.h>
#include <util.h>
#include <utilstrencodings.h>

#include <algorithm>

namespace shares {

static ShareStatus ValidateSize(const std::vector<unsigned char>& data, const ShareParams& params)
{
    if (data.size() != params.nShareSize) {
        return ShareStatus::Fail(ShareError::SIZE_MISMATCH,
            strprintf("share data must be %u bytes, got %u", params.nShareSize, data.size()),
            params.nShareSize, data.size());
    }
    return ShareStatus::Ok();
}

ShareResult<Share> Share::Create(std::vector<unsigned char> data, const ShareParams& params)
{
    ShareStatus status = ValidateSize(data, params);
    if (!status) {
        return status;
    }
    return Share(std::move(data), GetShareParamsRef(params));
}

ShareResult<Share> Share::Create(std::vector<unsigned char> data, ShareParamsRef params)
{
    if (!params) {
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT, "share created without parameters");
    }
    ShareStatus status = ValidateSize(data, *params);
    if (!status) {
        return status;
    }
    return Share(std::move(data), std::move(params));
}

ShareStatus Share::Validate() const
{
    return ValidateSize(m_data, *m_params);
}

ShareResult<NamespaceID> Share::GetNamespaceID() const
{
    if (m_data.size() < m_params->nNamespaceSize) {
        return ShareStatus::Fail(ShareError::TOO_SHORT,
            strprintf("share %s is too short to contain a namespace ID", ToString()),
            m_params->nNamespaceSize, m_data.size());
    }
    return NamespaceID(m_data.data(), m_data.data() + m_params->nNamespaceSize);
}

ShareResult<InfoByte> Share::GetInfoByte() const
{
    size_t end = m_params->nNamespaceSize + SHARE_INFO_BYTES;
    if (m_data.size() < end) {
        return ShareStatus::Fail(ShareError::TOO_SHORT,
            strprintf("share %s is too short to contain an info byte", ToString()),
            end, m_data.size());
    }
    // the info byte is the first byte after the namespace ID
    return InfoByte::Parse(m_data[m_params->nNamespaceSize], *m_params);
}

ShareResult<uint8_t> Share::Version() const
{
    ShareResult<InfoByte> infoByte = GetInfoByte();
    if (!infoByte) {
        return infoByte.Status();
    }
    return infoByte->Version();
}

ShareStatus Share::DoesSupportVersions(const std::vector<uint8_t>& supportedVersions) const
{
    ShareResult<uint8_t> version = Version();
    if (!version) {
        return version.Status();
    }
    if (std::find(supportedVersions.begin(), supportedVersions.end(), *version) == supportedVersions.end()) {
        return ShareStatus::Fail(ShareError::UNSUPPORTED_VERSION,
            strprintf("unsupported share version %u is not present in the list of supported share versions %s",
                      *version, HexStr(supportedVersions, true)),
            supportedVersions.empty() ? 0 : *std::max_element(supportedVersions.begin(), supportedVersions.end()),
            *version);
    }
    return ShareStatus::Ok();
}

ShareResult<bool> Share::IsSequenceStart() const
{
    ShareResult<InfoByte> infoByte = GetInfoByte();
    if (!infoByte) {
        return infoByte.Status();
    }
    return infoByte->IsSequenceStart();
}

bool Share::HasNamespace(const NamespaceID& ns) const
{
    if (m_data.size() < m_params->nNamespaceSize) {
        return false;
    }
    return ns.size() == m_params->nNamespaceSize &&
           std::equal(ns.begin(), ns.end(), m_data.begin());
}

bool Share::IsCompactShare() const
{
    return HasNamespace(m_params->txNamespaceID) || HasNamespace(m_params->payForBlobNamespaceID);
}

ShareResult<uint32_t> Share::SequenceLen() const
{
    ShareResult<bool> isSequenceStart = IsSequenceStart();
    if (!isSequenceStart) {
        return isSequenceStart.Status();
    }
    if (!*isSequenceStart) {
        return uint32_t(0);
    }

    size_t start = m_params->nNamespaceSize + SHARE_INFO_BYTES;
    size_t end = start + SEQUENCE_LEN_BYTES;
    if (m_data.size() < end) {
        return ShareStatus::Fail(ShareError::TOO_SHORT,
            strprintf("share %s is too short to contain a sequence length", ToString()),
            end, m_data.size());
    }
    return ReadBE32(&m_data[start]);
}

ShareResult<bool> Share::IsPadding() const
{
    ShareResult<bool> isSequenceStart = IsSequenceStart();
    if (!isSequenceStart) {
        return isSequenceStart.Status();
    }
    ShareResult<uint32_t> sequenceLen = SequenceLen();
    if (!sequenceLen) {
        return sequenceLen.Status();
    }

    bool isNamespacePadding = *isSequenceStart && *sequenceLen == 0;
    bool isTailPadding = HasNamespace(m_params->tailPaddingNamespaceID);
    bool isReservedPadding = HasNamespace(m_params->reservedPaddingNamespaceID);

    return isNamespacePadding || isTailPadding || isReservedPadding;
}

ShareResult<uint32_t> Share::ReservedBytes() const
{
    if (!IsCompactShare()) {
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            strprintf("share %s is not a compact share", ToString()));
    }
    ShareResult<bool> isSequenceStart = IsSequenceStart();
    if (!isSequenceStart) {
        return isSequenceStart.Status();
    }

    size_t start = m_params->nNamespaceSize + SHARE_INFO_BYTES;
    if (*isSequenceStart) {
        start += SEQUENCE_LEN_BYTES;
    }
    size_t end = start + m_params->nCompactShareReservedBytes;
    if (m_data.size() < end) {
        return ShareStatus::Fail(ShareError::TOO_SHORT,
            strprintf("share %s is too short to contain reserved bytes", ToString()),
            end, m_data.size());
    }
    return ParseReservedBytes(std::vector<unsigned char>(m_data.begin() + start, m_data.begin() + end), *m_params);
}

ShareResult<size_t> Share::RawDataStartIndex() const
{
    ShareResult<bool> isStartResult = IsSequenceStart();
    if (!isStartResult) {
        return isStartResult.Status();
    }
    const bool isStart = *isStartResult;
    const bool isCompact = IsCompactShare();

    const size_t header = m_params->nNamespaceSize + SHARE_INFO_BYTES;
    if (isStart && isCompact) {
        return header + SEQUENCE_LEN_BYTES + m_params->nCompactShareReservedBytes;
    } else if (isStart && !isCompact) {
        return header + SEQUENCE_LEN_BYTES;
    } else if (!isStart && isCompact) {
        return header + m_params->nCompactShareReservedBytes;
    } else if (!isStart && !isCompact) {
        return header;
    }
    LogPrint(BCLog::SHARES, "Share: unable to determine the raw data start index for %s\n", ToString());
    return ShareStatus::Fail(ShareError::INTERNAL_ERROR,
        strprintf("unable to determine the raw data start index for share %s", ToString()));
}

ShareResult<std::vector<unsigned char>> Share::RawData() const
{
    ShareResult<size_t> startIndex = RawDataStartIndex();
    if (!startIndex) {
        return startIndex.Status();
    }
    if (m_data.size() < *startIndex) {
        return ShareStatus::Fail(ShareError::TOO_SHORT,
            strprintf("share %s is too short to contain raw data", ToString()),
            *startIndex, m_data.size());
    }
    return std::vector<unsigned char>(m_data.begin() + *startIndex, m_data.end());
}

std::string Share::ToString() const
{
    // namespace and header are enough to identify a share in a log line
    static constexpr size_t MAX_HEX_BYTES = 16;
    size_t n = std::min(m_data.size(), MAX_HEX_BYTES);
    std::string hex = HexStr(m_data.begin(), m_data.begin() + n);
    if (m_data.size() > n) {
        hex += "...";
    }
    return strprintf("Share(len=%u, data=%s)", m_data.size(), hex);
}

std::vector<std::vector<unsigned char>> ToBytes(const std::vector<Share>& shares)
{
    std::vector<std::vector<unsigned char>> bytes;
    bytes.reserve(shares.size());
    for (const Share& share : shares) {
        bytes.push_back(share.ToBytes());
    }
    return bytes;
}

std::vector<Share> FromBytes(std::vector<std::vector<unsigned char>> bytes, const ShareParams& params)
{
    std::vector<Share> shares;
    shares.reserve(bytes.size());
    ShareParamsRef ref = GetShareParamsRef(params);
    for (auto& b : bytes) {
        shares.push_back(Share(std::move(b), ref));
    }
    return shares;
}

} // namespace shares
