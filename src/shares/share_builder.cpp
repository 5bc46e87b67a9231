// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/share_builder.h>
#include <shares/info_byte.h>
#include <shares/reserved_bytes.h>

#include <crypto/common.h>
#include <util.h>

#include <algorithm>

namespace shares {

ShareBuilder::ShareBuilder(const NamespaceID& namespaceId, uint8_t shareVersion, bool isFirstShare,
                           const ShareParams& params)
    : ShareBuilder(namespaceId, shareVersion, isFirstShare, GetShareParamsRef(params))
{
}

ShareBuilder::ShareBuilder(const NamespaceID& namespaceId, uint8_t shareVersion, bool isFirstShare,
                           ShareParamsRef params)
    : m_namespaceId(namespaceId)
    , m_shareVersion(shareVersion)
    , m_isFirstShare(isFirstShare)
    , m_isCompactShare(params && (namespaceId == params->txNamespaceID || namespaceId == params->payForBlobNamespaceID))
    , m_params(params ? params : GetShareParamsRef(GetShareParams()))
{
    if (!params) {
        m_status = ShareStatus::Fail(ShareError::INVALID_ARGUMENT, "share builder created without parameters");
        return;
    }

    m_rawShareData.reserve(m_params->nShareSize);

    if (m_namespaceId.size() != m_params->nNamespaceSize) {
        m_status = ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            strprintf("namespace %s must be %u bytes", m_namespaceId.GetHex(), m_params->nNamespaceSize),
            m_params->nNamespaceSize, m_namespaceId.size());
        return;
    }

    ShareResult<InfoByte> infoByte = InfoByte::Create(m_shareVersion, m_isFirstShare, *m_params);
    if (!infoByte) {
        m_status = infoByte.Status();
        return;
    }

    m_rawShareData.insert(m_rawShareData.end(), m_namespaceId.begin(), m_namespaceId.end());
    m_rawShareData.push_back(infoByte->GetRaw());

    if (m_isFirstShare) {
        // placeholder until the sequence length is known
        m_rawShareData.insert(m_rawShareData.end(), SEQUENCE_LEN_BYTES, 0);
    }
    if (m_isCompactShare) {
        m_rawShareData.insert(m_rawShareData.end(), m_params->nCompactShareReservedBytes, 0);
    }
}

std::vector<unsigned char> ShareBuilder::AddData(const std::vector<unsigned char>& data)
{
    size_t pendingLeft = AvailableBytes();
    if (data.size() <= pendingLeft) {
        m_rawShareData.insert(m_rawShareData.end(), data.begin(), data.end());
        return {};
    }

    m_rawShareData.insert(m_rawShareData.end(), data.begin(), data.begin() + pendingLeft);
    return std::vector<unsigned char>(data.begin() + pendingLeft, data.end());
}

size_t ShareBuilder::AvailableBytes() const
{
    if (m_rawShareData.size() >= m_params->nShareSize) {
        return 0;
    }
    return m_params->nShareSize - m_rawShareData.size();
}

bool ShareBuilder::IsEmptyShare() const
{
    size_t expectedLen = m_params->nNamespaceSize + SHARE_INFO_BYTES;
    if (m_isCompactShare) {
        expectedLen += m_params->nCompactShareReservedBytes;
    }
    if (m_isFirstShare) {
        expectedLen += SEQUENCE_LEN_BYTES;
    }
    return m_rawShareData.size() == expectedLen;
}

size_t ShareBuilder::ZeroPadIfNecessary()
{
    size_t missing = AvailableBytes();
    m_rawShareData.insert(m_rawShareData.end(), missing, 0);
    return missing;
}

ShareStatus ShareBuilder::WriteSequenceLen(uint32_t sequenceLen)
{
    if (!m_status) {
        return m_status;
    }
    if (!m_isFirstShare) {
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            "not the first share, cannot write the sequence length");
    }
    WriteBE32(&m_rawShareData[m_params->nNamespaceSize + SHARE_INFO_BYTES], sequenceLen);
    return ShareStatus::Ok();
}

size_t ShareBuilder::IndexOfReservedBytes() const
{
    if (m_isFirstShare) {
        return m_params->nNamespaceSize + SHARE_INFO_BYTES + SEQUENCE_LEN_BYTES;
    }
    return m_params->nNamespaceSize + SHARE_INFO_BYTES;
}

bool ShareBuilder::IsEmptyReservedBytes() const
{
    size_t index = IndexOfReservedBytes();
    return std::all_of(m_rawShareData.begin() + index,
                       m_rawShareData.begin() + index + m_params->nCompactShareReservedBytes,
                       [](unsigned char c) { return c == 0; });
}

ShareStatus ShareBuilder::WriteReservedBytes(uint32_t byteIndex)
{
    if (!m_status) {
        return m_status;
    }
    if (!m_isCompactShare) {
        return ShareStatus::Fail(ShareError::INVALID_ARGUMENT,
            strprintf("namespace %s does not use compact shares", m_namespaceId.GetHex()));
    }
    ShareResult<std::vector<unsigned char>> reservedBytes = EncodeReservedBytes(byteIndex, *m_params);
    if (!reservedBytes) {
        return reservedBytes.Status();
    }
    std::copy(reservedBytes->begin(), reservedBytes->end(), m_rawShareData.begin() + IndexOfReservedBytes());
    return ShareStatus::Ok();
}

ShareStatus ShareBuilder::MaybeWriteReservedBytes()
{
    if (!m_status) {
        return m_status;
    }
    if (!m_isCompactShare || !IsEmptyReservedBytes()) {
        return ShareStatus::Ok();
    }
    return WriteReservedBytes(static_cast<uint32_t>(m_rawShareData.size()));
}

ShareResult<Share> ShareBuilder::Build() const
{
    if (!m_status) {
        return m_status;
    }
    return Share::Create(m_rawShareData, m_params);
}

} // namespace shares
