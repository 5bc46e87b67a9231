// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/share.h>
#include <shares/share_params.h>
#include <crypto/common.h>
#include <test/test_sharecodec.h>

#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

#include <optional>
#include <vector>

using namespace shares;

namespace bdata = boost::unit_test::data;

namespace {

/**
 * Lay out a share by hand: namespace, info byte, optional sequence length,
 * optional reserved bytes, then fill bytes up to the share size.
 */
std::vector<unsigned char> MakeShareBytes(const ShareParams& params, const NamespaceID& ns,
                                          unsigned char infoByte, std::optional<uint32_t> sequenceLen,
                                          std::optional<uint32_t> reservedBytes, unsigned char fill = 0xAB)
{
    std::vector<unsigned char> data(ns.begin(), ns.end());
    data.push_back(infoByte);
    if (sequenceLen) {
        unsigned char buf[4];
        WriteBE32(buf, *sequenceLen);
        data.insert(data.end(), buf, buf + 4);
    }
    if (reservedBytes) {
        unsigned char buf[4];
        WriteBE32(buf, *reservedBytes);
        data.insert(data.end(), buf, buf + 4);
    }
    data.resize(params.nShareSize, fill);
    return data;
}

Share MakeShare(const std::vector<unsigned char>& data, const ShareParams& params = GetShareParams())
{
    ShareResult<Share> share = Share::Create(data, params);
    BOOST_REQUIRE_MESSAGE(share.IsOk(), share.Status().ToString());
    return *share;
}

ShareParams VersionZeroOnlyParams()
{
    ShareParams params = MainShareParams();
    params.strNetworkID = "versionzero";
    params.nMaxShareVersion = 0;
    return params;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(share_tests, BasicTestingSetup)

// ============================================================================
// Construction and validation
// ============================================================================

BOOST_DATA_TEST_CASE(create_rejects_wrong_size,
                     bdata::make(std::vector<size_t>{0, 1, 7, 8, 9, 13, 256, 511, 513, 1024}),
                     size)
{
    ShareResult<Share> share = Share::Create(std::vector<unsigned char>(size, 0));
    BOOST_REQUIRE(!share.IsOk());
    BOOST_CHECK_EQUAL(share.Error(), ShareError::SIZE_MISMATCH);
    BOOST_CHECK_EQUAL(share.Status().expected, 512U);
    BOOST_CHECK_EQUAL(share.Status().actual, size);
}

BOOST_DATA_TEST_CASE(create_accepts_any_content_of_share_size,
                     bdata::xrange(50),
                     iteration)
{
    (void)iteration;
    std::vector<unsigned char> data = InsecureRandBytes(GetShareParams().nShareSize);
    ShareResult<Share> share = Share::Create(data);
    BOOST_REQUIRE(share.IsOk());
    BOOST_CHECK(share->Validate().IsOk());
    BOOST_CHECK(share->ToBytes() == data);
    BOOST_CHECK_EQUAL(share->Len(), 512U);
}

BOOST_AUTO_TEST_CASE(validate_reports_size_of_unchecked_share)
{
    std::vector<Share> shares = FromBytes({std::vector<unsigned char>(100, 1)});
    BOOST_REQUIRE_EQUAL(shares.size(), 1U);

    ShareStatus status = shares[0].Validate();
    BOOST_CHECK(!status);
    BOOST_CHECK_EQUAL(status.error, ShareError::SIZE_MISMATCH);
    BOOST_CHECK_EQUAL(status.expected, 512U);
    BOOST_CHECK_EQUAL(status.actual, 100U);
}

// ============================================================================
// Field accessors
// ============================================================================

BOOST_AUTO_TEST_CASE(namespace_and_info_byte)
{
    const ShareParams& params = GetShareParams();
    NamespaceID ns = RandomBlobNamespace(params);
    Share share = MakeShare(MakeShareBytes(params, ns, 0x01, 42, std::nullopt));

    ShareResult<NamespaceID> gotNs = share.GetNamespaceID();
    BOOST_REQUIRE(gotNs.IsOk());
    BOOST_CHECK(*gotNs == ns);

    ShareResult<InfoByte> infoByte = share.GetInfoByte();
    BOOST_REQUIRE(infoByte.IsOk());
    BOOST_CHECK_EQUAL(infoByte->Version(), 0);
    BOOST_CHECK(infoByte->IsSequenceStart());

    BOOST_CHECK_EQUAL(*share.Version(), 0);
    BOOST_CHECK(*share.IsSequenceStart());
    BOOST_CHECK(!share.IsCompactShare());
}

BOOST_AUTO_TEST_CASE(sparse_sequence_start_layout)
{
    const ShareParams& params = GetShareParams();
    Share share = MakeShare(MakeShareBytes(params, RandomBlobNamespace(params), 0x01, 0x01020304, std::nullopt));

    ShareResult<uint32_t> sequenceLen = share.SequenceLen();
    BOOST_REQUIRE(sequenceLen.IsOk());
    BOOST_CHECK_EQUAL(*sequenceLen, 0x01020304U);

    ShareResult<std::vector<unsigned char>> rawData = share.RawData();
    BOOST_REQUIRE(rawData.IsOk());
    BOOST_CHECK_EQUAL(rawData->size(), params.nShareSize - params.nNamespaceSize - 1 - 4);
    BOOST_CHECK_EQUAL(rawData->size(), params.FirstSparseShareContentSize());
    BOOST_CHECK_EQUAL(*share.RawDataStartIndex(), 13U);
    BOOST_CHECK_EQUAL(rawData->front(), 0xAB);
}

BOOST_AUTO_TEST_CASE(sparse_continuation_layout)
{
    const ShareParams& params = GetShareParams();
    Share share = MakeShare(MakeShareBytes(params, RandomBlobNamespace(params), 0x00, std::nullopt, std::nullopt));

    ShareResult<uint32_t> sequenceLen = share.SequenceLen();
    BOOST_REQUIRE(sequenceLen.IsOk());
    BOOST_CHECK_EQUAL(*sequenceLen, 0U);

    ShareResult<std::vector<unsigned char>> rawData = share.RawData();
    BOOST_REQUIRE(rawData.IsOk());
    BOOST_CHECK_EQUAL(rawData->size(), params.nShareSize - params.nNamespaceSize - 1);
    BOOST_CHECK_EQUAL(rawData->size(), params.ContinuationSparseShareContentSize());
}

BOOST_AUTO_TEST_CASE(compact_layouts)
{
    const ShareParams& params = GetShareParams();

    Share first = MakeShare(MakeShareBytes(params, params.txNamespaceID, 0x01, 700, 17));
    BOOST_CHECK(first.IsCompactShare());
    BOOST_CHECK_EQUAL(*first.SequenceLen(), 700U);
    BOOST_CHECK_EQUAL(*first.ReservedBytes(), 17U);
    BOOST_CHECK_EQUAL(first.RawData()->size(), params.FirstCompactShareContentSize());
    BOOST_CHECK_EQUAL(first.RawData()->size(), 512U - 8 - 1 - 4 - 4);

    Share continuation = MakeShare(MakeShareBytes(params, params.payForBlobNamespaceID, 0x00, std::nullopt, 0));
    BOOST_CHECK(continuation.IsCompactShare());
    BOOST_CHECK_EQUAL(*continuation.SequenceLen(), 0U);
    BOOST_CHECK_EQUAL(*continuation.ReservedBytes(), 0U);
    BOOST_CHECK_EQUAL(continuation.RawData()->size(), params.ContinuationCompactShareContentSize());
    BOOST_CHECK_EQUAL(continuation.RawData()->size(), 512U - 8 - 1 - 4);
}

BOOST_AUTO_TEST_CASE(reserved_bytes_of_sparse_and_out_of_range)
{
    const ShareParams& params = GetShareParams();

    Share sparse = MakeShare(MakeShareBytes(params, RandomBlobNamespace(params), 0x01, 1, std::nullopt));
    BOOST_CHECK_EQUAL(sparse.ReservedBytes().Error(), ShareError::INVALID_ARGUMENT);

    Share compact = MakeShare(MakeShareBytes(params, params.txNamespaceID, 0x00, std::nullopt, 512));
    ShareResult<uint32_t> reserved = compact.ReservedBytes();
    BOOST_CHECK_EQUAL(reserved.Error(), ShareError::INVALID_RESERVED_BYTES);
    BOOST_CHECK_EQUAL(reserved.Status().actual, 512U);
}

// ============================================================================
// Padding
// ============================================================================

BOOST_AUTO_TEST_CASE(empty_sequence_start_is_padding_in_any_namespace)
{
    const ShareParams& params = GetShareParams();
    std::vector<NamespaceID> namespaces = {
        RandomBlobNamespace(params), params.txNamespaceID, params.payForBlobNamespaceID,
        params.evidenceNamespaceID,
    };
    for (const NamespaceID& ns : namespaces) {
        Share share = MakeShare(MakeShareBytes(params, ns, 0x01, 0, std::nullopt));
        ShareResult<bool> isPadding = share.IsPadding();
        BOOST_REQUIRE(isPadding.IsOk());
        BOOST_CHECK_MESSAGE(*isPadding, "namespace " << ns.GetHex());
    }
}

BOOST_AUTO_TEST_CASE(padding_namespaces_take_precedence)
{
    const ShareParams& params = GetShareParams();

    Share tail = MakeShare(MakeShareBytes(params, params.tailPaddingNamespaceID, 0x01, 1234, std::nullopt));
    BOOST_CHECK(*tail.IsSequenceStart());
    BOOST_CHECK_EQUAL(*tail.SequenceLen(), 1234U);
    BOOST_CHECK(*tail.IsPadding());

    Share reserved = MakeShare(MakeShareBytes(params, params.reservedPaddingNamespaceID, 0x00, std::nullopt, std::nullopt));
    BOOST_CHECK(*reserved.IsPadding());
}

BOOST_AUTO_TEST_CASE(payload_shares_are_not_padding)
{
    const ShareParams& params = GetShareParams();
    NamespaceID ns = RandomBlobNamespace(params);

    Share start = MakeShare(MakeShareBytes(params, ns, 0x01, 1, std::nullopt));
    BOOST_CHECK(!*start.IsPadding());

    Share continuation = MakeShare(MakeShareBytes(params, ns, 0x00, std::nullopt, std::nullopt));
    BOOST_CHECK(!*continuation.IsPadding());
}

// ============================================================================
// Versions
// ============================================================================

BOOST_AUTO_TEST_CASE(does_support_versions)
{
    const ShareParams& params = GetShareParams();
    NamespaceID ns = RandomBlobNamespace(params);

    Share versionZero = MakeShare(MakeShareBytes(params, ns, 0x01, 10, std::nullopt));
    BOOST_CHECK(versionZero.DoesSupportVersions({0}).IsOk());

    // (1 << 1) | 1
    Share versionOne = MakeShare(MakeShareBytes(params, ns, 0x03, 10, std::nullopt));
    BOOST_CHECK_EQUAL(*versionOne.Version(), 1);
    ShareStatus status = versionOne.DoesSupportVersions({0});
    BOOST_CHECK_EQUAL(status.error, ShareError::UNSUPPORTED_VERSION);
    BOOST_CHECK_EQUAL(status.actual, 1U);
    BOOST_CHECK_EQUAL(status.expected, 0U);
    BOOST_CHECK(versionOne.DoesSupportVersions({0, 1}).IsOk());

    // expected is the highest supported version
    status = versionOne.DoesSupportVersions({5, 0, 2});
    BOOST_CHECK_EQUAL(status.error, ShareError::UNSUPPORTED_VERSION);
    BOOST_CHECK_EQUAL(status.expected, 5U);
    BOOST_CHECK_EQUAL(status.actual, 1U);

    status = versionOne.DoesSupportVersions({});
    BOOST_CHECK_EQUAL(status.error, ShareError::UNSUPPORTED_VERSION);
    BOOST_CHECK_EQUAL(status.expected, 0U);
}

BOOST_AUTO_TEST_CASE(invalid_info_byte_propagates)
{
    const ShareParams params = VersionZeroOnlyParams();
    NamespaceID ns = RandomBlobNamespace(params);

    Share share = MakeShare(MakeShareBytes(params, ns, 0x03, 10, std::nullopt), params);

    ShareResult<InfoByte> infoByte = share.GetInfoByte();
    BOOST_CHECK_EQUAL(infoByte.Error(), ShareError::INVALID_INFO_BYTE);
    BOOST_CHECK_EQUAL(infoByte.Status().actual, 0x03U);

    BOOST_CHECK_EQUAL(share.Version().Error(), ShareError::INVALID_INFO_BYTE);
    BOOST_CHECK_EQUAL(share.IsSequenceStart().Error(), ShareError::INVALID_INFO_BYTE);
    BOOST_CHECK_EQUAL(share.SequenceLen().Error(), ShareError::INVALID_INFO_BYTE);
    BOOST_CHECK_EQUAL(share.IsPadding().Error(), ShareError::INVALID_INFO_BYTE);
    BOOST_CHECK_EQUAL(share.DoesSupportVersions({0, 1}).error, ShareError::INVALID_INFO_BYTE);

    // the raw data offset must not fall back to the continuation layout
    BOOST_CHECK_EQUAL(share.RawDataStartIndex().Error(), ShareError::INVALID_INFO_BYTE);
    BOOST_CHECK_EQUAL(share.RawData().Error(), ShareError::INVALID_INFO_BYTE);
}

// ============================================================================
// Short buffers (unchecked path)
// ============================================================================

BOOST_AUTO_TEST_CASE(short_buffers_fail_without_aborting)
{
    const ShareParams& params = GetShareParams();

    std::vector<Share> tooShortForNamespace = FromBytes({std::vector<unsigned char>(3, 0)});
    const Share& a = tooShortForNamespace[0];
    BOOST_CHECK_EQUAL(a.GetNamespaceID().Error(), ShareError::TOO_SHORT);
    BOOST_CHECK_EQUAL(a.GetNamespaceID().Status().expected, params.nNamespaceSize);
    BOOST_CHECK_EQUAL(a.GetInfoByte().Error(), ShareError::TOO_SHORT);
    BOOST_CHECK(!a.IsCompactShare());
    BOOST_CHECK_EQUAL(a.IsPadding().Error(), ShareError::TOO_SHORT);
    BOOST_CHECK_EQUAL(a.RawData().Error(), ShareError::TOO_SHORT);

    // namespace present, info byte missing
    std::vector<unsigned char> nsOnly(params.txNamespaceID.begin(), params.txNamespaceID.end());
    std::vector<Share> noInfoByte = FromBytes({nsOnly});
    BOOST_CHECK(noInfoByte[0].GetNamespaceID().IsOk());
    BOOST_CHECK(noInfoByte[0].IsCompactShare());
    BOOST_CHECK_EQUAL(noInfoByte[0].GetInfoByte().Error(), ShareError::TOO_SHORT);

    // sequence start flag set, sequence length truncated
    std::vector<unsigned char> truncated = nsOnly;
    truncated.push_back(0x01);
    truncated.push_back(0x00);
    std::vector<Share> noSequenceLen = FromBytes({truncated});
    BOOST_CHECK_EQUAL(noSequenceLen[0].SequenceLen().Error(), ShareError::TOO_SHORT);
    BOOST_CHECK_EQUAL(noSequenceLen[0].RawData().Error(), ShareError::TOO_SHORT);
}

// ============================================================================
// Batch conversion
// ============================================================================

BOOST_AUTO_TEST_CASE(to_bytes_from_bytes_preserves_order)
{
    std::vector<Share> shares;
    for (int i = 0; i < 5; ++i) {
        shares.push_back(MakeShare(InsecureRandBytes(GetShareParams().nShareSize)));
    }

    std::vector<std::vector<unsigned char>> bytes = ToBytes(shares);
    BOOST_REQUIRE_EQUAL(bytes.size(), shares.size());
    for (size_t i = 0; i < shares.size(); ++i) {
        BOOST_CHECK(bytes[i] == shares[i].ToBytes());
    }

    std::vector<Share> restored = FromBytes(bytes);
    BOOST_REQUIRE_EQUAL(restored.size(), shares.size());
    for (size_t i = 0; i < shares.size(); ++i) {
        BOOST_CHECK(restored[i] == shares[i]);
    }

    BOOST_CHECK(ToBytes({}).empty());
    BOOST_CHECK(FromBytes({}).empty());
}

BOOST_AUTO_TEST_CASE(to_string_is_bounded)
{
    Share share = MakeShare(std::vector<unsigned char>(GetShareParams().nShareSize, 0xff));
    std::string str = share.ToString();
    BOOST_CHECK(str.find("len=512") != std::string::npos);
    BOOST_CHECK(str.size() < 100);
}

// ============================================================================
// Parameter lifetime
// ============================================================================

BOOST_AUTO_TEST_CASE(share_outlives_caller_params)
{
    const NamespaceID scopedTx(std::vector<unsigned char>{0, 0, 0, 0, 0, 0, 0, 9});
    std::optional<Share> created;
    std::vector<Share> wrapped;
    {
        ShareParams params = MainShareParams();
        params.strNetworkID = "scoped";
        params.txNamespaceID = scopedTx;
        std::vector<unsigned char> data = MakeShareBytes(params, scopedTx, 0x01, 20, 17);

        created = Share::Create(data, params).Take();
        wrapped = FromBytes({data, data}, params);
    }

    // the table above is gone; the shares still read their own copy
    BOOST_CHECK(created->IsCompactShare());
    BOOST_CHECK_EQUAL(created->Params().strNetworkID, "scoped");
    BOOST_CHECK_EQUAL(*created->SequenceLen(), 20U);
    BOOST_CHECK_EQUAL(*created->ReservedBytes(), 17U);
    BOOST_CHECK_EQUAL(created->RawData()->size(), 495U);
    BOOST_CHECK(!*created->IsPadding());

    BOOST_REQUIRE_EQUAL(wrapped.size(), 2U);
    for (const Share& share : wrapped) {
        BOOST_CHECK(share.Validate().IsOk());
        BOOST_CHECK(share.IsCompactShare());
        BOOST_CHECK(*share.GetNamespaceID() == scopedTx);
    }

    // copies keep the table alive as well
    Share copy = wrapped.back();
    wrapped.clear();
    BOOST_CHECK(copy.IsCompactShare());
}

BOOST_AUTO_TEST_CASE(create_with_params_handle)
{
    std::vector<unsigned char> data(GetShareParams().nShareSize, 0);
    BOOST_CHECK_EQUAL(Share::Create(data, ShareParamsRef()).Error(), ShareError::INVALID_ARGUMENT);

    ShareParamsRef regtest = GetShareParamsRef(RegtestShareParams());
    BOOST_CHECK_EQUAL(Share::Create(data, regtest).Error(), ShareError::SIZE_MISMATCH);
    ShareResult<Share> share = Share::Create(std::vector<unsigned char>(64, 0), regtest);
    BOOST_REQUIRE(share.IsOk());
    BOOST_CHECK_EQUAL(&share->Params(), &RegtestShareParams());
}

BOOST_AUTO_TEST_SUITE_END()
