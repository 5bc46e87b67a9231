// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/share_params.h>

#include <util.h>

#include <algorithm>

namespace shares {

static NamespaceID Namespace(std::vector<unsigned char> bytes)
{
    return NamespaceID(std::move(bytes));
}

// Mainnet share parameters
static const ShareParams mainShareParams = {
    .strNetworkID = "main",

    // === Layout ===
    .nShareSize = 512,
    .nNamespaceSize = 8,
    .nCompactShareReservedBytes = 4,

    // === Versions ===
    .nMaxShareVersion = 127,
    .vSupportedShareVersions = {SHARE_VERSION_ZERO},

    // === Reserved namespaces ===
    .txNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 1}),
    .intermediateStateRootsNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 2}),
    .evidenceNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 3}),
    .payForBlobNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 4}),
    .reservedPaddingNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 255}),
    .maxReservedNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 255}),
    .tailPaddingNamespaceID = Namespace({255, 255, 255, 255, 255, 255, 255, 254}),
    .paritySharesNamespaceID = Namespace({255, 255, 255, 255, 255, 255, 255, 255})
};

// Testnet share parameters (same layout as mainnet)
static const ShareParams testShareParams = {
    .strNetworkID = "test",

    // === Layout ===
    .nShareSize = 512,
    .nNamespaceSize = 8,
    .nCompactShareReservedBytes = 4,

    // === Versions ===
    .nMaxShareVersion = 127,
    .vSupportedShareVersions = {SHARE_VERSION_ZERO},

    // === Reserved namespaces ===
    .txNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 1}),
    .intermediateStateRootsNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 2}),
    .evidenceNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 3}),
    .payForBlobNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 4}),
    .reservedPaddingNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 255}),
    .maxReservedNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 255}),
    .tailPaddingNamespaceID = Namespace({255, 255, 255, 255, 255, 255, 255, 254}),
    .paritySharesNamespaceID = Namespace({255, 255, 255, 255, 255, 255, 255, 255})
};

// Regtest share parameters (small shares so payloads span several of them)
static const ShareParams regtestShareParams = {
    .strNetworkID = "regtest",

    // === Layout ===
    .nShareSize = 64,                               // 64-byte shares
    .nNamespaceSize = 8,
    .nCompactShareReservedBytes = 4,

    // === Versions ===
    .nMaxShareVersion = 127,
    .vSupportedShareVersions = {SHARE_VERSION_ZERO},

    // === Reserved namespaces ===
    .txNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 1}),
    .intermediateStateRootsNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 2}),
    .evidenceNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 3}),
    .payForBlobNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 4}),
    .reservedPaddingNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 255}),
    .maxReservedNamespaceID = Namespace({0, 0, 0, 0, 0, 0, 0, 255}),
    .tailPaddingNamespaceID = Namespace({255, 255, 255, 255, 255, 255, 255, 254}),
    .paritySharesNamespaceID = Namespace({255, 255, 255, 255, 255, 255, 255, 255})
};

// Currently selected share params
static const ShareParams* pCurrentShareParams = &mainShareParams;

bool ShareParams::IsSupportedVersion(uint8_t version) const
{
    return std::find(vSupportedShareVersions.begin(), vSupportedShareVersions.end(), version) !=
           vSupportedShareVersions.end();
}

bool ShareParams::IsValid() const
{
    if (nNamespaceSize == 0) {
        return false;
    }

    // The first compact share must have room for at least one byte of data
    if (nShareSize <= nNamespaceSize + SHARE_INFO_BYTES + SEQUENCE_LEN_BYTES + nCompactShareReservedBytes) {
        return false;
    }

    // Reserved bytes hold a big-endian uint32 index into the share
    if (nCompactShareReservedBytes != 4) {
        return false;
    }

    const NamespaceID* sentinels[] = {
        &txNamespaceID, &intermediateStateRootsNamespaceID, &evidenceNamespaceID,
        &payForBlobNamespaceID, &reservedPaddingNamespaceID, &maxReservedNamespaceID,
        &tailPaddingNamespaceID, &paritySharesNamespaceID,
    };
    for (const NamespaceID* ns : sentinels) {
        if (ns->size() != nNamespaceSize) {
            return false;
        }
    }

    for (uint8_t version : vSupportedShareVersions) {
        if (version > nMaxShareVersion) {
            return false;
        }
    }

    return true;
}

ShareParamsRef GetShareParamsRef(const ShareParams& params)
{
    if (&params == &mainShareParams || &params == &testShareParams || &params == &regtestShareParams) {
        // static tables, no owner needed
        return ShareParamsRef(ShareParamsRef(), &params);
    }
    return std::make_shared<const ShareParams>(params);
}

const ShareParams& MainShareParams()
{
    return mainShareParams;
}

const ShareParams& TestShareParams()
{
    return testShareParams;
}

const ShareParams& RegtestShareParams()
{
    return regtestShareParams;
}

const ShareParams& GetShareParams()
{
    return *pCurrentShareParams;
}

bool SelectShareParams(const std::string& network)
{
    if (network == "main") {
        pCurrentShareParams = &mainShareParams;
    } else if (network == "test") {
        pCurrentShareParams = &testShareParams;
    } else if (network == "regtest") {
        pCurrentShareParams = &regtestShareParams;
    } else {
        LogPrintf("SelectShareParams: Unknown network %s, keeping %s\n",
                  network, pCurrentShareParams->strNetworkID);
        return false;
    }
    LogPrint(BCLog::SHARES, "SelectShareParams: Selected %s (share size %u)\n",
             network, pCurrentShareParams->nShareSize);
    return true;
}

} // namespace shares
