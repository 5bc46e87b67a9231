// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_SHARE_PARAMS_H
#define SHARES_SHARE_PARAMS_H

/**
 * @file share_params.h
 * @brief Network-specific share layout parameters
 *
 * Share size, namespace width, reserved-byte width and the reserved
 * namespace sentinels are fixed per network. One table is selected at
 * startup, before any share is built, and is never modified afterwards.
 */

#include <shares/namespace_id.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace shares {

/** Width of the info byte */
static constexpr size_t SHARE_INFO_BYTES = 1;

/** Width of the big-endian sequence length in a sequence-start share */
static constexpr size_t SEQUENCE_LEN_BYTES = 4;

/** The first share format version */
static constexpr uint8_t SHARE_VERSION_ZERO = 0;

/**
 * Share layout parameters
 * These parameters are network-specific (mainnet/testnet/regtest)
 */
struct ShareParams {
    /** Network name this table belongs to */
    std::string strNetworkID;

    // === Layout ===

    /** Size of every share in bytes */
    size_t nShareSize;

    /** Size of the namespace ID at the head of a share */
    size_t nNamespaceSize;

    /** Size of the reserved bytes in compact shares */
    size_t nCompactShareReservedBytes;

    // === Versions ===

    /** Largest version an info byte may carry */
    uint8_t nMaxShareVersion;

    /** Versions this node decodes */
    std::vector<uint8_t> vSupportedShareVersions;

    // === Reserved namespaces ===

    /** Transactions (compact shares) */
    NamespaceID txNamespaceID;

    /** Intermediate state roots */
    NamespaceID intermediateStateRootsNamespaceID;

    /** Evidence */
    NamespaceID evidenceNamespaceID;

    /** PayForBlob transactions (compact shares) */
    NamespaceID payForBlobNamespaceID;

    /** Padding between reserved namespaces and blobs */
    NamespaceID reservedPaddingNamespaceID;

    /** Largest reserved namespace */
    NamespaceID maxReservedNamespaceID;

    /** Padding after the last blob in a square */
    NamespaceID tailPaddingNamespaceID;

    /** Erasure-coded parity shares */
    NamespaceID paritySharesNamespaceID;

    /** Raw data capacity of the first share of a sparse sequence */
    size_t FirstSparseShareContentSize() const {
        return nShareSize - nNamespaceSize - SHARE_INFO_BYTES - SEQUENCE_LEN_BYTES;
    }

    /** Raw data capacity of a continuation share of a sparse sequence */
    size_t ContinuationSparseShareContentSize() const {
        return nShareSize - nNamespaceSize - SHARE_INFO_BYTES;
    }

    /** Raw data capacity of the first share of a compact sequence */
    size_t FirstCompactShareContentSize() const {
        return nShareSize - nNamespaceSize - SHARE_INFO_BYTES - SEQUENCE_LEN_BYTES - nCompactShareReservedBytes;
    }

    /** Raw data capacity of a continuation share of a compact sequence */
    size_t ContinuationCompactShareContentSize() const {
        return nShareSize - nNamespaceSize - SHARE_INFO_BYTES - nCompactShareReservedBytes;
    }

    /** Whether version is listed in vSupportedShareVersions */
    bool IsSupportedVersion(uint8_t version) const;

    /** Check the table is self-consistent */
    bool IsValid() const;
};

/**
 * Shared handle to a parameter table. Shares, builders and splitters hold
 * one so that a table passed by the caller outlives everything built with it.
 */
typedef std::shared_ptr<const ShareParams> ShareParamsRef;

/**
 * Handle for params. The built-in tables are referenced directly; any other
 * table is copied, so the caller's object may go away afterwards.
 */
ShareParamsRef GetShareParamsRef(const ShareParams& params);

/**
 * Get share parameters for mainnet
 */
const ShareParams& MainShareParams();

/**
 * Get share parameters for testnet
 */
const ShareParams& TestShareParams();

/**
 * Get share parameters for regtest
 * Note: Regtest uses 64-byte shares so that short payloads span several shares
 */
const ShareParams& RegtestShareParams();

/**
 * Get share parameters for the current network
 */
const ShareParams& GetShareParams();

/**
 * Select share parameters by network name ("main", "test", "regtest")
 * @return false if the name is unknown; the selection is left unchanged
 */
bool SelectShareParams(const std::string& network);

} // namespace shares

#endif // SHARES_SHARE_PARAMS_H
