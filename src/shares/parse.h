// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_PARSE_H
#define SHARES_PARSE_H

/**
 * @file parse.h
 * @brief Decode shares received from peers back into their payloads
 */

#include <shares/share.h>
#include <shares/share_errors.h>
#include <shares/share_params.h>
#include <shares/split_sparse.h>

#include <vector>

namespace shares {

/**
 * @brief Decode compact shares into the transactions they carry
 *
 * Every share must use a version from params.vSupportedShareVersions.
 * Padding sequences are skipped. A unit whose length prefix is malformed
 * or runs past the end of its sequence fails with INVALID_UNIT; a zero
 * length prefix ends the sequence.
 */
ShareResult<std::vector<std::vector<unsigned char>>> ParseTxs(const std::vector<Share>& shares,
                                                              const ShareParams& params = GetShareParams());

/**
 * @brief Decode sparse shares into blobs, one per sequence
 *
 * Padding sequences are skipped.
 */
ShareResult<std::vector<Blob>> ParseBlobs(const std::vector<Share>& shares,
                                          const ShareParams& params = GetShareParams());

/**
 * Split the raw data of a compact sequence into its length-delimited units
 */
ShareResult<std::vector<std::vector<unsigned char>>> ParseDelimitedUnits(const std::vector<unsigned char>& rawData);

} // namespace shares

#endif // SHARES_PARSE_H
