// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_RESERVED_BYTES_H
#define SHARES_RESERVED_BYTES_H

#include <shares/share_errors.h>
#include <shares/share_params.h>

#include <cstdint>
#include <vector>

namespace shares {

/**
 * Encode the reserved bytes of a compact share: the big-endian byte index,
 * counted from the start of the share, of the first unit that begins in
 * it. Zero means no unit begins in the share.
 */
ShareResult<std::vector<unsigned char>> EncodeReservedBytes(uint32_t byteIndex,
                                                            const ShareParams& params = GetShareParams());

/** Decode reserved bytes; the index must lie inside the share */
ShareResult<uint32_t> ParseReservedBytes(const std::vector<unsigned char>& reservedBytes,
                                         const ShareParams& params = GetShareParams());

} // namespace shares

#endif // SHARES_RESERVED_BYTES_H
