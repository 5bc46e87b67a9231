// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/share_errors.h>

#include <util.h>

namespace shares {

std::string ShareErrorToString(ShareError error) {
    switch (error) {
        case ShareError::OK:
            return "OK";
        case ShareError::SIZE_MISMATCH:
            return "Share size mismatch";
        case ShareError::TOO_SHORT:
            return "Share too short";
        case ShareError::INVALID_INFO_BYTE:
            return "Invalid info byte";
        case ShareError::UNSUPPORTED_VERSION:
            return "Unsupported share version";
        case ShareError::INTERNAL_ERROR:
            return "Internal error";
        case ShareError::INVALID_RESERVED_BYTES:
            return "Invalid reserved bytes";
        case ShareError::INVALID_SEQUENCE:
            return "Invalid share sequence";
        case ShareError::INVALID_UNIT:
            return "Invalid unit";
        case ShareError::INVALID_ARGUMENT:
            return "Invalid argument";
    }
    return "Unknown error";
}

std::string ShareStatus::ToString() const
{
    if (IsOk()) {
        return "OK";
    }
    return strprintf("%s: %s", ShareErrorToString(error), errorMessage);
}

} // namespace shares
