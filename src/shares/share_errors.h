// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_SHARE_ERRORS_H
#define SHARES_SHARE_ERRORS_H

/**
 * @file share_errors.h
 * @brief Failure reporting for the share codec
 *
 * Shares arrive from untrusted peers, so no decoding path may abort the
 * process. Every operation that can fail returns a ShareStatus or a
 * ShareResult<T> carrying one of the ShareError codes below.
 */

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace shares {

/**
 * @brief Share codec error codes
 */
enum class ShareError {
    OK = 0,

    // Buffer is not exactly ShareSize bytes
    SIZE_MISMATCH,
    // Buffer lacks the bytes for the requested field
    TOO_SHORT,
    // Info byte does not encode a recognized (version, flag) pair
    INVALID_INFO_BYTE,
    // Share version is not in the accepted set
    UNSUPPORTED_VERSION,
    // Offset computation reached a state that should be unreachable
    INTERNAL_ERROR,

    // Reserved bytes of a compact share are malformed
    INVALID_RESERVED_BYTES,
    // Shares do not form a well-formed sequence
    INVALID_SEQUENCE,
    // A length-delimited unit inside a compact sequence is malformed
    INVALID_UNIT,
    // Caller passed an argument the operation cannot accept
    INVALID_ARGUMENT
};

/**
 * @brief Convert ShareError to string
 */
std::string ShareErrorToString(ShareError error);

/**
 * @brief Stream output operator for ShareError (needed for Boost.Test)
 */
inline std::ostream& operator<<(std::ostream& os, ShareError error) {
    return os << ShareErrorToString(error);
}

/**
 * @brief Outcome of a share operation with error details
 */
struct ShareStatus {
    /** Error code, OK on success */
    ShareError error = ShareError::OK;

    /** Detailed error message */
    std::string errorMessage;

    /**
     * Expected length (or bound) involved in the failure. For
     * UNSUPPORTED_VERSION, the highest supported version.
     */
    size_t expected = 0;

    /**
     * Actual length, the offending byte value for INVALID_INFO_BYTE, or the
     * rejected version for UNSUPPORTED_VERSION
     */
    size_t actual = 0;

    ShareStatus() = default;

    static ShareStatus Ok() {
        return ShareStatus();
    }

    static ShareStatus Fail(ShareError err, const std::string& msg = "",
                            size_t expectedValue = 0, size_t actualValue = 0) {
        ShareStatus status;
        status.error = err;
        status.errorMessage = msg.empty() ? ShareErrorToString(err) : msg;
        status.expected = expectedValue;
        status.actual = actualValue;
        return status;
    }

    bool IsOk() const { return error == ShareError::OK; }

    explicit operator bool() const { return IsOk(); }

    std::string ToString() const;
};

/**
 * @brief Either a value or the ShareStatus explaining why there is none
 *
 * Accessing the value of a failed result is a caller bug and throws
 * std::logic_error; it never depends on share content.
 */
template <typename T>
class ShareResult {
public:
    ShareResult(T value) : m_value(std::move(value)) {}
    ShareResult(ShareStatus status) : m_status(std::move(status))
    {
        if (m_status.IsOk()) {
            throw std::logic_error("ShareResult constructed from an OK status without a value");
        }
    }

    bool IsOk() const { return m_value.has_value(); }
    explicit operator bool() const { return IsOk(); }

    const ShareStatus& Status() const { return m_status; }
    ShareError Error() const { return m_status.error; }

    const T& Value() const
    {
        if (!m_value) {
            throw std::logic_error("value read from failed ShareResult: " + m_status.errorMessage);
        }
        return *m_value;
    }

    T&& Take()
    {
        if (!m_value) {
            throw std::logic_error("value read from failed ShareResult: " + m_status.errorMessage);
        }
        return std::move(*m_value);
    }

    const T& operator*() const { return Value(); }
    const T* operator->() const { return &Value(); }

private:
    std::optional<T> m_value;
    ShareStatus m_status;
};

} // namespace shares

#endif // SHARES_SHARE_ERRORS_H
