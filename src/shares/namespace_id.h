// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef SHARES_NAMESPACE_ID_H
#define SHARES_NAMESPACE_ID_H

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace shares {

/**
 * @brief Namespace tag stored at the head of every share
 *
 * The width is a property of the share parameters, so the bytes are held
 * in a vector rather than a fixed-size array.
 */
class NamespaceID
{
private:
    std::vector<unsigned char> m_data;

public:
    NamespaceID() = default;

    explicit NamespaceID(std::vector<unsigned char> data) : m_data(std::move(data)) {}

    NamespaceID(const unsigned char* begin, const unsigned char* end) : m_data(begin, end) {}

    /** Parse a hex string; nullopt if it is not valid hex */
    static std::optional<NamespaceID> FromHex(const std::string& hex);

    bool IsNull() const;

    size_t size() const { return m_data.size(); }
    bool empty() const { return m_data.empty(); }

    const unsigned char* data() const { return m_data.data(); }
    std::vector<unsigned char>::const_iterator begin() const { return m_data.begin(); }
    std::vector<unsigned char>::const_iterator end() const { return m_data.end(); }

    const std::vector<unsigned char>& GetBytes() const { return m_data; }

    std::string GetHex() const;
    std::string ToString() const { return GetHex(); }

    friend inline bool operator==(const NamespaceID& a, const NamespaceID& b) { return a.m_data == b.m_data; }
    friend inline bool operator!=(const NamespaceID& a, const NamespaceID& b) { return a.m_data != b.m_data; }
    friend inline bool operator<(const NamespaceID& a, const NamespaceID& b) { return a.m_data < b.m_data; }
};

} // namespace shares

#endif // SHARES_NAMESPACE_ID_H
