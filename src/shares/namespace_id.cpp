// Copyright (c) 2024 The ShareCodec developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <shares/namespace_id.h>

#include <utilstrencodings.h>

#include <algorithm>

namespace shares {

std::optional<NamespaceID> NamespaceID::FromHex(const std::string& hex)
{
    if (!IsHex(hex)) {
        return std::nullopt;
    }
    return NamespaceID(ParseHex(hex));
}

bool NamespaceID::IsNull() const
{
    return std::all_of(m_data.begin(), m_data.end(), [](unsigned char c) { return c == 0; });
}

std::string NamespaceID::GetHex() const
{
    return HexStr(m_data);
}

} // namespace shares
