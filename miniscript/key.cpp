// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <miniscript/key.h>

#include <crypto/hash.h>
#include <util/strings.h>

#include <cctype>

namespace msc {

static const std::string SYMBOLIC_KEY_TAG = "msc/symbolic-key/";

bool Key::IsCompressed(const valtype& data)
{
    return data.size() == SIZE && (data[0] == 0x02 || data[0] == 0x03);
}

valtype Key::GetHash160() const
{
    return Hash160(m_data);
}

std::string Key::ToHex() const
{
    return HexStr(m_data);
}

bool KeyContext::FromPKBytes(const valtype& data, Key& key) const
{
    if (!Key::IsCompressed(data)) return false;
    key = Key(data);
    return true;
}

bool HexKeyContext::FromString(const std::string& str, Key& key) const
{
    if (str.size() != 2 * Key::SIZE) return false;
    key = Key(ParseHex(str));
    return key.IsValid();
}

std::string HexKeyContext::ToString(const Key& key) const
{
    return key.ToHex();
}

Key CompilerContext::SymbolicKey(const std::string& name)
{
    valtype preimage(SYMBOLIC_KEY_TAG.begin(), SYMBOLIC_KEY_TAG.end());
    preimage.insert(preimage.end(), name.begin(), name.end());
    valtype k{0x02};
    valtype digest = SHA256(preimage);
    k.insert(k.end(), digest.begin(), digest.end());
    return Key(k);
}

bool CompilerContext::FromString(const std::string& str, Key& key) const
{
    if (str.size() == 0 || str.size() > 2 * Key::SIZE) {
        return false;
    }
    if (str.size() < 17) {
        // symbolic
        auto it = keymap.find(str);
        if (it != keymap.end()) {
            key = it->second;
            return true;
        }
        for (char c : str) {
            if (!isalnum((unsigned char)c) && c != '_') return false;
        }
        key = SymbolicKey(str);
        keymap[str] = key;
        symbols[key] = str;
        pkh_map[key.GetHash160()] = key;
        return true;
    }
    key = Key(ParseHex(str));
    if (!key.IsValid()) return false;
    pkh_map[key.GetHash160()] = key;
    return true;
}

std::string CompilerContext::ToString(const Key& key) const
{
    if (symbolic_outputs) {
        auto it = symbols.find(key);
        if (it != symbols.end()) return it->second;
    }
    return key.ToHex();
}

bool CompilerContext::FromPKBytes(const valtype& data, Key& key) const
{
    if (!KeyContext::FromPKBytes(data, key)) return false;
    pkh_map[key.GetHash160()] = key;
    return true;
}

bool CompilerContext::LookupKeyHash(const valtype& hash, Key& key) const
{
    auto it = pkh_map.find(hash);
    if (it == pkh_map.end()) return false;
    key = it->second;
    return true;
}

} // namespace msc
