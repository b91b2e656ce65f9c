// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_miniscript_key_h_
#define included_msc_miniscript_key_h_

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace msc {

typedef std::vector<unsigned char> valtype;

/**
 * An opaque compressed public key (33 bytes, 0x02 or 0x03 prefix). No curve
 * arithmetic is done on it; signatures for it come from the satisfier.
 */
class Key {
    valtype m_data;

public:
    static const size_t SIZE = 33;

    Key() {}
    explicit Key(const valtype& data) : m_data(data) {}

    /** Whether data looks like a compressed public key. */
    static bool IsCompressed(const valtype& data);

    bool IsValid() const { return IsCompressed(m_data); }
    const valtype& data() const { return m_data; }

    /** RIPEMD160(SHA256(key)), as committed to by pk_h. */
    valtype GetHash160() const;

    std::string ToHex() const;

    bool operator==(const Key& other) const { return m_data == other.m_data; }
    bool operator!=(const Key& other) const { return m_data != other.m_data; }
    bool operator<(const Key& other) const { return m_data < other.m_data; }
};

/**
 * Maps keys to and from their text form. FromPKBytes is called for every key
 * found in a decoded script; LookupKeyHash resolves the key behind a pk_h.
 */
class KeyContext {
public:
    virtual ~KeyContext() {}

    virtual bool FromString(const std::string& str, Key& key) const = 0;
    virtual std::string ToString(const Key& key) const = 0;

    virtual bool FromPKBytes(const valtype& data, Key& key) const;
    virtual bool LookupKeyHash(const valtype& hash, Key& key) const { return false; }
};

/** Hex keys only. */
class HexKeyContext : public KeyContext {
public:
    bool FromString(const std::string& str, Key& key) const override;
    std::string ToString(const Key& key) const override;
};

/**
 * Accepts 66-hex-digit keys and symbolic names shorter than 17 characters.
 * A name maps to 0x02 || SHA256(tag || name) and is remembered, so output can
 * be printed with the names (symbolic_outputs) and pk_h hashes can be
 * resolved back to keys. Owned by the caller; not thread safe.
 */
class CompilerContext : public KeyContext {
public:
    mutable std::map<std::string, Key> keymap;
    mutable std::map<Key, std::string> symbols;
    mutable std::map<valtype, Key> pkh_map;
    bool symbolic_outputs{false};

    bool FromString(const std::string& str, Key& key) const override;
    std::string ToString(const Key& key) const override;
    bool FromPKBytes(const valtype& data, Key& key) const override;
    bool LookupKeyHash(const valtype& hash, Key& key) const override;

    /** The key a name stands for, without registering it. */
    static Key SymbolicKey(const std::string& name);
};

} // namespace msc

#endif // included_msc_miniscript_key_h_
