// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_miniscript_types_h_
#define included_msc_miniscript_types_h_

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace msc {

/** The fragment kinds. The script each one encodes to is listed in codec.cpp. */
enum class NodeType {
    JUST_0,    //!< OP_0
    JUST_1,    //!< OP_1
    PK_K,      //!< [key]
    PK_H,      //!< OP_DUP OP_HASH160 [keyhash] OP_EQUALVERIFY
    OLDER,     //!< [n] OP_CHECKSEQUENCEVERIFY
    AFTER,     //!< [n] OP_CHECKLOCKTIMEVERIFY
    SHA256,    //!< OP_SIZE 32 OP_EQUALVERIFY OP_SHA256 [hash] OP_EQUAL
    HASH256,   //!< OP_SIZE 32 OP_EQUALVERIFY OP_HASH256 [hash] OP_EQUAL
    RIPEMD160, //!< OP_SIZE 32 OP_EQUALVERIFY OP_RIPEMD160 [hash] OP_EQUAL
    HASH160,   //!< OP_SIZE 32 OP_EQUALVERIFY OP_HASH160 [hash] OP_EQUAL
    WRAP_A,    //!< OP_TOALTSTACK [X] OP_FROMALTSTACK
    WRAP_S,    //!< OP_SWAP [X]
    WRAP_C,    //!< [X] OP_CHECKSIG
    WRAP_D,    //!< OP_DUP OP_IF [X] OP_ENDIF
    WRAP_V,    //!< [X] OP_VERIFY (or -VERIFY version of last opcode in X)
    WRAP_J,    //!< OP_SIZE OP_0NOTEQUAL OP_IF [X] OP_ENDIF
    WRAP_N,    //!< [X] OP_0NOTEQUAL
    AND_V,     //!< [X] [Y]
    AND_B,     //!< [X] [Y] OP_BOOLAND
    ANDOR,     //!< [X] OP_NOTIF [Z] OP_ELSE [Y] OP_ENDIF
    OR_B,      //!< [X] [Y] OP_BOOLOR
    OR_C,      //!< [X] OP_NOTIF [Y] OP_ENDIF
    OR_D,      //!< [X] OP_IFDUP OP_NOTIF [Y] OP_ENDIF
    OR_I,      //!< OP_IF [X] OP_ELSE [Y] OP_ENDIF
    THRESH,    //!< [X1] ([Xn] OP_ADD)* [k] OP_EQUAL
    MULTI,     //!< [k] [key_n]* [n] OP_CHECKMULTISIG
};

/** Fragment name as used in the text form (wrappers without the colon). */
std::string NodeTypeName(NodeType nodetype);

/**
 * A basic type (B, V, K or W) plus a set of type properties.
 *
 * "ABC"_mst is the type with all of A, B and C; x << y means "x has all
 * properties of y". An empty type marks an ill-typed expression.
 *
 * Correctness properties:
 *  - z: zero-arg; consumes exactly 0 stack elements
 *  - o: one-arg; consumes exactly 1 stack element
 *  - n: nonzero; satisfaction never needs a zero top stack element
 *  - d: dissatisfiable; a dissatisfaction exists that needs no signature
 *  - u: unit; leaves exactly 1 on the stack when satisfied
 *
 * Malleability properties:
 *  - e: expressive; unique non-malleable dissatisfaction, no signature needed
 *  - f: forced; no dissatisfaction without a signature
 *  - s: safe; every satisfaction needs a signature
 *  - m: non-malleable satisfaction always exists
 *
 * Other:
 *  - x: expensive verify; the last opcode is not EQUAL, CHECKSIG or CHECKMULTISIG
 *  - g, h: contains a relative time / relative height lock
 *  - i, j: contains an absolute time / absolute height lock
 *  - k: no satisfaction needs conflicting timelock kinds
 */
class Type {
    uint32_t m_flags;

    constexpr explicit Type(uint32_t flags) : m_flags(flags) {}

public:
    static constexpr Type Make(uint32_t flags) { return Type(flags); }

    constexpr Type operator|(Type x) const { return Type(m_flags | x.m_flags); }
    constexpr Type operator&(Type x) const { return Type(m_flags & x.m_flags); }
    constexpr bool operator<<(Type x) const { return (x.m_flags & ~m_flags) == 0; }
    constexpr bool operator<(Type x) const { return m_flags < x.m_flags; }
    constexpr bool operator==(Type x) const { return m_flags == x.m_flags; }
    constexpr bool operator!=(Type x) const { return m_flags != x.m_flags; }
    constexpr Type If(bool x) const { return Type(x ? m_flags : 0); }

    /** Property letters in canonical order, e.g. "Bondu". */
    std::string ToString() const;
};

constexpr uint32_t TypeFlag(char c)
{
    return c == 'B' ? 1 << 0 :
           c == 'V' ? 1 << 1 :
           c == 'K' ? 1 << 2 :
           c == 'W' ? 1 << 3 :
           c == 'z' ? 1 << 4 :
           c == 'o' ? 1 << 5 :
           c == 'n' ? 1 << 6 :
           c == 'd' ? 1 << 7 :
           c == 'u' ? 1 << 8 :
           c == 'e' ? 1 << 9 :
           c == 'f' ? 1 << 10 :
           c == 's' ? 1 << 11 :
           c == 'm' ? 1 << 12 :
           c == 'x' ? 1 << 13 :
           c == 'g' ? 1 << 14 :
           c == 'h' ? 1 << 15 :
           c == 'i' ? 1 << 16 :
           c == 'j' ? 1 << 17 :
           c == 'k' ? 1 << 18 :
           (throw std::logic_error("Unknown character in _mst literal"), 0);
}

constexpr Type operator"" _mst(const char* c, size_t l)
{
    Type typ = Type::Make(0);
    for (const char* p = c; p < c + l; ++p) typ = typ | Type::Make(TypeFlag(*p));
    return typ;
}

/** Parse a property string at runtime; returns false on an unknown letter. */
bool ParseType(const std::string& str, Type& out);

/** An integer that may be invalid ("no such value"); + and | propagate the absence. */
template<typename I>
struct MaxInt {
    bool valid;
    I value;

    MaxInt() : valid(false), value(0) {}
    MaxInt(I val) : valid(true), value(val) {}

    friend MaxInt<I> operator+(const MaxInt<I>& a, const MaxInt<I>& b) {
        if (!a.valid || !b.valid) return {};
        return a.value + b.value;
    }

    friend MaxInt<I> operator|(const MaxInt<I>& a, const MaxInt<I>& b) {
        if (!a.valid) return b;
        if (!b.valid) return a;
        return std::max(a.value, b.value);
    }
};

/** Non-push opcodes executed: static count plus worst-case extras on (dis)satisfaction. */
struct Ops {
    uint32_t count;
    MaxInt<uint32_t> sat;
    MaxInt<uint32_t> dsat;

    Ops(uint32_t in_count, MaxInt<uint32_t> in_sat, MaxInt<uint32_t> in_dsat) : count(in_count), sat(in_sat), dsat(in_dsat) {}
};

/** Maximum witness stack elements on satisfaction and dissatisfaction. */
struct StackSize {
    MaxInt<uint32_t> sat;
    MaxInt<uint32_t> dsat;

    StackSize(MaxInt<uint32_t> in_sat, MaxInt<uint32_t> in_dsat) : sat(in_sat), dsat(in_dsat) {}
};

/**
 * Derive the type of a fragment from its children's types. x, y and z are
 * the first three child types (empty if absent); sub_types lists all of them.
 * Returns an empty type if the composition is ill-typed.
 */
Type ComputeType(NodeType nodetype, Type x, Type y, Type z, const std::vector<Type>& sub_types, uint32_t k, size_t n_subs, size_t n_keys);

/** The first child requirement of nodetype that sub_types violates, or "" if none. */
std::string TypeRequirement(NodeType nodetype, const std::vector<Type>& sub_types);

/** Check the implications between properties of a computed type. Throws std::logic_error on a contradiction. */
Type SanitizeType(Type e);

/** Script length of a fragment given its children's total script length. */
size_t ComputeScriptLen(NodeType nodetype, Type sub0typ, size_t subsize, uint32_t k, size_t n_subs, size_t n_keys);

/** Opcode counts of a fragment given those of its children. */
Ops ComputeOps(NodeType nodetype, Type sub0typ, const std::vector<Ops>& sub_ops, uint32_t k, size_t n_keys);

/** Witness stack sizes of a fragment given those of its children. */
StackSize ComputeStackSize(NodeType nodetype, const std::vector<StackSize>& sub_ss, uint32_t k);

} // namespace msc

#endif // included_msc_miniscript_types_h_
