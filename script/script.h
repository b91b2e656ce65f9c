// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_script_script_h_
#define included_msc_script_script_h_

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace msc {

typedef std::vector<unsigned char> valtype;

// Maximum number of bytes pushable to the stack
static const unsigned int MAX_SCRIPT_ELEMENT_SIZE = 520;

// Maximum number of non-push operations per script
static const int MAX_OPS_PER_SCRIPT = 201;

// Maximum number of public keys per multisig
static const int MAX_PUBKEYS_PER_MULTISIG = 20;

// Maximum script length in bytes
static const int MAX_SCRIPT_SIZE = 10000;

// Maximum number of values on script interpreter stack
static const int MAX_STACK_SIZE = 1000;

// Standardness limits for P2WSH witness scripts
static const unsigned int MAX_STANDARD_P2WSH_SCRIPT_SIZE = 3600;
static const unsigned int MAX_STANDARD_P2WSH_STACK_ITEMS = 100;

// Threshold for nLockTime: below this value it is interpreted as block number,
// otherwise as UNIX timestamp.
static const unsigned int LOCKTIME_THRESHOLD = 500000000;

// nSequence interpretation (BIP68)
static const uint32_t SEQUENCE_LOCKTIME_DISABLE_FLAG = (1U << 31);
static const uint32_t SEQUENCE_LOCKTIME_TYPE_FLAG = (1U << 22);
static const uint32_t SEQUENCE_LOCKTIME_MASK = 0x0000ffff;

/** Script opcodes */
enum opcodetype
{
    // push value
    OP_0 = 0x00,
    OP_FALSE = OP_0,
    OP_PUSHDATA1 = 0x4c,
    OP_PUSHDATA2 = 0x4d,
    OP_PUSHDATA4 = 0x4e,
    OP_1NEGATE = 0x4f,
    OP_RESERVED = 0x50,
    OP_1 = 0x51,
    OP_TRUE=OP_1,
    OP_2 = 0x52,
    OP_3 = 0x53,
    OP_4 = 0x54,
    OP_5 = 0x55,
    OP_6 = 0x56,
    OP_7 = 0x57,
    OP_8 = 0x58,
    OP_9 = 0x59,
    OP_10 = 0x5a,
    OP_11 = 0x5b,
    OP_12 = 0x5c,
    OP_13 = 0x5d,
    OP_14 = 0x5e,
    OP_15 = 0x5f,
    OP_16 = 0x60,

    // control
    OP_NOP = 0x61,
    OP_VER = 0x62,
    OP_IF = 0x63,
    OP_NOTIF = 0x64,
    OP_VERIF = 0x65,
    OP_VERNOTIF = 0x66,
    OP_ELSE = 0x67,
    OP_ENDIF = 0x68,
    OP_VERIFY = 0x69,
    OP_RETURN = 0x6a,

    // stack ops
    OP_TOALTSTACK = 0x6b,
    OP_FROMALTSTACK = 0x6c,
    OP_2DROP = 0x6d,
    OP_2DUP = 0x6e,
    OP_3DUP = 0x6f,
    OP_2OVER = 0x70,
    OP_2ROT = 0x71,
    OP_2SWAP = 0x72,
    OP_IFDUP = 0x73,
    OP_DEPTH = 0x74,
    OP_DROP = 0x75,
    OP_DUP = 0x76,
    OP_NIP = 0x77,
    OP_OVER = 0x78,
    OP_PICK = 0x79,
    OP_ROLL = 0x7a,
    OP_ROT = 0x7b,
    OP_SWAP = 0x7c,
    OP_TUCK = 0x7d,

    // splice ops
    OP_CAT = 0x7e,
    OP_SUBSTR = 0x7f,
    OP_LEFT = 0x80,
    OP_RIGHT = 0x81,
    OP_SIZE = 0x82,

    // bit logic
    OP_INVERT = 0x83,
    OP_AND = 0x84,
    OP_OR = 0x85,
    OP_XOR = 0x86,
    OP_EQUAL = 0x87,
    OP_EQUALVERIFY = 0x88,
    OP_RESERVED1 = 0x89,
    OP_RESERVED2 = 0x8a,

    // numeric
    OP_1ADD = 0x8b,
    OP_1SUB = 0x8c,
    OP_2MUL = 0x8d,
    OP_2DIV = 0x8e,
    OP_NEGATE = 0x8f,
    OP_ABS = 0x90,
    OP_NOT = 0x91,
    OP_0NOTEQUAL = 0x92,

    OP_ADD = 0x93,
    OP_SUB = 0x94,
    OP_MUL = 0x95,
    OP_DIV = 0x96,
    OP_MOD = 0x97,
    OP_LSHIFT = 0x98,
    OP_RSHIFT = 0x99,

    OP_BOOLAND = 0x9a,
    OP_BOOLOR = 0x9b,
    OP_NUMEQUAL = 0x9c,
    OP_NUMEQUALVERIFY = 0x9d,
    OP_NUMNOTEQUAL = 0x9e,
    OP_LESSTHAN = 0x9f,
    OP_GREATERTHAN = 0xa0,
    OP_LESSTHANOREQUAL = 0xa1,
    OP_GREATERTHANOREQUAL = 0xa2,
    OP_MIN = 0xa3,
    OP_MAX = 0xa4,

    OP_WITHIN = 0xa5,

    // crypto
    OP_RIPEMD160 = 0xa6,
    OP_SHA1 = 0xa7,
    OP_SHA256 = 0xa8,
    OP_HASH160 = 0xa9,
    OP_HASH256 = 0xaa,
    OP_CODESEPARATOR = 0xab,
    OP_CHECKSIG = 0xac,
    OP_CHECKSIGVERIFY = 0xad,
    OP_CHECKMULTISIG = 0xae,
    OP_CHECKMULTISIGVERIFY = 0xaf,

    // expansion
    OP_NOP1 = 0xb0,
    OP_CHECKLOCKTIMEVERIFY = 0xb1,
    OP_NOP2 = OP_CHECKLOCKTIMEVERIFY,
    OP_CHECKSEQUENCEVERIFY = 0xb2,
    OP_NOP3 = OP_CHECKSEQUENCEVERIFY,
    OP_NOP4 = 0xb3,
    OP_NOP5 = 0xb4,
    OP_NOP6 = 0xb5,
    OP_NOP7 = 0xb6,
    OP_NOP8 = 0xb7,
    OP_NOP9 = 0xb8,
    OP_NOP10 = 0xb9,

    OP_INVALIDOPCODE = 0xff,
};

// Maximum value that an opcode can be
static const unsigned int MAX_OPCODE = OP_NOP10;

std::string GetOpName(opcodetype opcode);

/** Look up an opcode by name, with or without the OP_ prefix. Returns OP_INVALIDOPCODE if unknown. */
opcodetype GetOpCode(const std::string& name);

class scriptnum_error : public std::runtime_error
{
public:
    explicit scriptnum_error(const std::string& str) : std::runtime_error(str) {}
};

/**
 * Numeric opcodes operate on 4-byte little-endian sign-magnitude integers
 * (results may overflow into 5 bytes). Minimality is enforced when requested.
 */
class ScriptNum
{
public:
    static const size_t DEFAULT_MAX_NUM_SIZE = 4;

    explicit ScriptNum(const int64_t& n) : m_value(n) {}

    ScriptNum(const valtype& vch, bool require_minimal, size_t max_num_size = DEFAULT_MAX_NUM_SIZE);

    /** Whether vch is the minimal encoding of the number it represents. */
    static bool IsMinimallyEncoded(const valtype& vch, size_t max_num_size = DEFAULT_MAX_NUM_SIZE);

    bool operator==(const int64_t& rhs) const { return m_value == rhs; }
    bool operator!=(const int64_t& rhs) const { return m_value != rhs; }
    bool operator<(const int64_t& rhs) const { return m_value < rhs; }
    bool operator==(const ScriptNum& rhs) const { return m_value == rhs.m_value; }

    ScriptNum operator+(const ScriptNum& rhs) const { return ScriptNum(m_value + rhs.m_value); }

    int getint() const
    {
        if (m_value > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
        if (m_value < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
        return m_value;
    }

    int64_t GetInt64() const { return m_value; }

    valtype getvch() const { return serialize(m_value); }

    static valtype serialize(const int64_t& value);

private:
    static int64_t set_vch(const valtype& vch);

    int64_t m_value;
};

/** Serialized script: a sequence of opcodes and data pushes. */
class Script : public std::vector<unsigned char>
{
public:
    Script() {}
    Script(const_iterator pbegin, const_iterator pend) : std::vector<unsigned char>(pbegin, pend) {}
    explicit Script(const valtype& raw) : std::vector<unsigned char>(raw) {}

    /** Push a number using the smallest encoding (OP_0, OP_1..OP_16, OP_1NEGATE or a minimal ScriptNum push). */
    Script& operator<<(int64_t n);
    Script& operator<<(opcodetype opcode);
    Script& operator<<(const ScriptNum& b);
    /** Push data with the minimal push opcode for its length. */
    Script& operator<<(const valtype& b);

    Script& operator+=(const Script& b)
    {
        insert(end(), b.begin(), b.end());
        return *this;
    }

    bool GetOp(const_iterator& pc, opcodetype& opcode, valtype& vch) const;
    bool GetOp(const_iterator& pc, opcodetype& opcode) const;
};

/** Read one opcode (and its push data, if any). Returns false on a truncated push. */
bool GetScriptOp(Script::const_iterator& pc, Script::const_iterator end, opcodetype& opcode_ret, valtype* pvchRet);

/** Whether data was pushed using the smallest possible push opcode. */
bool CheckMinimalPush(const valtype& data, opcodetype opcode);

/** Decode OP_0/OP_1..OP_16 as small integers. */
int DecodeOP_N(opcodetype opcode);
opcodetype EncodeOP_N(int n);

} // namespace msc

#endif // included_msc_script_script_h_
