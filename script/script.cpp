// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <script/script.h>

#include <tinyformat.h>

#include <cstring>

namespace msc {

namespace {

struct OpName {
    opcodetype opcode;
    const char* name;
};

// Canonical names; aliases (FALSE, TRUE, NOP2, NOP3) resolve in GetOpCode only.
const OpName OPNAMES[] = {
    {OP_0, "0"}, {OP_PUSHDATA1, "OP_PUSHDATA1"}, {OP_PUSHDATA2, "OP_PUSHDATA2"}, {OP_PUSHDATA4, "OP_PUSHDATA4"},
    {OP_1NEGATE, "-1"}, {OP_RESERVED, "OP_RESERVED"},
    {OP_1, "1"}, {OP_2, "2"}, {OP_3, "3"}, {OP_4, "4"}, {OP_5, "5"}, {OP_6, "6"}, {OP_7, "7"}, {OP_8, "8"},
    {OP_9, "9"}, {OP_10, "10"}, {OP_11, "11"}, {OP_12, "12"}, {OP_13, "13"}, {OP_14, "14"}, {OP_15, "15"}, {OP_16, "16"},

    {OP_NOP, "OP_NOP"}, {OP_VER, "OP_VER"}, {OP_IF, "OP_IF"}, {OP_NOTIF, "OP_NOTIF"}, {OP_VERIF, "OP_VERIF"},
    {OP_VERNOTIF, "OP_VERNOTIF"}, {OP_ELSE, "OP_ELSE"}, {OP_ENDIF, "OP_ENDIF"}, {OP_VERIFY, "OP_VERIFY"},
    {OP_RETURN, "OP_RETURN"},

    {OP_TOALTSTACK, "OP_TOALTSTACK"}, {OP_FROMALTSTACK, "OP_FROMALTSTACK"}, {OP_2DROP, "OP_2DROP"},
    {OP_2DUP, "OP_2DUP"}, {OP_3DUP, "OP_3DUP"}, {OP_2OVER, "OP_2OVER"}, {OP_2ROT, "OP_2ROT"}, {OP_2SWAP, "OP_2SWAP"},
    {OP_IFDUP, "OP_IFDUP"}, {OP_DEPTH, "OP_DEPTH"}, {OP_DROP, "OP_DROP"}, {OP_DUP, "OP_DUP"}, {OP_NIP, "OP_NIP"},
    {OP_OVER, "OP_OVER"}, {OP_PICK, "OP_PICK"}, {OP_ROLL, "OP_ROLL"}, {OP_ROT, "OP_ROT"}, {OP_SWAP, "OP_SWAP"},
    {OP_TUCK, "OP_TUCK"},

    {OP_CAT, "OP_CAT"}, {OP_SUBSTR, "OP_SUBSTR"}, {OP_LEFT, "OP_LEFT"}, {OP_RIGHT, "OP_RIGHT"}, {OP_SIZE, "OP_SIZE"},

    {OP_INVERT, "OP_INVERT"}, {OP_AND, "OP_AND"}, {OP_OR, "OP_OR"}, {OP_XOR, "OP_XOR"}, {OP_EQUAL, "OP_EQUAL"},
    {OP_EQUALVERIFY, "OP_EQUALVERIFY"}, {OP_RESERVED1, "OP_RESERVED1"}, {OP_RESERVED2, "OP_RESERVED2"},

    {OP_1ADD, "OP_1ADD"}, {OP_1SUB, "OP_1SUB"}, {OP_2MUL, "OP_2MUL"}, {OP_2DIV, "OP_2DIV"}, {OP_NEGATE, "OP_NEGATE"},
    {OP_ABS, "OP_ABS"}, {OP_NOT, "OP_NOT"}, {OP_0NOTEQUAL, "OP_0NOTEQUAL"}, {OP_ADD, "OP_ADD"}, {OP_SUB, "OP_SUB"},
    {OP_MUL, "OP_MUL"}, {OP_DIV, "OP_DIV"}, {OP_MOD, "OP_MOD"}, {OP_LSHIFT, "OP_LSHIFT"}, {OP_RSHIFT, "OP_RSHIFT"},
    {OP_BOOLAND, "OP_BOOLAND"}, {OP_BOOLOR, "OP_BOOLOR"}, {OP_NUMEQUAL, "OP_NUMEQUAL"},
    {OP_NUMEQUALVERIFY, "OP_NUMEQUALVERIFY"}, {OP_NUMNOTEQUAL, "OP_NUMNOTEQUAL"}, {OP_LESSTHAN, "OP_LESSTHAN"},
    {OP_GREATERTHAN, "OP_GREATERTHAN"}, {OP_LESSTHANOREQUAL, "OP_LESSTHANOREQUAL"},
    {OP_GREATERTHANOREQUAL, "OP_GREATERTHANOREQUAL"}, {OP_MIN, "OP_MIN"}, {OP_MAX, "OP_MAX"},
    {OP_WITHIN, "OP_WITHIN"},

    {OP_RIPEMD160, "OP_RIPEMD160"}, {OP_SHA1, "OP_SHA1"}, {OP_SHA256, "OP_SHA256"}, {OP_HASH160, "OP_HASH160"},
    {OP_HASH256, "OP_HASH256"}, {OP_CODESEPARATOR, "OP_CODESEPARATOR"}, {OP_CHECKSIG, "OP_CHECKSIG"},
    {OP_CHECKSIGVERIFY, "OP_CHECKSIGVERIFY"}, {OP_CHECKMULTISIG, "OP_CHECKMULTISIG"},
    {OP_CHECKMULTISIGVERIFY, "OP_CHECKMULTISIGVERIFY"},

    {OP_NOP1, "OP_NOP1"}, {OP_CHECKLOCKTIMEVERIFY, "OP_CHECKLOCKTIMEVERIFY"},
    {OP_CHECKSEQUENCEVERIFY, "OP_CHECKSEQUENCEVERIFY"}, {OP_NOP4, "OP_NOP4"}, {OP_NOP5, "OP_NOP5"},
    {OP_NOP6, "OP_NOP6"}, {OP_NOP7, "OP_NOP7"}, {OP_NOP8, "OP_NOP8"}, {OP_NOP9, "OP_NOP9"}, {OP_NOP10, "OP_NOP10"},

    {OP_INVALIDOPCODE, "OP_INVALIDOPCODE"},
};

const OpName OPALIASES[] = {
    {OP_FALSE, "FALSE"}, {OP_TRUE, "TRUE"}, {OP_NOP2, "NOP2"}, {OP_NOP3, "NOP3"},
    {OP_CHECKLOCKTIMEVERIFY, "CLTV"}, {OP_CHECKSEQUENCEVERIFY, "CSV"},
};

} // anonymous namespace

std::string GetOpName(opcodetype opcode)
{
    for (const auto& op : OPNAMES) {
        if (op.opcode == opcode) return op.name;
    }
    return "OP_UNKNOWN";
}

opcodetype GetOpCode(const std::string& name_in)
{
    // trim out "OP_" as people tend to skip those
    std::string name = name_in.compare(0, 3, "OP_") == 0 ? name_in.substr(3) : name_in;
    for (const auto& op : OPNAMES) {
        const char* n = op.name;
        if (!strncmp(n, "OP_", 3)) n += 3;
        if (name == n) return op.opcode;
    }
    for (const auto& op : OPALIASES) {
        if (name == op.name) return op.opcode;
    }
    return OP_INVALIDOPCODE;
}

ScriptNum::ScriptNum(const valtype& vch, bool require_minimal, size_t max_num_size)
{
    if (vch.size() > max_num_size) {
        throw scriptnum_error(strprintf("script number overflow (%u bytes)", vch.size()));
    }
    if (require_minimal && !IsMinimallyEncoded(vch, max_num_size)) {
        throw scriptnum_error("non-minimally encoded script number");
    }
    m_value = set_vch(vch);
}

bool ScriptNum::IsMinimallyEncoded(const valtype& vch, size_t max_num_size)
{
    if (vch.size() > max_num_size) return false;
    if (vch.size() > 0) {
        // Check that the number is encoded with the minimum possible
        // number of bytes.
        //
        // If the most-significant-byte - excluding the sign bit - is zero
        // then we're not minimal. Note how this test also rejects the
        // negative-zero encoding, 0x80.
        if ((vch.back() & 0x7f) == 0) {
            // One exception: if there's more than one byte and the most
            // significant bit of the second-most-significant-byte is set
            // it would conflict with the sign bit.
            if (vch.size() <= 1 || (vch[vch.size() - 2] & 0x80) == 0) {
                return false;
            }
        }
    }
    return true;
}

valtype ScriptNum::serialize(const int64_t& value)
{
    if (value == 0) return valtype();

    valtype result;
    const bool neg = value < 0;
    uint64_t absvalue = neg ? ~static_cast<uint64_t>(value) + 1 : static_cast<uint64_t>(value);

    while (absvalue) {
        result.push_back(absvalue & 0xff);
        absvalue >>= 8;
    }

    //    - If the most significant byte is >= 0x80 and the value is positive, push a
    //    new zero-byte to make the significant byte < 0x80 again.
    //    - If the most significant byte is >= 0x80 and the value is negative, push a
    //    new 0x80 byte that will be popped off when converting to an integral.
    //    - If the most significant byte is < 0x80 and the value is negative, add
    //    0x80 to it, since it will be subtracted and interpreted as a negative when
    //    converting to an integral.
    if (result.back() & 0x80) {
        result.push_back(neg ? 0x80 : 0);
    } else if (neg) {
        result.back() |= 0x80;
    }

    return result;
}

int64_t ScriptNum::set_vch(const valtype& vch)
{
    if (vch.empty()) return 0;

    int64_t result = 0;
    for (size_t i = 0; i != vch.size(); ++i) {
        result |= static_cast<int64_t>(vch[i]) << 8 * i;
    }

    // If the input vector's most significant byte is 0x80, remove it from
    // the result's msb and return a negative.
    if (vch.back() & 0x80) {
        return -((int64_t)(result & ~(0x80ULL << (8 * (vch.size() - 1)))));
    }

    return result;
}

Script& Script::operator<<(int64_t n)
{
    if (n == -1 || (n >= 1 && n <= 16)) {
        push_back(n + (OP_1 - 1));
    } else if (n == 0) {
        push_back(OP_0);
    } else {
        *this << ScriptNum::serialize(n);
    }
    return *this;
}

Script& Script::operator<<(opcodetype opcode)
{
    push_back((unsigned char)opcode);
    return *this;
}

Script& Script::operator<<(const ScriptNum& b)
{
    return *this << b.GetInt64();
}

Script& Script::operator<<(const valtype& b)
{
    if (b.size() < OP_PUSHDATA1) {
        push_back((unsigned char)b.size());
    } else if (b.size() <= 0xff) {
        push_back(OP_PUSHDATA1);
        push_back((unsigned char)b.size());
    } else if (b.size() <= 0xffff) {
        push_back(OP_PUSHDATA2);
        push_back((unsigned char)(b.size() & 0xff));
        push_back((unsigned char)(b.size() >> 8));
    } else {
        push_back(OP_PUSHDATA4);
        uint32_t sz = (uint32_t)b.size();
        for (int i = 0; i < 4; ++i) push_back((unsigned char)((sz >> (8 * i)) & 0xff));
    }
    insert(end(), b.begin(), b.end());
    return *this;
}

bool Script::GetOp(const_iterator& pc, opcodetype& opcode, valtype& vch) const
{
    return GetScriptOp(pc, end(), opcode, &vch);
}

bool Script::GetOp(const_iterator& pc, opcodetype& opcode) const
{
    return GetScriptOp(pc, end(), opcode, nullptr);
}

bool GetScriptOp(Script::const_iterator& pc, Script::const_iterator end, opcodetype& opcode_ret, valtype* pvchRet)
{
    opcode_ret = OP_INVALIDOPCODE;
    if (pvchRet) pvchRet->clear();
    if (pc >= end) return false;

    // Read instruction
    if (end - pc < 1) return false;
    unsigned int opcode = *pc++;

    // Immediate operand
    if (opcode <= OP_PUSHDATA4) {
        unsigned int nSize = 0;
        if (opcode < OP_PUSHDATA1) {
            nSize = opcode;
        } else if (opcode == OP_PUSHDATA1) {
            if (end - pc < 1) return false;
            nSize = *pc++;
        } else if (opcode == OP_PUSHDATA2) {
            if (end - pc < 2) return false;
            nSize = pc[0] | (pc[1] << 8);
            pc += 2;
        } else if (opcode == OP_PUSHDATA4) {
            if (end - pc < 4) return false;
            nSize = pc[0] | (pc[1] << 8) | (pc[2] << 16) | ((uint32_t)pc[3] << 24);
            pc += 4;
        }
        if (end - pc < 0 || (unsigned int)(end - pc) < nSize) return false;
        if (pvchRet) pvchRet->assign(pc, pc + nSize);
        pc += nSize;
    }

    opcode_ret = static_cast<opcodetype>(opcode);
    return true;
}

bool CheckMinimalPush(const valtype& data, opcodetype opcode)
{
    // Excludes OP_1NEGATE, OP_1-16 since they are by definition minimal
    if (opcode > OP_PUSHDATA4) return true;
    if (data.size() == 0) {
        // Should have used OP_0.
        return opcode == OP_0;
    } else if (data.size() == 1 && data[0] >= 1 && data[0] <= 16) {
        // Should have used OP_1 .. OP_16.
        return false;
    } else if (data.size() == 1 && data[0] == 0x81) {
        // Should have used OP_1NEGATE.
        return false;
    } else if (data.size() <= 75) {
        // Must have used a direct push (opcode indicating number of bytes pushed + those bytes).
        return (size_t)opcode == data.size();
    } else if (data.size() <= 255) {
        // Must have used OP_PUSHDATA.
        return opcode == OP_PUSHDATA1;
    } else if (data.size() <= 65535) {
        // Must have used OP_PUSHDATA2.
        return opcode == OP_PUSHDATA2;
    }
    return true;
}

int DecodeOP_N(opcodetype opcode)
{
    if (opcode == OP_0) return 0;
    if (opcode < OP_1 || opcode > OP_16) throw std::runtime_error(strprintf("DecodeOP_N: %s is not a small integer", GetOpName(opcode)));
    return (int)opcode - (int)(OP_1 - 1);
}

opcodetype EncodeOP_N(int n)
{
    if (n < 0 || n > 16) throw std::runtime_error(strprintf("EncodeOP_N: %d out of range", n));
    if (n == 0) return OP_0;
    return (opcodetype)(OP_1 + n - 1);
}

} // namespace msc
