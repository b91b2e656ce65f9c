// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <miniscript/codec.h>

#include <logging.h>
#include <util/strings.h>

#include <tinyformat.h>

#include <algorithm>

namespace msc {

namespace {

Script ToScriptHelper(const Node& node, bool verify)
{
    Script ret;
    switch (node.nodetype) {
        case NodeType::JUST_0: return ret << OP_0;
        case NodeType::JUST_1: return ret << OP_1;
        case NodeType::PK_K: return ret << node.keys[0].data();
        case NodeType::PK_H: return ret << OP_DUP << OP_HASH160 << node.data << OP_EQUALVERIFY;
        case NodeType::OLDER: return ret << (int64_t)node.k << OP_CHECKSEQUENCEVERIFY;
        case NodeType::AFTER: return ret << (int64_t)node.k << OP_CHECKLOCKTIMEVERIFY;
        case NodeType::SHA256: return ret << OP_SIZE << 32 << OP_EQUALVERIFY << OP_SHA256 << node.data << (verify ? OP_EQUALVERIFY : OP_EQUAL);
        case NodeType::HASH256: return ret << OP_SIZE << 32 << OP_EQUALVERIFY << OP_HASH256 << node.data << (verify ? OP_EQUALVERIFY : OP_EQUAL);
        case NodeType::RIPEMD160: return ret << OP_SIZE << 32 << OP_EQUALVERIFY << OP_RIPEMD160 << node.data << (verify ? OP_EQUALVERIFY : OP_EQUAL);
        case NodeType::HASH160: return ret << OP_SIZE << 32 << OP_EQUALVERIFY << OP_HASH160 << node.data << (verify ? OP_EQUALVERIFY : OP_EQUAL);
        case NodeType::WRAP_A:
            ret << OP_TOALTSTACK;
            ret += ToScriptHelper(*node.subs[0], false);
            return ret << OP_FROMALTSTACK;
        case NodeType::WRAP_S:
            ret << OP_SWAP;
            ret += ToScriptHelper(*node.subs[0], verify);
            return ret;
        case NodeType::WRAP_C:
            ret += ToScriptHelper(*node.subs[0], false);
            return ret << (verify ? OP_CHECKSIGVERIFY : OP_CHECKSIG);
        case NodeType::WRAP_D:
            ret << OP_DUP << OP_IF;
            ret += ToScriptHelper(*node.subs[0], false);
            return ret << OP_ENDIF;
        case NodeType::WRAP_V:
            ret += ToScriptHelper(*node.subs[0], true);
            if (node.subs[0]->GetType() << "x"_mst) ret << OP_VERIFY;
            return ret;
        case NodeType::WRAP_J:
            ret << OP_SIZE << OP_0NOTEQUAL << OP_IF;
            ret += ToScriptHelper(*node.subs[0], false);
            return ret << OP_ENDIF;
        case NodeType::WRAP_N:
            ret += ToScriptHelper(*node.subs[0], false);
            return ret << OP_0NOTEQUAL;
        case NodeType::AND_V:
            ret += ToScriptHelper(*node.subs[0], false);
            ret += ToScriptHelper(*node.subs[1], verify);
            return ret;
        case NodeType::AND_B:
            ret += ToScriptHelper(*node.subs[0], false);
            ret += ToScriptHelper(*node.subs[1], false);
            return ret << OP_BOOLAND;
        case NodeType::OR_B:
            ret += ToScriptHelper(*node.subs[0], false);
            ret += ToScriptHelper(*node.subs[1], false);
            return ret << OP_BOOLOR;
        case NodeType::OR_C:
            ret += ToScriptHelper(*node.subs[0], false);
            ret << OP_NOTIF;
            ret += ToScriptHelper(*node.subs[1], false);
            return ret << OP_ENDIF;
        case NodeType::OR_D:
            ret += ToScriptHelper(*node.subs[0], false);
            ret << OP_IFDUP << OP_NOTIF;
            ret += ToScriptHelper(*node.subs[1], false);
            return ret << OP_ENDIF;
        case NodeType::OR_I:
            ret << OP_IF;
            ret += ToScriptHelper(*node.subs[0], false);
            ret << OP_ELSE;
            ret += ToScriptHelper(*node.subs[1], false);
            return ret << OP_ENDIF;
        case NodeType::ANDOR:
            ret += ToScriptHelper(*node.subs[0], false);
            ret << OP_NOTIF;
            ret += ToScriptHelper(*node.subs[2], false);
            ret << OP_ELSE;
            ret += ToScriptHelper(*node.subs[1], false);
            return ret << OP_ENDIF;
        case NodeType::MULTI:
            ret << (int64_t)node.k;
            for (const auto& key : node.keys) ret << key.data();
            return ret << (int64_t)node.keys.size() << (verify ? OP_CHECKMULTISIGVERIFY : OP_CHECKMULTISIG);
        case NodeType::THRESH:
            ret += ToScriptHelper(*node.subs[0], false);
            for (size_t i = 1; i < node.subs.size(); ++i) {
                ret += ToScriptHelper(*node.subs[i], false);
                ret << OP_ADD;
            }
            return ret << (int64_t)node.k << (verify ? OP_EQUALVERIFY : OP_EQUAL);
    }
    throw std::logic_error("ToScript: unhandled node type");
}

enum class TokenKind {
    OPCODE,
    NUMBER,
    DATA,
};

struct Token {
    TokenKind kind;
    opcodetype opcode;
    int64_t num;
    valtype data;
    size_t offset;
};

/** Split a script into opcodes, small numbers and key/hash pushes. The -VERIFY opcodes become two tokens. */
std::vector<Token> Tokenize(const Script& script)
{
    std::vector<Token> ret;
    auto it = script.begin();
    opcodetype prev = OP_INVALIDOPCODE;
    while (it != script.end()) {
        size_t offset = it - script.begin();
        opcodetype opcode;
        valtype data;
        if (!GetScriptOp(it, script.end(), opcode, &data)) throw decode_error("truncated push", offset);
        if (opcode <= OP_PUSHDATA4 || (opcode >= OP_1 && opcode <= OP_16)) {
            if (!CheckMinimalPush(data, opcode)) throw decode_error("non-minimal push", offset);
            if (opcode >= OP_1) {
                ret.push_back(Token{TokenKind::NUMBER, opcode, DecodeOP_N(opcode), {}, offset});
            } else if (data.size() <= ScriptNum::DEFAULT_MAX_NUM_SIZE) {
                if (!ScriptNum::IsMinimallyEncoded(data)) throw decode_error("non-minimal number", offset);
                int64_t num = ScriptNum(data, true).GetInt64();
                if (num < 0) throw decode_error("negative number", offset);
                ret.push_back(Token{TokenKind::NUMBER, opcode, num, {}, offset});
            } else if (data.size() == 20 || data.size() == 32 || data.size() == 33) {
                ret.push_back(Token{TokenKind::DATA, opcode, 0, std::move(data), offset});
            } else {
                throw decode_error(strprintf("unexpected push of %u bytes", data.size()), offset);
            }
        } else {
            switch (opcode) {
                case OP_CHECKSIGVERIFY:
                    ret.push_back(Token{TokenKind::OPCODE, OP_CHECKSIG, 0, {}, offset});
                    ret.push_back(Token{TokenKind::OPCODE, OP_VERIFY, 0, {}, offset});
                    break;
                case OP_EQUALVERIFY:
                    ret.push_back(Token{TokenKind::OPCODE, OP_EQUAL, 0, {}, offset});
                    ret.push_back(Token{TokenKind::OPCODE, OP_VERIFY, 0, {}, offset});
                    break;
                case OP_CHECKMULTISIGVERIFY:
                    ret.push_back(Token{TokenKind::OPCODE, OP_CHECKMULTISIG, 0, {}, offset});
                    ret.push_back(Token{TokenKind::OPCODE, OP_VERIFY, 0, {}, offset});
                    break;
                case OP_VERIFY:
                    if (prev == OP_CHECKSIG || prev == OP_EQUAL || prev == OP_CHECKMULTISIG) {
                        throw decode_error(strprintf("%s followed by OP_VERIFY", GetOpName(prev)), offset);
                    }
                    ret.push_back(Token{TokenKind::OPCODE, opcode, 0, {}, offset});
                    break;
                case OP_CHECKSIG:
                case OP_EQUAL:
                case OP_CHECKMULTISIG:
                case OP_CHECKSEQUENCEVERIFY:
                case OP_CHECKLOCKTIMEVERIFY:
                case OP_DUP:
                case OP_HASH160:
                case OP_HASH256:
                case OP_SHA256:
                case OP_RIPEMD160:
                case OP_SIZE:
                case OP_TOALTSTACK:
                case OP_FROMALTSTACK:
                case OP_SWAP:
                case OP_IF:
                case OP_NOTIF:
                case OP_ELSE:
                case OP_ENDIF:
                case OP_IFDUP:
                case OP_0NOTEQUAL:
                case OP_BOOLAND:
                case OP_BOOLOR:
                case OP_ADD:
                    ret.push_back(Token{TokenKind::OPCODE, opcode, 0, {}, offset});
                    break;
                default:
                    throw decode_error("unexpected " + GetOpName(opcode), offset);
            }
        }
        prev = opcode;
    }
    return ret;
}

/**
 * Rebuilds the fragment tree by consuming tokens from the end of the script.
 * Every fragment is identified by its last opcode (and, where that is
 * shared, by a fixed window of tokens before it).
 */
class ScriptDecoder {
    const std::vector<Token>& m_tokens;
    const KeyContext& m_ctx;
    size_t m_end;

public:
    ScriptDecoder(const std::vector<Token>& tokens, const KeyContext& ctx) : m_tokens(tokens), m_ctx(ctx), m_end(tokens.size()) {}

    NodeRef Decode()
    {
        if (m_tokens.empty()) throw decode_error("empty script", 0);
        NodeRef ret = ParseSeq(1);
        if (m_end != 0) throw Unexpected(m_end - 1);
        return ret;
    }

private:
    size_t Offset(size_t idx) const { return idx < m_tokens.size() ? m_tokens[idx].offset : (m_tokens.empty() ? 0 : m_tokens.back().offset); }

    size_t BackOffset(size_t back) const { return back < m_end ? m_tokens[m_end - 1 - back].offset : 0; }

    decode_error Unexpected(size_t idx) const
    {
        const Token& tok = m_tokens[idx];
        if (tok.kind == TokenKind::NUMBER) return decode_error(strprintf("unexpected number %d", tok.num), tok.offset);
        if (tok.kind == TokenKind::DATA) return decode_error(strprintf("unexpected %u byte push", tok.data.size()), tok.offset);
        return decode_error("unexpected " + GetOpName(tok.opcode), tok.offset);
    }

    //! The token back positions before the current end, if any.
    const Token* Peek(size_t back = 0) const
    {
        if (back >= m_end) return nullptr;
        return &m_tokens[m_end - 1 - back];
    }

    bool IsOp(size_t back, opcodetype op) const
    {
        const Token* tok = Peek(back);
        return tok && tok->kind == TokenKind::OPCODE && tok->opcode == op;
    }

    bool IsNum(size_t back) const
    {
        const Token* tok = Peek(back);
        return tok && tok->kind == TokenKind::NUMBER;
    }

    bool IsData(size_t back, size_t size) const
    {
        const Token* tok = Peek(back);
        return tok && tok->kind == TokenKind::DATA && tok->data.size() == size;
    }

    void Expect(opcodetype op)
    {
        if (m_end == 0) throw decode_error("expected " + GetOpName(op) + " before start of script", 0);
        if (!IsOp(0, op)) throw Unexpected(m_end - 1);
        --m_end;
    }

    bool AtDelimiter() const
    {
        return m_end == 0 || IsOp(0, OP_IF) || IsOp(0, OP_NOTIF) || IsOp(0, OP_ELSE) || IsOp(0, OP_TOALTSTACK) || IsOp(0, OP_SWAP);
    }

    NodeRef Make(size_t offset, NodeType nt, std::vector<NodeRef> subs, std::vector<Key> keys, valtype data, uint32_t k)
    {
        try {
            return MakeNode(nt, std::move(subs), std::move(keys), std::move(data), k);
        } catch (const type_error& e) {
            throw decode_error(e.reason() + " in " + e.node(), offset);
        }
    }

    NodeRef Make(size_t offset, NodeType nt, std::vector<NodeRef> subs, uint32_t k = 0)
    {
        return Make(offset, nt, std::move(subs), {}, {}, k);
    }

    decode_error TooDeep() const
    {
        return decode_error(strprintf("nesting deeper than %u", MAX_RECURSION_DEPTH), m_end ? m_tokens[m_end - 1].offset : 0);
    }

    /** Terms up to the next delimiter, joined as right-nested and_v. Each term nests one level deeper. */
    NodeRef ParseSeq(uint32_t depth)
    {
        std::vector<NodeRef> terms;
        std::vector<size_t> starts;
        do {
            if (depth + terms.size() > MAX_RECURSION_DEPTH) throw TooDeep();
            terms.push_back(ParseTerm(depth + (uint32_t)terms.size()));
            starts.push_back(Offset(m_end));
        } while (!AtDelimiter());
        NodeRef ret = std::move(terms[0]);
        for (size_t i = 1; i < terms.size(); ++i) {
            ret = Make(starts[i], NodeType::AND_V, Subs(std::move(terms[i]), std::move(ret)));
        }
        return ret;
    }

    /** A W operand: a:X or s:X. */
    NodeRef ParseW(uint32_t depth)
    {
        if (IsOp(0, OP_FROMALTSTACK)) return ParseTerm(depth);
        NodeRef sub = ParseSeq(depth + 1);
        size_t offset = Offset(m_end - 1);
        Expect(OP_SWAP);
        return Make(offset, NodeType::WRAP_S, Subs(std::move(sub)));
    }

    NodeRef ParseTerm(uint32_t depth)
    {
        if (m_end == 0) throw decode_error("expected expression before start of script", 0);
        if (depth > MAX_RECURSION_DEPTH) throw TooDeep();
        const Token& last = *Peek();
        size_t offset = last.offset;
        if (last.kind == TokenKind::NUMBER) {
            if (last.num > 1) throw Unexpected(m_end - 1);
            --m_end;
            return Make(offset, last.num == 0 ? NodeType::JUST_0 : NodeType::JUST_1, {});
        }
        if (last.kind == TokenKind::DATA) {
            if (last.data.size() != Key::SIZE) throw Unexpected(m_end - 1);
            Key key;
            if (!m_ctx.FromPKBytes(last.data, key)) throw decode_error("invalid public key", offset);
            --m_end;
            return Make(offset, NodeType::PK_K, {}, std::vector<Key>{key}, {}, 0);
        }
        switch (last.opcode) {
            case OP_VERIFY: {
                if (IsOp(1, OP_EQUAL) && IsData(2, 20) && IsOp(3, OP_HASH160) && IsOp(4, OP_DUP)) {
                    valtype hash = Peek(2)->data;
                    offset = Peek(4)->offset;
                    m_end -= 5;
                    return Make(offset, NodeType::PK_H, {}, {}, std::move(hash), 0);
                }
                --m_end;
                NodeRef sub = ParseTerm(depth + 1);
                return Make(Offset(m_end), NodeType::WRAP_V, Subs(std::move(sub)));
            }
            case OP_CHECKSEQUENCEVERIFY:
            case OP_CHECKLOCKTIMEVERIFY: {
                if (!IsNum(1)) throw Unexpected(m_end - 1);
                uint32_t k = (uint32_t)std::min<int64_t>(Peek(1)->num, 0xFFFFFFFF);
                offset = Peek(1)->offset;
                m_end -= 2;
                return Make(offset, last.opcode == OP_CHECKSEQUENCEVERIFY ? NodeType::OLDER : NodeType::AFTER, {}, k);
            }
            case OP_EQUAL: {
                // SIZE 32 EQUAL VERIFY <hashop> <hash> EQUAL
                if (IsOp(6, OP_SIZE) && IsNum(5) && Peek(5)->num == 32 && IsOp(4, OP_EQUAL) && IsOp(3, OP_VERIFY)) {
                    NodeType nt;
                    size_t want;
                    if (IsOp(2, OP_SHA256)) {
                        nt = NodeType::SHA256;
                        want = 32;
                    } else if (IsOp(2, OP_HASH256)) {
                        nt = NodeType::HASH256;
                        want = 32;
                    } else if (IsOp(2, OP_RIPEMD160)) {
                        nt = NodeType::RIPEMD160;
                        want = 20;
                    } else if (IsOp(2, OP_HASH160)) {
                        nt = NodeType::HASH160;
                        want = 20;
                    } else {
                        throw Unexpected(m_end - 3);
                    }
                    if (!IsData(1, want)) throw Unexpected(m_end - 2);
                    valtype hash = Peek(1)->data;
                    offset = Peek(6)->offset;
                    m_end -= 7;
                    return Make(offset, nt, {}, {}, std::move(hash), 0);
                }
                if (!IsNum(1)) throw Unexpected(m_end - 1);
                uint32_t k = (uint32_t)std::min<int64_t>(Peek(1)->num, 0xFFFFFFFF);
                m_end -= 2;
                std::vector<NodeRef> subs;
                while (IsOp(0, OP_ADD)) {
                    --m_end;
                    subs.push_back(ParseW(depth + 1));
                }
                subs.push_back(ParseTerm(depth + 1));
                std::reverse(subs.begin(), subs.end());
                return Make(Offset(m_end), NodeType::THRESH, std::move(subs), k);
            }
            case OP_CHECKMULTISIG: {
                if (!IsNum(1)) throw Unexpected(m_end - 1);
                int64_t n = Peek(1)->num;
                if (n < 1 || n > MAX_PUBKEYS_PER_MULTISIG) throw decode_error(strprintf("invalid multi key count %d", n), Peek(1)->offset);
                std::vector<Key> keys;
                for (int64_t i = 0; i < n; ++i) {
                    if (!IsData(2 + i, Key::SIZE)) throw decode_error("expected public key", BackOffset(2 + i));
                    Key key;
                    if (!m_ctx.FromPKBytes(Peek(2 + i)->data, key)) throw decode_error("invalid public key", Peek(2 + i)->offset);
                    keys.push_back(key);
                }
                if (!IsNum(2 + n)) throw decode_error("expected multi threshold", BackOffset(2 + n));
                uint32_t k = (uint32_t)std::min<int64_t>(Peek(2 + n)->num, 0xFFFFFFFF);
                offset = Peek(2 + n)->offset;
                m_end -= 3 + n;
                std::reverse(keys.begin(), keys.end());
                return Make(offset, NodeType::MULTI, {}, std::move(keys), {}, k);
            }
            case OP_CHECKSIG: {
                --m_end;
                NodeRef sub = ParseTerm(depth + 1);
                return Make(Offset(m_end), NodeType::WRAP_C, Subs(std::move(sub)));
            }
            case OP_0NOTEQUAL: {
                --m_end;
                NodeRef sub = ParseTerm(depth + 1);
                return Make(Offset(m_end), NodeType::WRAP_N, Subs(std::move(sub)));
            }
            case OP_FROMALTSTACK: {
                --m_end;
                NodeRef sub = ParseSeq(depth + 1);
                offset = Offset(m_end - 1);
                Expect(OP_TOALTSTACK);
                return Make(offset, NodeType::WRAP_A, Subs(std::move(sub)));
            }
            case OP_BOOLAND:
            case OP_BOOLOR: {
                --m_end;
                NodeRef y = ParseW(depth + 1);
                NodeRef x = ParseTerm(depth + 1);
                return Make(Offset(m_end), last.opcode == OP_BOOLAND ? NodeType::AND_B : NodeType::OR_B, Subs(std::move(x), std::move(y)));
            }
            case OP_ENDIF: {
                --m_end;
                NodeRef second = ParseSeq(depth + 1);
                if (IsOp(0, OP_ELSE)) {
                    --m_end;
                    NodeRef first = ParseSeq(depth + 1);
                    if (IsOp(0, OP_IF)) {
                        offset = Peek()->offset;
                        --m_end;
                        return Make(offset, NodeType::OR_I, Subs(std::move(first), std::move(second)));
                    }
                    if (IsOp(0, OP_NOTIF)) {
                        --m_end;
                        NodeRef x = ParseTerm(depth + 1);
                        return Make(Offset(m_end), NodeType::ANDOR, Subs(std::move(x), std::move(second), std::move(first)));
                    }
                    if (m_end == 0) throw decode_error("OP_ELSE without OP_IF", Offset(0));
                    throw Unexpected(m_end - 1);
                }
                if (IsOp(0, OP_IF)) {
                    if (IsOp(1, OP_DUP)) {
                        offset = Peek(1)->offset;
                        m_end -= 2;
                        return Make(offset, NodeType::WRAP_D, Subs(std::move(second)));
                    }
                    if (IsOp(1, OP_0NOTEQUAL) && IsOp(2, OP_SIZE)) {
                        offset = Peek(2)->offset;
                        m_end -= 3;
                        return Make(offset, NodeType::WRAP_J, Subs(std::move(second)));
                    }
                    if (m_end < 2) throw decode_error("OP_IF without a d: or j: prefix", Peek()->offset);
                    throw Unexpected(m_end - 2);
                }
                if (IsOp(0, OP_NOTIF)) {
                    --m_end;
                    if (IsOp(0, OP_IFDUP)) {
                        --m_end;
                        NodeRef x = ParseTerm(depth + 1);
                        return Make(Offset(m_end), NodeType::OR_D, Subs(std::move(x), std::move(second)));
                    }
                    NodeRef x = ParseTerm(depth + 1);
                    return Make(Offset(m_end), NodeType::OR_C, Subs(std::move(x), std::move(second)));
                }
                if (m_end == 0) throw decode_error("OP_ENDIF without OP_IF", last.offset);
                throw Unexpected(m_end - 1);
            }
            default:
                throw Unexpected(m_end - 1);
        }
    }
};

std::string PushString(const valtype& data, const KeyContext* ctx)
{
    if (ctx) {
        Key key;
        if (data.size() == Key::SIZE && Key::IsCompressed(data)) {
            std::string name = ctx->ToString(Key(data));
            if (name != HexStr(data)) return "<" + name + ">";
        } else if (data.size() == 20 && ctx->LookupKeyHash(data, key)) {
            std::string name = ctx->ToString(key);
            if (name != key.ToHex()) return "<HASH160(" + name + ")>";
        }
    }
    return "<" + HexStr(data) + ">";
}

std::string Disassembler(Script::const_iterator& it, Script::const_iterator end, const KeyContext* ctx, int indent = 0)
{
    std::string ret;
    bool newline = true;
    size_t last_newline = 0;
    size_t last_space = 0;
    while (it != end) {
        opcodetype opcode;
        valtype data;
        auto it2 = it;
        if (!GetScriptOp(it2, end, opcode, &data)) return ret + " [error]";
        if (opcode == OP_ELSE || opcode == OP_ENDIF) break;
        it = it2;
        if (newline) {
            for (int i = 0; i < indent; ++i) ret += "  ";
        } else {
            ret += ' ';
            last_space = ret.size() - 1;
        }
        if (data.size() > 0) {
            ret += PushString(data, ctx);
        } else {
            ret += GetOpName(opcode);
            if (opcode == OP_IF || opcode == OP_NOTIF) {
                ret += '\n';
                ret += Disassembler(it, end, ctx, indent + 1);
                if (it != end && *it == OP_ELSE) {
                    for (int i = 0; i < indent; ++i) ret += "  ";
                    ret += GetOpName(opcodetype(*(it++))) + '\n';
                    ret += Disassembler(it, end, ctx, indent + 1);
                }
                if (it != end && *it == OP_ENDIF) {
                    for (int i = 0; i < indent; ++i) ret += "  ";
                    ret += GetOpName(opcodetype(*(it++))) + '\n';
                }
                last_newline = ret.size();
                newline = true;
            }
        }
        if (!newline && ret.size() - last_newline > 80) {
            ret[last_space] = '\n';
            for (int i = 0; i < indent; ++i) ret.insert(last_space + 1, "  ");
            last_newline = last_space + 1;
        }
        newline = (ret.size() == last_newline);
    }
    if (!newline) ret += '\n';
    return ret;
}

} // namespace

Script ToScript(const Node& node)
{
    return ToScriptHelper(node, false);
}

NodeRef FromScript(const Script& script, const KeyContext& ctx)
{
    if (script.size() > (size_t)MAX_SCRIPT_SIZE) {
        throw decode_error(strprintf("script is %u bytes, exceeding the limit of %u", script.size(), MAX_SCRIPT_SIZE), MAX_SCRIPT_SIZE);
    }
    std::vector<Token> tokens = Tokenize(script);
    msc_decode_logf("decoding %u bytes (%u tokens)\n", (unsigned)script.size(), (unsigned)tokens.size());
    NodeRef node = ScriptDecoder(tokens, ctx).Decode();
    Script reencoded = ToScript(*node);
    if (reencoded != script) {
        auto mismatch = std::mismatch(script.begin(), script.end(), reencoded.begin(), reencoded.end());
        size_t offset = mismatch.first - script.begin();
        msc_decode_logf("re-encoding differs at offset %u\n", (unsigned)offset);
        throw decode_error("not the canonical encoding of a fragment", offset);
    }
    if (msc_enabled(msc_decode_logf)) msc_decode_logf("decoded %s\n", node->ToString(ctx).c_str());
    return node;
}

std::string Disassemble(const Script& script, const KeyContext* ctx)
{
    auto it = script.begin();
    std::string ret;
    while (it != script.end()) {
        ret += Disassembler(it, script.end(), ctx);
        // unbalanced OP_ELSE/OP_ENDIF at the top level
        if (it != script.end()) ret += GetOpName(opcodetype(*(it++))) + '\n';
    }
    return ret;
}

} // namespace msc
