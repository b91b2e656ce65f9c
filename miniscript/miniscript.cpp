// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <miniscript/miniscript.h>

#include <miniscript/codec.h>
#include <script/script.h>
#include <util/strings.h>

#include <tinyformat.h>

namespace msc {

static bool IsWrapper(NodeType nt)
{
    switch (nt) {
        case NodeType::WRAP_A:
        case NodeType::WRAP_S:
        case NodeType::WRAP_C:
        case NodeType::WRAP_D:
        case NodeType::WRAP_V:
        case NodeType::WRAP_J:
        case NodeType::WRAP_N:
            return true;
        default:
            return false;
    }
}

Node::Node(NodeType nt, std::vector<NodeRef> sub, std::vector<Key> key, valtype arg, uint32_t val)
: nodetype(nt)
, k(val)
, keys(std::move(key))
, data(std::move(arg))
, subs(std::move(sub))
, typ(CalcType())
, scriptlen(CalcScriptLen())
, ops(CalcOps())
, ss(CalcStackSize())
{}

Type Node::CalcType() const
{
    Type x = subs.size() > 0 ? subs[0]->GetType() : ""_mst;
    Type y = subs.size() > 1 ? subs[1]->GetType() : ""_mst;
    Type z = subs.size() > 2 ? subs[2]->GetType() : ""_mst;
    std::vector<Type> sub_types;
    for (const auto& sub : subs) {
        if (!sub->IsValid()) return ""_mst;
        sub_types.push_back(sub->GetType());
    }
    return SanitizeType(ComputeType(nodetype, x, y, z, sub_types, k, subs.size(), keys.size()));
}

size_t Node::CalcScriptLen() const
{
    size_t subsize = 0;
    for (const auto& sub : subs) {
        subsize += sub->ScriptSize();
    }
    Type sub0type = subs.size() > 0 ? subs[0]->GetType() : ""_mst;
    return ComputeScriptLen(nodetype, sub0type, subsize, k, subs.size(), keys.size());
}

Ops Node::CalcOps() const
{
    std::vector<Ops> sub_ops;
    for (const auto& sub : subs) sub_ops.push_back(sub->GetOpsInfo());
    Type sub0type = subs.size() > 0 ? subs[0]->GetType() : ""_mst;
    return ComputeOps(nodetype, sub0type, sub_ops, k, keys.size());
}

StackSize Node::CalcStackSize() const
{
    std::vector<StackSize> sub_ss;
    for (const auto& sub : subs) sub_ss.push_back(sub->GetStackSizeInfo());
    return ComputeStackSize(nodetype, sub_ss, k);
}

bool Node::CheckOpsLimit() const
{
    if (!ops.sat.valid) return true;
    return ops.count + ops.sat.value <= (uint32_t)MAX_OPS_PER_SCRIPT;
}

bool Node::CheckStackSize() const
{
    if (!ss.sat.valid) return true;
    return ss.sat.value <= MAX_STANDARD_P2WSH_STACK_ITEMS;
}

bool Node::IsSane() const
{
    return IsValidTopLevel() && IsNonMalleable() && NeedsSignature() && CheckTimeLocksMix() &&
           CheckOpsLimit() && CheckStackSize() && scriptlen <= MAX_STANDARD_P2WSH_SCRIPT_SIZE;
}

NodeRef Node::Clone() const
{
    std::vector<NodeRef> sub;
    for (const auto& s : subs) sub.push_back(s->Clone());
    return NodeRef(new Node(nodetype, std::move(sub), keys, data, k));
}

bool Node::operator==(const Node& other) const
{
    return ToScript(*this) == ToScript(other);
}

static std::string KeyHashString(const valtype& hash, const KeyContext& ctx)
{
    Key key;
    if (ctx.LookupKeyHash(hash, key)) return ctx.ToString(key);
    return HexStr(hash);
}

/** wrapped is set when the caller already emitted a wrapper letter, so a ':' is due. */
static std::string ToStringHelper(const Node& node, const KeyContext& ctx, bool wrapped)
{
    std::string ret = wrapped ? ":" : "";
    switch (node.nodetype) {
        case NodeType::WRAP_A: return "a" + ToStringHelper(*node.subs[0], ctx, true);
        case NodeType::WRAP_S: return "s" + ToStringHelper(*node.subs[0], ctx, true);
        case NodeType::WRAP_C:
            if (node.subs[0]->nodetype == NodeType::PK_K) {
                return ret + "pk(" + ctx.ToString(node.subs[0]->keys[0]) + ")";
            }
            if (node.subs[0]->nodetype == NodeType::PK_H) {
                return ret + "pkh(" + KeyHashString(node.subs[0]->data, ctx) + ")";
            }
            return "c" + ToStringHelper(*node.subs[0], ctx, true);
        case NodeType::WRAP_D: return "d" + ToStringHelper(*node.subs[0], ctx, true);
        case NodeType::WRAP_V: return "v" + ToStringHelper(*node.subs[0], ctx, true);
        case NodeType::WRAP_J: return "j" + ToStringHelper(*node.subs[0], ctx, true);
        case NodeType::WRAP_N: return "n" + ToStringHelper(*node.subs[0], ctx, true);
        case NodeType::AND_V:
            // t:X is short for and_v(X,1)
            if (node.subs[1]->nodetype == NodeType::JUST_1) return "t" + ToStringHelper(*node.subs[0], ctx, true);
            break;
        case NodeType::OR_I:
            // l:X is short for or_i(0,X), u:X for or_i(X,0)
            if (node.subs[0]->nodetype == NodeType::JUST_0) return "l" + ToStringHelper(*node.subs[1], ctx, true);
            if (node.subs[1]->nodetype == NodeType::JUST_0) return "u" + ToStringHelper(*node.subs[0], ctx, true);
            break;
        default: break;
    }
    switch (node.nodetype) {
        case NodeType::JUST_0: return ret + "0";
        case NodeType::JUST_1: return ret + "1";
        case NodeType::PK_K: return ret + "pk_k(" + ctx.ToString(node.keys[0]) + ")";
        case NodeType::PK_H: return ret + "pk_h(" + KeyHashString(node.data, ctx) + ")";
        case NodeType::OLDER: return ret + "older(" + std::to_string(node.k) + ")";
        case NodeType::AFTER: return ret + "after(" + std::to_string(node.k) + ")";
        case NodeType::SHA256: return ret + "sha256(" + HexStr(node.data) + ")";
        case NodeType::HASH256: return ret + "hash256(" + HexStr(node.data) + ")";
        case NodeType::RIPEMD160: return ret + "ripemd160(" + HexStr(node.data) + ")";
        case NodeType::HASH160: return ret + "hash160(" + HexStr(node.data) + ")";
        case NodeType::AND_V: return ret + "and_v(" + ToStringHelper(*node.subs[0], ctx, false) + "," + ToStringHelper(*node.subs[1], ctx, false) + ")";
        case NodeType::AND_B: return ret + "and_b(" + ToStringHelper(*node.subs[0], ctx, false) + "," + ToStringHelper(*node.subs[1], ctx, false) + ")";
        case NodeType::OR_B: return ret + "or_b(" + ToStringHelper(*node.subs[0], ctx, false) + "," + ToStringHelper(*node.subs[1], ctx, false) + ")";
        case NodeType::OR_C: return ret + "or_c(" + ToStringHelper(*node.subs[0], ctx, false) + "," + ToStringHelper(*node.subs[1], ctx, false) + ")";
        case NodeType::OR_D: return ret + "or_d(" + ToStringHelper(*node.subs[0], ctx, false) + "," + ToStringHelper(*node.subs[1], ctx, false) + ")";
        case NodeType::OR_I: return ret + "or_i(" + ToStringHelper(*node.subs[0], ctx, false) + "," + ToStringHelper(*node.subs[1], ctx, false) + ")";
        case NodeType::ANDOR:
            // and_n(X,Y) is short for andor(X,Y,0)
            if (node.subs[2]->nodetype == NodeType::JUST_0) return ret + "and_n(" + ToStringHelper(*node.subs[0], ctx, false) + "," + ToStringHelper(*node.subs[1], ctx, false) + ")";
            return ret + "andor(" + ToStringHelper(*node.subs[0], ctx, false) + "," + ToStringHelper(*node.subs[1], ctx, false) + "," + ToStringHelper(*node.subs[2], ctx, false) + ")";
        case NodeType::MULTI: {
            auto str = ret + "multi(" + std::to_string(node.k);
            for (const auto& key : node.keys) {
                str += "," + ctx.ToString(key);
            }
            return std::move(str) + ")";
        }
        case NodeType::THRESH: {
            auto str = ret + "thresh(" + std::to_string(node.k);
            for (const auto& sub : node.subs) {
                str += "," + ToStringHelper(*sub, ctx, false);
            }
            return std::move(str) + ")";
        }
        default: break;
    }
    throw std::logic_error("ToString: unhandled node type");
}

std::string Node::ToString(const KeyContext& ctx) const
{
    return ToStringHelper(*this, ctx, false);
}

std::string DescribeComposition(NodeType nt, const std::vector<NodeRef>& subs, uint32_t k, size_t n_keys)
{
    std::vector<std::string> args;
    if (nt == NodeType::THRESH || nt == NodeType::MULTI || nt == NodeType::OLDER || nt == NodeType::AFTER) args.push_back(std::to_string(k));
    if (n_keys) args.push_back(strprintf("<%u keys>", n_keys));
    for (const auto& sub : subs) {
        if (!sub) {
            args.push_back("<null>");
            continue;
        }
        std::string name = NodeTypeName(sub->nodetype);
        if (IsWrapper(sub->nodetype)) name += ":";
        args.push_back(strprintf("%s[%s]", name, sub->GetType().ToString()));
    }
    if (IsWrapper(nt)) return NodeTypeName(nt) + ":" + (args.empty() ? std::string() : args[0]);
    return NodeTypeName(nt) + "(" + Join(args, ",") + ")";
}

/** Argument shape checks; returns a reason, or "" if the shape is fine. */
static std::string CheckArguments(NodeType nt, const std::vector<NodeRef>& subs, const std::vector<Key>& keys, const valtype& data, uint32_t k)
{
    size_t want_subs = 0;
    size_t want_data = 0;
    switch (nt) {
        case NodeType::JUST_0:
        case NodeType::JUST_1:
        case NodeType::OLDER:
        case NodeType::AFTER:
        case NodeType::PK_K:
        case NodeType::MULTI:
            break;
        case NodeType::PK_H:
        case NodeType::RIPEMD160:
        case NodeType::HASH160:
            want_data = 20;
            break;
        case NodeType::SHA256:
        case NodeType::HASH256:
            want_data = 32;
            break;
        case NodeType::WRAP_A:
        case NodeType::WRAP_S:
        case NodeType::WRAP_C:
        case NodeType::WRAP_D:
        case NodeType::WRAP_V:
        case NodeType::WRAP_J:
        case NodeType::WRAP_N:
            want_subs = 1;
            break;
        case NodeType::AND_V:
        case NodeType::AND_B:
        case NodeType::OR_B:
        case NodeType::OR_C:
        case NodeType::OR_D:
        case NodeType::OR_I:
            want_subs = 2;
            break;
        case NodeType::ANDOR:
            want_subs = 3;
            break;
        case NodeType::THRESH:
            want_subs = subs.size();
            if (subs.empty()) return "thresh needs at least one argument";
            break;
    }
    if (subs.size() != want_subs) return strprintf("expected %u subexpressions, got %u", want_subs, subs.size());
    for (const auto& sub : subs) {
        if (!sub) return "missing subexpression";
    }
    if (data.size() != want_data) return strprintf("expected %u bytes of data, got %u", want_data, data.size());
    for (const auto& key : keys) {
        if (!key.IsValid()) return "invalid key " + key.ToHex();
    }
    switch (nt) {
        case NodeType::PK_K:
            if (keys.size() != 1) return "pk_k takes exactly one key";
            break;
        case NodeType::MULTI:
            if (keys.empty() || keys.size() > (size_t)MAX_PUBKEYS_PER_MULTISIG) return strprintf("multi takes 1 to %d keys", MAX_PUBKEYS_PER_MULTISIG);
            if (k < 1 || k > keys.size()) return strprintf("multi threshold %u out of range 1..%u", k, keys.size());
            break;
        default:
            if (!keys.empty()) return "unexpected key argument";
    }
    switch (nt) {
        case NodeType::OLDER:
        case NodeType::AFTER:
            if (k < 1 || k >= 0x80000000UL) return strprintf("timelock %u out of range", k);
            break;
        case NodeType::THRESH:
            if (k < 1 || k > subs.size()) return strprintf("thresh threshold %u out of range 1..%u", k, subs.size());
            break;
        case NodeType::MULTI:
            break;
        default:
            if (k != 0) return "unexpected numeric argument";
    }
    return "";
}

NodeRef MakeNode(NodeType nt, std::vector<NodeRef> subs, std::vector<Key> keys, valtype data, uint32_t k)
{
    std::string reason = CheckArguments(nt, subs, keys, data, k);
    if (!reason.empty()) throw type_error(reason, DescribeComposition(nt, subs, k, keys.size()));
    NodeRef node(new Node(nt, std::move(subs), std::move(keys), std::move(data), k));
    if (!node->IsValid()) {
        std::vector<Type> sub_types;
        for (const auto& sub : node->subs) sub_types.push_back(sub->GetType());
        reason = TypeRequirement(nt, sub_types);
        if (reason.empty()) reason = "subexpression types cannot be combined";
        throw type_error(reason, DescribeComposition(nt, node->subs, node->k, node->keys.size()));
    }
    return node;
}

NodeRef MakeNode(NodeType nt, std::vector<NodeRef> subs, uint32_t k)
{
    return MakeNode(nt, std::move(subs), std::vector<Key>(), valtype(), k);
}

NodeRef MakeNode(NodeType nt, std::vector<Key> keys, uint32_t k)
{
    return MakeNode(nt, std::vector<NodeRef>(), std::move(keys), valtype(), k);
}

NodeRef MakeNode(NodeType nt, valtype data)
{
    return MakeNode(nt, std::vector<NodeRef>(), std::vector<Key>(), std::move(data), 0);
}

NodeRef MakeNode(NodeType nt, uint32_t k)
{
    return MakeNode(nt, std::vector<NodeRef>(), std::vector<Key>(), valtype(), k);
}

namespace {

/** Recursive descent over the text form; positions are byte offsets into the input. */
class FragmentParser {
    const std::string& m_str;
    const KeyContext& m_ctx;
    size_t m_pos{0};

public:
    FragmentParser(const std::string& str, const KeyContext& ctx) : m_str(str), m_ctx(ctx) {}

    NodeRef Parse()
    {
        NodeRef ret = ParseExpr(1);
        if (m_pos != m_str.size()) throw parse_error("unexpected characters after expression", m_pos, m_str.size());
        return ret;
    }

private:
    static bool IsNameChar(char c)
    {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
    }

    void Expect(char c)
    {
        if (m_pos >= m_str.size()) throw parse_error(strprintf("expected '%c', got end of input", c), m_pos, m_pos);
        if (m_str[m_pos] != c) throw parse_error(strprintf("expected '%c'", c), m_pos, m_pos + 1);
        ++m_pos;
    }

    /** Read an argument up to the next ',' or ')'. */
    std::string ReadArg(size_t& begin)
    {
        begin = m_pos;
        while (m_pos < m_str.size() && m_str[m_pos] != ',' && m_str[m_pos] != ')') ++m_pos;
        if (begin == m_pos) throw parse_error("empty argument", begin, m_pos);
        return m_str.substr(begin, m_pos - begin);
    }

    uint32_t ParseNumber()
    {
        size_t begin;
        std::string arg = ReadArg(begin);
        uint32_t num;
        if (!ParseUInt32(arg, &num)) throw parse_error("invalid number '" + arg + "'", begin, m_pos);
        return num;
    }

    Key ParseKey()
    {
        size_t begin;
        std::string arg = ReadArg(begin);
        Key key;
        if (!m_ctx.FromString(arg, key)) throw parse_error("invalid key '" + arg + "'", begin, m_pos);
        return key;
    }

    valtype ParseHash(size_t len)
    {
        size_t begin;
        std::string arg = ReadArg(begin);
        valtype hash = ParseHex(arg);
        if (hash.size() != len) throw parse_error(strprintf("expected %u hex encoded bytes", len), begin, m_pos);
        return hash;
    }

    valtype ParseKeyHash()
    {
        size_t begin;
        std::string arg = ReadArg(begin);
        if (arg.size() == 40 && IsHex(arg)) return ParseHex(arg);
        Key key;
        if (!m_ctx.FromString(arg, key)) throw parse_error("invalid key '" + arg + "'", begin, m_pos);
        return key.GetHash160();
    }

    NodeRef Wrap(char c, NodeRef sub, size_t begin)
    {
        switch (c) {
            case 'a': return MakeNode(NodeType::WRAP_A, Subs(std::move(sub)));
            case 's': return MakeNode(NodeType::WRAP_S, Subs(std::move(sub)));
            case 'c': return MakeNode(NodeType::WRAP_C, Subs(std::move(sub)));
            case 'd': return MakeNode(NodeType::WRAP_D, Subs(std::move(sub)));
            case 'v': return MakeNode(NodeType::WRAP_V, Subs(std::move(sub)));
            case 'j': return MakeNode(NodeType::WRAP_J, Subs(std::move(sub)));
            case 'n': return MakeNode(NodeType::WRAP_N, Subs(std::move(sub)));
            case 't': return MakeNode(NodeType::AND_V, Subs(std::move(sub), MakeNode(NodeType::JUST_1)));
            case 'l': return MakeNode(NodeType::OR_I, Subs(MakeNode(NodeType::JUST_0), std::move(sub)));
            case 'u': return MakeNode(NodeType::OR_I, Subs(std::move(sub), MakeNode(NodeType::JUST_0)));
        }
        throw parse_error(strprintf("unknown wrapper '%c'", c), begin, begin + 1);
    }

    std::vector<NodeRef> ParseSubs(size_t count, uint32_t depth)
    {
        std::vector<NodeRef> ret;
        for (size_t i = 0; i < count; ++i) {
            if (i) Expect(',');
            ret.push_back(ParseExpr(depth + 1));
        }
        return ret;
    }

    //! depth is the nesting level of the node being parsed, 1 for the root.
    NodeRef ParseExpr(uint32_t depth)
    {
        size_t begin = m_pos;
        while (m_pos < m_str.size() && IsNameChar(m_str[m_pos])) ++m_pos;
        std::string name = m_str.substr(begin, m_pos - begin);
        if (name.empty()) {
            if (m_pos >= m_str.size()) throw parse_error("expected expression, got end of input", m_pos, m_pos);
            throw parse_error("expected expression", m_pos, m_pos + 1);
        }
        bool wrapped = m_pos < m_str.size() && m_str[m_pos] == ':';
        // each wrapper letter adds a level
        if (depth + (wrapped ? name.size() : 0) > MAX_RECURSION_DEPTH) {
            throw parse_error(strprintf("nesting deeper than %u", MAX_RECURSION_DEPTH), begin, m_pos);
        }
        if (wrapped) {
            ++m_pos;
            NodeRef inner = ParseExpr(depth + (uint32_t)name.size());
            for (size_t i = name.size(); i > 0; --i) {
                inner = Wrap(name[i - 1], std::move(inner), begin + i - 1);
            }
            return inner;
        }
        if (name == "0") return MakeNode(NodeType::JUST_0);
        if (name == "1") return MakeNode(NodeType::JUST_1);
        size_t name_end = m_pos;
        Expect('(');
        NodeRef ret;
        if (name == "pk_k" || name == "pk") {
            ret = MakeNode(NodeType::PK_K, std::vector<Key>{ParseKey()});
            if (name == "pk") ret = MakeNode(NodeType::WRAP_C, Subs(std::move(ret)));
        } else if (name == "pk_h" || name == "pkh") {
            ret = MakeNode(NodeType::PK_H, ParseKeyHash());
            if (name == "pkh") ret = MakeNode(NodeType::WRAP_C, Subs(std::move(ret)));
        } else if (name == "older" || name == "after") {
            size_t arg_begin = m_pos;
            uint32_t num = ParseNumber();
            if (num < 1 || num >= 0x80000000UL) throw parse_error(strprintf("timelock %u out of range", num), arg_begin, m_pos);
            ret = MakeNode(name == "older" ? NodeType::OLDER : NodeType::AFTER, num);
        } else if (name == "sha256") {
            ret = MakeNode(NodeType::SHA256, ParseHash(32));
        } else if (name == "hash256") {
            ret = MakeNode(NodeType::HASH256, ParseHash(32));
        } else if (name == "ripemd160") {
            ret = MakeNode(NodeType::RIPEMD160, ParseHash(20));
        } else if (name == "hash160") {
            ret = MakeNode(NodeType::HASH160, ParseHash(20));
        } else if (name == "and_v") {
            ret = MakeNode(NodeType::AND_V, ParseSubs(2, depth));
        } else if (name == "and_b") {
            ret = MakeNode(NodeType::AND_B, ParseSubs(2, depth));
        } else if (name == "and_n") {
            auto subs = ParseSubs(2, depth);
            subs.push_back(MakeNode(NodeType::JUST_0));
            ret = MakeNode(NodeType::ANDOR, std::move(subs));
        } else if (name == "andor") {
            ret = MakeNode(NodeType::ANDOR, ParseSubs(3, depth));
        } else if (name == "or_b") {
            ret = MakeNode(NodeType::OR_B, ParseSubs(2, depth));
        } else if (name == "or_c") {
            ret = MakeNode(NodeType::OR_C, ParseSubs(2, depth));
        } else if (name == "or_d") {
            ret = MakeNode(NodeType::OR_D, ParseSubs(2, depth));
        } else if (name == "or_i") {
            ret = MakeNode(NodeType::OR_I, ParseSubs(2, depth));
        } else if (name == "thresh") {
            uint32_t k = ParseNumber();
            std::vector<NodeRef> subs;
            while (m_pos < m_str.size() && m_str[m_pos] == ',') {
                ++m_pos;
                subs.push_back(ParseExpr(depth + 1));
            }
            ret = MakeNode(NodeType::THRESH, std::move(subs), k);
        } else if (name == "multi") {
            uint32_t k = ParseNumber();
            std::vector<Key> keys;
            while (m_pos < m_str.size() && m_str[m_pos] == ',') {
                ++m_pos;
                keys.push_back(ParseKey());
            }
            ret = MakeNode(NodeType::MULTI, std::move(keys), k);
        } else {
            throw parse_error("unknown fragment '" + name + "'", begin, name_end);
        }
        Expect(')');
        return ret;
    }
};

} // namespace

NodeRef FromString(const std::string& str, const KeyContext& ctx)
{
    return FragmentParser(str, ctx).Parse();
}

} // namespace msc
