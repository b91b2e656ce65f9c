// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <policy/policy.h>

#include <miniscript/errors.h>
#include <policy/tokenizer.h>
#include <util/strings.h>

#include <tinyformat.h>

namespace msc {

Policy Policy::Clone() const
{
    Policy ret(node_type);
    for (const auto& s : sub) ret.sub.push_back(s.Clone());
    ret.data = data;
    ret.keys = keys;
    ret.prob = prob;
    ret.k = k;
    return ret;
}

static bool HasHash(const BaseSatisfier& oracle, HashType type, const valtype& digest)
{
    valtype preimage;
    return oracle.SatHash(type, digest, preimage) == Availability::YES;
}

bool Policy::Satisfied(const BaseSatisfier& oracle) const
{
    switch (node_type) {
        case Type::NONE:
        case Type::UNSATISFIABLE:
            return false;
        case Type::TRIVIAL:
            return true;
        case Type::PK: {
            valtype sig;
            return oracle.Sign(keys[0], sig) == Availability::YES;
        }
        case Type::PKH: {
            Key key;
            valtype sig;
            return oracle.LookupKeyHash(data, key) && oracle.Sign(key, sig) == Availability::YES;
        }
        case Type::OLDER: return oracle.CheckOlder(k);
        case Type::AFTER: return oracle.CheckAfter(k);
        case Type::SHA256: return HasHash(oracle, HashType::SHA256, data);
        case Type::HASH256: return HasHash(oracle, HashType::HASH256, data);
        case Type::RIPEMD160: return HasHash(oracle, HashType::RIPEMD160, data);
        case Type::HASH160: return HasHash(oracle, HashType::HASH160, data);
        case Type::AND:
            for (const auto& s : sub) {
                if (!s.Satisfied(oracle)) return false;
            }
            return true;
        case Type::OR:
            for (const auto& s : sub) {
                if (s.Satisfied(oracle)) return true;
            }
            return false;
        case Type::THRESH: {
            uint32_t count = 0;
            for (const auto& s : sub) count += s.Satisfied(oracle);
            return count >= k;
        }
    }
    throw std::logic_error("Satisfied: unhandled policy type");
}

namespace {

class PolicyParser {
    const std::string& m_str;
    const KeyContext& m_ctx;
    std::vector<token_t> m_tokens;
    size_t m_pos{0};

public:
    PolicyParser(const std::string& str, const KeyContext& ctx) : m_str(str), m_ctx(ctx), m_tokens(tokenize(str)) {}

    Policy Parse()
    {
        Policy ret = ParseExpr(1);
        if (m_pos != m_tokens.size()) {
            const token_t& tok = m_tokens[m_pos];
            throw parse_error("unexpected '" + tok.value + "' after policy", tok.begin, tok.end);
        }
        return ret;
    }

private:
    const token_t& Next(const char* what)
    {
        if (m_pos >= m_tokens.size()) throw parse_error(strprintf("expected %s, got end of input", what), m_str.size(), m_str.size());
        return m_tokens[m_pos++];
    }

    bool Peek(token_type type) const
    {
        return m_pos < m_tokens.size() && m_tokens[m_pos].token == type;
    }

    void Expect(token_type type)
    {
        const token_t& tok = Next(token_type_str[type]);
        if (tok.token != type) throw parse_error(strprintf("expected %s, got '%s'", token_type_str[type], tok.value), tok.begin, tok.end);
    }

    uint32_t ParseNumber(const char* what)
    {
        const token_t& tok = Next(what);
        uint32_t num;
        if (tok.token != tok_number || !ParseUInt32(tok.value, &num)) {
            throw parse_error(strprintf("expected %s, got '%s'", what, tok.value), tok.begin, tok.end);
        }
        return num;
    }

    Key ParseKey()
    {
        const token_t& tok = Next("key");
        Key key;
        if ((tok.token != tok_symbol && tok.token != tok_number) || !m_ctx.FromString(tok.value, key)) {
            throw parse_error("invalid key '" + tok.value + "'", tok.begin, tok.end);
        }
        return key;
    }

    valtype ParseHash(size_t len)
    {
        const token_t& tok = Next("hash");
        if (!tok.is_hex() || tok.value.size() != 2 * len) {
            throw parse_error(strprintf("expected %u hex encoded bytes, got '%s'", len, tok.value), tok.begin, tok.end);
        }
        return ParseHex(tok.value);
    }

    //! depth is the nesting level of the policy being parsed, 1 for the root.
    Policy ParseExpr(uint32_t depth)
    {
        const token_t& name = Next("policy");
        if (name.token != tok_symbol) throw parse_error("expected policy, got '" + name.value + "'", name.begin, name.end);
        if (depth > MAX_RECURSION_DEPTH) throw parse_error(strprintf("nesting deeper than %u", MAX_RECURSION_DEPTH), name.begin, name.end);
        if (name.value == "TRIVIAL") return Policy(Policy::Type::TRIVIAL);
        if (name.value == "UNSATISFIABLE") return Policy(Policy::Type::UNSATISFIABLE);
        Expect(tok_lparen);
        Policy ret(Policy::Type::NONE);
        if (name.value == "pk") {
            ret = Policy(Policy::Type::PK, std::vector<Key>{ParseKey()});
        } else if (name.value == "pkh") {
            if (m_pos < m_tokens.size() && m_tokens[m_pos].is_hex() && m_tokens[m_pos].value.size() == 40) {
                ret = Policy(Policy::Type::PKH, ParseHash(20));
            } else {
                ret = Policy(Policy::Type::PKH, ParseKey().GetHash160());
            }
        } else if (name.value == "older" || name.value == "after") {
            size_t begin = m_pos < m_tokens.size() ? m_tokens[m_pos].begin : m_str.size();
            uint32_t num = ParseNumber("number");
            if (num < 1 || num >= 0x80000000UL) {
                throw parse_error(strprintf("%s(%u) out of range 1..2147483647", name.value, num), begin, m_tokens[m_pos - 1].end);
            }
            ret = Policy(name.value == "older" ? Policy::Type::OLDER : Policy::Type::AFTER, num);
        } else if (name.value == "sha256") {
            ret = Policy(Policy::Type::SHA256, ParseHash(32));
        } else if (name.value == "hash256") {
            ret = Policy(Policy::Type::HASH256, ParseHash(32));
        } else if (name.value == "ripemd160") {
            ret = Policy(Policy::Type::RIPEMD160, ParseHash(20));
        } else if (name.value == "hash160") {
            ret = Policy(Policy::Type::HASH160, ParseHash(20));
        } else if (name.value == "and") {
            std::vector<Policy> sub;
            sub.push_back(ParseExpr(depth + 1));
            while (Peek(tok_comma)) {
                ++m_pos;
                sub.push_back(ParseExpr(depth + 1));
            }
            if (sub.size() < 2) throw parse_error("and() needs at least two arguments", name.begin, m_tokens[m_pos - 1].end);
            ret = Policy(Policy::Type::AND, std::move(sub));
        } else if (name.value == "or") {
            std::vector<Policy> sub;
            std::vector<uint32_t> prob;
            do {
                if (!sub.empty()) ++m_pos;
                uint32_t weight = 1;
                if (Peek(tok_number) && m_pos + 1 < m_tokens.size() && m_tokens[m_pos + 1].token == tok_at) {
                    const token_t& tok = m_tokens[m_pos];
                    weight = ParseNumber("weight");
                    if (weight == 0) throw parse_error("weights must be positive", tok.begin, tok.end);
                    ++m_pos;
                }
                sub.push_back(ParseExpr(depth + 1));
                prob.push_back(weight);
            } while (Peek(tok_comma));
            if (sub.size() < 2) throw parse_error("or() needs at least two arguments", name.begin, m_tokens[m_pos - 1].end);
            ret = Policy(Policy::Type::OR, std::move(sub), std::move(prob));
        } else if (name.value == "thresh") {
            size_t kpos = m_pos;
            uint32_t k = ParseNumber("threshold");
            std::vector<Policy> sub;
            while (Peek(tok_comma)) {
                ++m_pos;
                sub.push_back(ParseExpr(depth + 1));
            }
            const token_t& ktok = m_tokens[kpos];
            if (sub.empty()) throw parse_error("thresh() needs at least one policy", ktok.begin, ktok.end);
            if (sub.size() > MAX_POLICY_THRESH_ARGS) throw parse_error(strprintf("thresh() takes at most %u policies", MAX_POLICY_THRESH_ARGS), name.begin, name.end);
            if (k < 1 || k > sub.size()) throw parse_error(strprintf("threshold %u out of range 1..%u", k, sub.size()), ktok.begin, ktok.end);
            ret = Policy(Policy::Type::THRESH, std::move(sub), k);
        } else {
            throw parse_error("unknown policy '" + name.value + "'", name.begin, name.end);
        }
        Expect(tok_rparen);
        return ret;
    }
};

std::string KeyHashString(const valtype& hash, const KeyContext& ctx)
{
    Key key;
    if (ctx.LookupKeyHash(hash, key)) return ctx.ToString(key);
    return HexStr(hash);
}

Policy Simplify(Policy pol)
{
    if (pol.node_type == Policy::Type::AND || pol.node_type == Policy::Type::OR) {
        bool is_and = pol.node_type == Policy::Type::AND;
        Policy::Type neutral = is_and ? Policy::Type::TRIVIAL : Policy::Type::UNSATISFIABLE;
        Policy::Type absorbing = is_and ? Policy::Type::UNSATISFIABLE : Policy::Type::TRIVIAL;
        std::vector<Policy> sub;
        std::vector<uint32_t> prob;
        for (size_t i = 0; i < pol.sub.size(); ++i) {
            if (pol.sub[i].node_type == absorbing) return Policy(absorbing);
            if (pol.sub[i].node_type == neutral) continue;
            sub.push_back(std::move(pol.sub[i]));
            if (!is_and) prob.push_back(pol.prob[i]);
        }
        if (sub.empty()) return Policy(neutral);
        if (sub.size() == 1) return std::move(sub[0]);
        if (is_and) return Policy(Policy::Type::AND, std::move(sub));
        return Policy(Policy::Type::OR, std::move(sub), std::move(prob));
    }
    return pol;
}

/** Drop TRIVIAL and UNSATISFIABLE arguments of a thresh, adjusting the threshold. */
Policy SimplifyThresh(std::vector<Policy> subs, uint32_t k)
{
    std::vector<Policy> sub;
    for (auto& s : subs) {
        if (s.node_type == Policy::Type::TRIVIAL) {
            if (k > 0) --k;
        } else if (s.node_type != Policy::Type::UNSATISFIABLE) {
            sub.push_back(std::move(s));
        }
    }
    if (k == 0) return Policy(Policy::Type::TRIVIAL);
    if (k > sub.size()) return Policy(Policy::Type::UNSATISFIABLE);
    if (sub.size() == 1) return std::move(sub[0]);
    return Policy(Policy::Type::THRESH, std::move(sub), k);
}

Policy LiftBinary(Policy::Type type, Policy left, Policy right)
{
    std::vector<Policy> sub;
    sub.push_back(std::move(left));
    sub.push_back(std::move(right));
    if (type == Policy::Type::AND) return Simplify(Policy(type, std::move(sub)));
    return Simplify(Policy(type, std::move(sub), std::vector<uint32_t>{1, 1}));
}

} // namespace

Policy ParsePolicy(const std::string& str, const KeyContext& ctx)
{
    return PolicyParser(str, ctx).Parse();
}

std::string ToString(const Policy& policy, const KeyContext& ctx)
{
    switch (policy.node_type) {
        case Policy::Type::NONE: return "";
        case Policy::Type::TRIVIAL: return "TRIVIAL";
        case Policy::Type::UNSATISFIABLE: return "UNSATISFIABLE";
        case Policy::Type::PK: return "pk(" + ctx.ToString(policy.keys[0]) + ")";
        case Policy::Type::PKH: return "pkh(" + KeyHashString(policy.data, ctx) + ")";
        case Policy::Type::OLDER: return "older(" + std::to_string(policy.k) + ")";
        case Policy::Type::AFTER: return "after(" + std::to_string(policy.k) + ")";
        case Policy::Type::SHA256: return "sha256(" + HexStr(policy.data) + ")";
        case Policy::Type::HASH256: return "hash256(" + HexStr(policy.data) + ")";
        case Policy::Type::RIPEMD160: return "ripemd160(" + HexStr(policy.data) + ")";
        case Policy::Type::HASH160: return "hash160(" + HexStr(policy.data) + ")";
        case Policy::Type::AND:
        case Policy::Type::OR:
        case Policy::Type::THRESH: {
            std::vector<std::string> args;
            if (policy.node_type == Policy::Type::THRESH) args.push_back(std::to_string(policy.k));
            bool weighted = false;
            if (policy.node_type == Policy::Type::OR) {
                for (uint32_t w : policy.prob) weighted |= w != 1;
            }
            for (size_t i = 0; i < policy.sub.size(); ++i) {
                std::string arg = ToString(policy.sub[i], ctx);
                if (weighted) arg = std::to_string(policy.prob[i]) + "@" + arg;
                args.push_back(arg);
            }
            const char* name = policy.node_type == Policy::Type::AND ? "and" : policy.node_type == Policy::Type::OR ? "or" : "thresh";
            return std::string(name) + "(" + Join(args, ",") + ")";
        }
    }
    throw std::logic_error("ToString: unhandled policy type");
}

Policy Lift(const Node& node)
{
    switch (node.nodetype) {
        case NodeType::JUST_0: return Policy(Policy::Type::UNSATISFIABLE);
        case NodeType::JUST_1: return Policy(Policy::Type::TRIVIAL);
        case NodeType::PK_K: return Policy(Policy::Type::PK, std::vector<Key>(node.keys));
        case NodeType::PK_H: return Policy(Policy::Type::PKH, valtype(node.data));
        case NodeType::OLDER: return Policy(Policy::Type::OLDER, node.k);
        case NodeType::AFTER: return Policy(Policy::Type::AFTER, node.k);
        case NodeType::SHA256: return Policy(Policy::Type::SHA256, valtype(node.data));
        case NodeType::HASH256: return Policy(Policy::Type::HASH256, valtype(node.data));
        case NodeType::RIPEMD160: return Policy(Policy::Type::RIPEMD160, valtype(node.data));
        case NodeType::HASH160: return Policy(Policy::Type::HASH160, valtype(node.data));
        case NodeType::WRAP_A:
        case NodeType::WRAP_S:
        case NodeType::WRAP_C:
        case NodeType::WRAP_D:
        case NodeType::WRAP_V:
        case NodeType::WRAP_J:
        case NodeType::WRAP_N:
            return Lift(*node.subs[0]);
        case NodeType::AND_V:
        case NodeType::AND_B:
            return LiftBinary(Policy::Type::AND, Lift(*node.subs[0]), Lift(*node.subs[1]));
        case NodeType::OR_B:
        case NodeType::OR_C:
        case NodeType::OR_D:
        case NodeType::OR_I:
            return LiftBinary(Policy::Type::OR, Lift(*node.subs[0]), Lift(*node.subs[1]));
        case NodeType::ANDOR:
            return LiftBinary(Policy::Type::OR, LiftBinary(Policy::Type::AND, Lift(*node.subs[0]), Lift(*node.subs[1])), Lift(*node.subs[2]));
        case NodeType::THRESH: {
            std::vector<Policy> sub;
            for (const auto& s : node.subs) sub.push_back(Lift(*s));
            return SimplifyThresh(std::move(sub), node.k);
        }
        case NodeType::MULTI: {
            std::vector<Policy> sub;
            for (const auto& key : node.keys) sub.push_back(Policy(Policy::Type::PK, std::vector<Key>{key}));
            return Policy(Policy::Type::THRESH, std::move(sub), node.k);
        }
    }
    throw std::logic_error("Lift: unhandled node type");
}

} // namespace msc
