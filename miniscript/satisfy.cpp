// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <miniscript/satisfy.h>

#include <logging.h>

#include <limits>

namespace msc {

InputStack& InputStack::SetAvailable(Availability avail)
{
    available = avail;
    if (avail == Availability::NO) {
        stack.clear();
        size = std::numeric_limits<size_t>::max();
        has_sig = false;
        malleable = false;
        non_canon = false;
    }
    return *this;
}

InputStack& InputStack::SetWithSig()
{
    has_sig = true;
    return *this;
}

InputStack& InputStack::SetNonCanon()
{
    non_canon = true;
    return *this;
}

InputStack& InputStack::SetMalleable(bool x)
{
    malleable = x;
    return *this;
}

InputStack operator+(InputStack a, InputStack b)
{
    if (a.available == Availability::NO || b.available == Availability::NO) {
        a.SetAvailable(Availability::NO);
        return a;
    }
    a.stack.insert(a.stack.end(), std::make_move_iterator(b.stack.begin()), std::make_move_iterator(b.stack.end()));
    a.size += b.size;
    a.has_sig |= b.has_sig;
    a.malleable |= b.malleable;
    a.non_canon |= b.non_canon;
    return a;
}

namespace {

const InputStack ZERO = InputStack(valtype());
const InputStack ZERO32 = InputStack(valtype(32, 0)).SetMalleable();
const InputStack ONE = InputStack(valtype(1, 1));
const InputStack EMPTY = InputStack();
const InputStack INVALID = InputStack().SetAvailable(Availability::NO);

struct InputResult {
    InputStack nsat, sat;
};

class Satisfier {
    const BaseSatisfier& m_oracle;
    const bool m_nonmalleable;
    SatisfactionReport* m_report;

    /** Pick between two alternatives. Once malleability is settled the smaller one wins;
     *  the canonical flag only breaks size ties, and on a full tie the first one wins. */
    InputStack Or(InputStack a, InputStack b) const
    {
        if (a.available == Availability::NO) return b;
        if (b.available == Availability::NO) return a;
        if (m_nonmalleable) {
            // a third party could drop the signature-free option in for the other
            if (!a.has_sig && b.has_sig) return a;
            if (!b.has_sig && a.has_sig) return b;
            if (!a.has_sig && !b.has_sig) {
                a.malleable = true;
                b.malleable = true;
            } else {
                if (b.malleable && !a.malleable) return a;
                if (a.malleable && !b.malleable) return b;
            }
        }
        if (a.size != b.size) return a.size < b.size ? a : b;
        if (a.non_canon != b.non_canon) return a.non_canon ? b : a;
        return a;
    }

    InputStack Or(InputStack a, InputStack b, InputStack c) const
    {
        return Or(Or(std::move(a), std::move(b)), std::move(c));
    }

    InputResult Produce(const Node& node) const
    {
        std::vector<InputResult> subres;
        for (const auto& sub : node.subs) subres.push_back(Produce(*sub));
        InputResult ret = ProduceHelper(node, subres);
        if (m_report) (*m_report)[&node] = std::make_pair(ret.nsat.available, ret.sat.available);
        if (msc_enabled(msc_satisfy_logf)) {
            msc_satisfy_logf("%s: dsat %s (%u bytes%s) sat %s (%u bytes%s%s)\n",
                NodeTypeName(node.nodetype).c_str(),
                ret.nsat.available == Availability::YES ? "yes" : "no", ret.nsat.available == Availability::YES ? (unsigned)ret.nsat.size : 0u, ret.nsat.malleable ? ", malleable" : "",
                ret.sat.available == Availability::YES ? "yes" : "no", ret.sat.available == Availability::YES ? (unsigned)ret.sat.size : 0u, ret.sat.malleable ? ", malleable" : "", ret.sat.has_sig ? ", signed" : "");
        }
        return ret;
    }

    InputStack SatHash(HashType type, const valtype& digest) const
    {
        valtype preimage;
        Availability avail = m_oracle.SatHash(type, digest, preimage);
        return InputStack(std::move(preimage)).SetAvailable(avail);
    }

    InputResult ProduceHelper(const Node& node, std::vector<InputResult>& subres) const
    {
        switch (node.nodetype) {
            case NodeType::PK_K: {
                valtype sig;
                Availability avail = m_oracle.Sign(node.keys[0], sig);
                return {ZERO, InputStack(std::move(sig)).SetWithSig().SetAvailable(avail)};
            }
            case NodeType::PK_H: {
                Key key;
                if (!m_oracle.LookupKeyHash(node.data, key)) return {INVALID, INVALID};
                valtype sig;
                Availability avail = m_oracle.Sign(key, sig);
                return {ZERO + InputStack(key.data()), (InputStack(std::move(sig)).SetWithSig() + InputStack(key.data())).SetAvailable(avail)};
            }
            case NodeType::MULTI: {
                // sats[j] is the cheapest way to satisfy j of the keys seen so far
                std::vector<InputStack> sats;
                sats.push_back(ZERO);
                for (size_t i = 0; i < node.keys.size(); ++i) {
                    valtype sig;
                    Availability avail = m_oracle.Sign(node.keys[i], sig);
                    auto sat = InputStack(std::move(sig)).SetWithSig().SetAvailable(avail);
                    std::vector<InputStack> next_sats;
                    next_sats.push_back(sats[0]);
                    for (size_t j = 1; j < sats.size(); ++j) next_sats.push_back(Or(sats[j], sats[j - 1] + sat));
                    next_sats.push_back(std::move(sats[sats.size() - 1]) + std::move(sat));
                    sats = std::move(next_sats);
                }
                InputStack nsat = ZERO;
                for (size_t i = 0; i < node.k; ++i) nsat = std::move(nsat) + ZERO;
                return {std::move(nsat), std::move(sats[node.k])};
            }
            case NodeType::THRESH: {
                // sats[j] satisfies exactly j of the subexpressions seen so far and dissatisfies the rest.
                // Walking from the last one keeps the first argument's items on top; on a tie the
                // subexpression with the lower index is the one satisfied.
                std::vector<InputStack> sats;
                sats.push_back(EMPTY);
                for (size_t i = 0; i < subres.size(); ++i) {
                    auto& res = subres[subres.size() - i - 1];
                    std::vector<InputStack> next_sats;
                    next_sats.push_back(sats[0] + res.nsat);
                    for (size_t j = 1; j < sats.size(); ++j) next_sats.push_back(Or(sats[j - 1] + res.sat, sats[j] + res.nsat));
                    next_sats.push_back(std::move(sats[sats.size() - 1]) + std::move(res.sat));
                    sats = std::move(next_sats);
                }
                InputStack nsat = INVALID;
                for (size_t i = 0; i < sats.size(); ++i) {
                    // only all-dissatisfied is a canonical dissatisfaction
                    if (i != 0 && i != node.k) sats[i].SetMalleable().SetNonCanon();
                    if (i != node.k) nsat = Or(std::move(nsat), std::move(sats[i]));
                }
                return {std::move(nsat), std::move(sats[node.k])};
            }
            case NodeType::OLDER:
                return {INVALID, m_oracle.CheckOlder(node.k) ? EMPTY : INVALID};
            case NodeType::AFTER:
                return {INVALID, m_oracle.CheckAfter(node.k) ? EMPTY : INVALID};
            case NodeType::SHA256: return {ZERO32, SatHash(HashType::SHA256, node.data)};
            case NodeType::HASH256: return {ZERO32, SatHash(HashType::HASH256, node.data)};
            case NodeType::RIPEMD160: return {ZERO32, SatHash(HashType::RIPEMD160, node.data)};
            case NodeType::HASH160: return {ZERO32, SatHash(HashType::HASH160, node.data)};
            case NodeType::AND_V: {
                auto& x = subres[0], &y = subres[1];
                return {(y.nsat + x.sat).SetNonCanon(), y.sat + x.sat};
            }
            case NodeType::AND_B: {
                auto& x = subres[0], &y = subres[1];
                return {Or(y.nsat + x.nsat, (y.sat + x.nsat).SetMalleable().SetNonCanon(), (y.nsat + x.sat).SetMalleable().SetNonCanon()), y.sat + x.sat};
            }
            case NodeType::OR_B: {
                auto& x = subres[0], &z = subres[1];
                return {z.nsat + x.nsat, Or(z.nsat + x.sat, z.sat + x.nsat, (z.sat + x.sat).SetMalleable().SetNonCanon())};
            }
            case NodeType::OR_C: {
                auto& x = subres[0], &z = subres[1];
                return {INVALID, Or(x.sat, z.sat + x.nsat)};
            }
            case NodeType::OR_D: {
                auto& x = subres[0], &z = subres[1];
                return {z.nsat + x.nsat, Or(x.sat, z.sat + x.nsat)};
            }
            case NodeType::ANDOR: {
                auto& x = subres[0], &y = subres[1], &z = subres[2];
                return {Or((y.nsat + x.sat).SetNonCanon(), z.nsat + x.nsat), Or(y.sat + x.sat, z.sat + x.nsat)};
            }
            case NodeType::OR_I: {
                auto& x = subres[0], &z = subres[1];
                return {Or(x.nsat + ONE, z.nsat + ZERO), Or(x.sat + ONE, z.sat + ZERO)};
            }
            case NodeType::WRAP_A:
            case NodeType::WRAP_S:
            case NodeType::WRAP_C:
            case NodeType::WRAP_N:
                return std::move(subres[0]);
            case NodeType::WRAP_D: {
                auto& x = subres[0];
                return {ZERO, x.sat + ONE};
            }
            case NodeType::WRAP_J: {
                auto& x = subres[0];
                // the empty push only dissatisfies if X has a signature-free dissatisfaction too
                return {InputStack(ZERO).SetMalleable(x.nsat.available != Availability::NO && !x.nsat.has_sig), std::move(x.sat)};
            }
            case NodeType::WRAP_V: {
                auto& x = subres[0];
                return {INVALID, std::move(x.sat)};
            }
            case NodeType::JUST_0: return {EMPTY, INVALID};
            case NodeType::JUST_1: return {INVALID, EMPTY};
        }
        throw std::logic_error("Satisfy: unhandled node type");
    }

public:
    Satisfier(const BaseSatisfier& oracle, bool nonmalleable, SatisfactionReport* report) : m_oracle(oracle), m_nonmalleable(nonmalleable), m_report(report) {}

    InputStack Run(const Node& node) const
    {
        return Produce(node).sat;
    }
};

} // namespace

Availability Satisfy(const Node& node, const BaseSatisfier& oracle, std::vector<valtype>& stack, bool nonmalleable, SatisfactionReport* report)
{
    stack.clear();
    InputStack sat = Satisfier(oracle, nonmalleable, report).Run(node);
    if (sat.available == Availability::NO) return Availability::NO;
    if (nonmalleable && sat.malleable) {
        msc_satisfy_logf("only malleable satisfactions exist\n");
        return Availability::NO;
    }
    stack = std::move(sat.stack);
    return Availability::YES;
}

} // namespace msc
