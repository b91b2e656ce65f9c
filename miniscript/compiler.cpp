// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <miniscript/compiler.h>

#include <logging.h>
#include <miniscript/codec.h>
#include <miniscript/errors.h>
#include <script/script.h>

#include <tinyformat.h>

#include <algorithm>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <unordered_map>

namespace msc {

namespace {

struct Strat {
    enum class Type {
        JUST_0, JUST_1,
        PK, PKH, MULTI,
        OLDER, AFTER,
        HASH160, HASH256, SHA256, RIPEMD160,
        AND, OR, ANDOR, THRESH,
        WRAP_AS, WRAP_C, WRAP_D, WRAP_V, WRAP_J, WRAP_N, // Several kinds of wrappers that don't change semantics
        ALTERNATIVES, // Every subgraph is a separate compilation strategy; try each once
        CACHE, // sub[0] is the dependency; sub[1] and higher are (possibly self-referential) improvements to try repeatedly until all of them stop improving
    };

    Type node_type;
    std::vector<const Strat*> sub;
    std::vector<Key> keys;
    valtype data;
    uint32_t k = 0;
    double prob = 0;

    explicit Strat(Type nt) : node_type(nt) {}
    explicit Strat(Type nt, uint32_t kv) : node_type(nt), k(kv) {}
    explicit Strat(Type nt, valtype dat) : node_type(nt), data(std::move(dat)) {}
    explicit Strat(Type nt, std::vector<const Strat*> subs) : node_type(nt), sub(std::move(subs)) {}
    explicit Strat(Type nt, std::vector<Key> key) : node_type(nt), keys(std::move(key)) {}
    explicit Strat(Type nt, std::vector<const Strat*> subs, double probs) : node_type(nt), sub(std::move(subs)), prob(probs) {}
    explicit Strat(Type nt, std::vector<const Strat*> subs, uint32_t kv, double probs) : node_type(nt), sub(std::move(subs)), k(kv), prob(probs) {}
    explicit Strat(Type nt, std::vector<Key> key, uint32_t kv) : node_type(nt), keys(std::move(key)), k(kv) {}
};

typedef std::vector<std::unique_ptr<Strat>> StratStore;

template <typename... X>
const Strat* MakeStrat(StratStore& store, X&&... args) {
    Strat* ret = new Strat(std::forward<X>(args)...);
    store.emplace_back(ret);
    return ret;
}

template <typename... X>
Strat* MakeMutStrat(StratStore& store, X&&... args) {
    Strat* ret = new Strat(std::forward<X>(args)...);
    store.emplace_back(ret);
    return ret;
}

/**
 * Builds the strategy graph for a policy: every policy node gets a CACHE
 * strategy listing the ways it can be expressed, plus wrapper
 * improvements. N-ary and/or are split into a first argument and a range
 * covering the rest.
 */
class StrategyBuilder {
    StratStore& m_store;
    std::unordered_map<const Policy*, const Strat*> m_cache;
    std::map<std::pair<const Policy*, size_t>, const Strat*> m_range_cache;

public:
    const Strat* const m_false;
    const Strat* const m_true;

    explicit StrategyBuilder(StratStore& store)
    : m_store(store)
    , m_false(MakeStrat(store, Strat::Type::CACHE, std::vector<const Strat*>{MakeStrat(store, Strat::Type::JUST_0)}))
    , m_true(MakeStrat(store, Strat::Type::CACHE, std::vector<const Strat*>{MakeStrat(store, Strat::Type::JUST_1)}))
    {}

    const Strat* Get(const Policy& node)
    {
        auto it = m_cache.find(&node);
        if (it != m_cache.end()) return it->second;
        auto ret = Compute(node);
        if (ret) m_cache.emplace(&node, ret);
        return ret;
    }

private:
    /** The strategy for and/or over node.sub[start..]. */
    const Strat* Range(const Policy& node, size_t start)
    {
        if (start + 1 == node.sub.size()) return Get(node.sub[start]);
        auto key = std::make_pair(&node, start);
        auto it = m_range_cache.find(key);
        if (it != m_range_cache.end()) return it->second;
        const Strat* ret = node.node_type == Policy::Type::AND ? ComputeAnd(node, start) : ComputeOr(node, start);
        if (ret) m_range_cache.emplace(key, ret);
        return ret;
    }

    /** Split an AND policy into its first argument and the rest. */
    bool SplitAnd(const Policy& node, const Strat*& left, const Strat*& right)
    {
        if (node.node_type != Policy::Type::AND || node.sub.size() < 2) return false;
        left = Get(node.sub[0]);
        right = Range(node, 1);
        return left && right;
    }

    const Strat* ComputeAnd(const Policy& node, size_t start)
    {
        std::vector<const Strat*> strats;
        const auto left = Get(node.sub[start]);
        const auto right = Range(node, start + 1);
        if (!left || !right) return {};
        strats.push_back(MakeStrat(m_store, Strat::Type::AND, std::vector<const Strat*>{left, right})); // and(X,Y)
        strats.push_back(MakeStrat(m_store, Strat::Type::ANDOR, std::vector<const Strat*>{left, right, m_false}, 1.0)); // or(and(X,Y),0)
        return Finish(std::move(strats));
    }

    const Strat* ComputeOr(const Policy& node, size_t start)
    {
        std::vector<const Strat*> strats;
        double total = 0;
        for (size_t i = start; i < node.prob.size(); ++i) total += node.prob[i];
        double prob = node.prob[start] / total;
        const auto left = Get(node.sub[start]);
        const auto right = Range(node, start + 1);
        if (!left || !right) return {};
        const Strat* leftleft;
        const Strat* leftright;
        if (SplitAnd(node.sub[start], leftleft, leftright)) {
            strats.push_back(MakeStrat(m_store, Strat::Type::ANDOR, std::vector<const Strat*>{leftleft, leftright, right}, prob));
        }
        const Strat* rightleft;
        const Strat* rightright;
        if (start + 2 == node.sub.size() && SplitAnd(node.sub[start + 1], rightleft, rightright)) {
            strats.push_back(MakeStrat(m_store, Strat::Type::ANDOR, std::vector<const Strat*>{rightleft, rightright, left}, 1.0 - prob));
        }
        strats.push_back(MakeStrat(m_store, Strat::Type::ANDOR, std::vector<const Strat*>{left, m_true, right}, prob));
        strats.push_back(MakeStrat(m_store, Strat::Type::OR, std::vector<const Strat*>{left, right}, prob));
        return Finish(std::move(strats));
    }

    const Strat* Compute(const Policy& node)
    {
        std::vector<const Strat*> strats;
        switch (node.node_type) {
            case Policy::Type::NONE:
                return {};
            case Policy::Type::TRIVIAL:
                return m_true;
            case Policy::Type::UNSATISFIABLE:
                return m_false;
            case Policy::Type::PK:
                strats.push_back(MakeStrat(m_store, Strat::Type::PK, node.keys));
                break;
            case Policy::Type::PKH:
                strats.push_back(MakeStrat(m_store, Strat::Type::PKH, node.data));
                break;
            case Policy::Type::OLDER:
                strats.push_back(MakeStrat(m_store, Strat::Type::OLDER, node.k));
                break;
            case Policy::Type::AFTER:
                strats.push_back(MakeStrat(m_store, Strat::Type::AFTER, node.k));
                break;
            case Policy::Type::HASH256:
                strats.push_back(MakeStrat(m_store, Strat::Type::HASH256, node.data));
                break;
            case Policy::Type::HASH160:
                strats.push_back(MakeStrat(m_store, Strat::Type::HASH160, node.data));
                break;
            case Policy::Type::SHA256:
                strats.push_back(MakeStrat(m_store, Strat::Type::SHA256, node.data));
                break;
            case Policy::Type::RIPEMD160:
                strats.push_back(MakeStrat(m_store, Strat::Type::RIPEMD160, node.data));
                break;
            case Policy::Type::AND:
            case Policy::Type::OR:
                if (node.sub.empty()) return {};
                return Range(node, 0);
            case Policy::Type::THRESH: {
                std::vector<const Strat*> subs;
                std::transform(node.sub.begin(), node.sub.end(), std::back_inserter(subs), [&](const Policy& x){ return Get(x); });
                for (const auto& s : subs) {
                    if (!s) return {};
                }
                if (node.sub.size() <= (size_t)MAX_PUBKEYS_PER_MULTISIG && std::all_of(node.sub.begin(), node.sub.end(), [&](const Policy& x){ return x.node_type == Policy::Type::PK; })) {
                    std::vector<Key> keys;
                    for (const Policy& x : node.sub) {
                        keys.push_back(x.keys[0]);
                    }
                    strats.push_back(MakeStrat(m_store, Strat::Type::MULTI, std::move(keys), node.k));
                }
                if (node.k > 1 && node.k < node.sub.size()) {
                    strats.push_back(MakeStrat(m_store, Strat::Type::THRESH, subs, node.k, (double)node.k / subs.size()));
                }
                if (node.k == 1 || node.k == node.sub.size()) {
                    while (subs.size() > 1) {
                        auto rep = MakeStrat(m_store, node.k == 1 ? Strat::Type::OR : Strat::Type::AND, std::vector<const Strat*>{*(subs.rbegin() + 1), subs.back()}, 1.0 / subs.size());
                        subs.pop_back();
                        subs.pop_back();
                        subs.push_back(MakeStrat(m_store, Strat::Type::CACHE, std::vector<const Strat*>{rep}));
                    }
                    strats.push_back(subs[0]);
                }
                break;
            }
        }
        return Finish(std::move(strats));
    }

    const Strat* Finish(std::vector<const Strat*> strats)
    {
        if (strats.size() != 1) {
            auto sub = std::move(strats);
            strats.clear();
            strats.push_back(MakeStrat(m_store, Strat::Type::ALTERNATIVES, std::move(sub)));
        }

        auto ret = MakeMutStrat(m_store, Strat::Type::CACHE, std::move(strats));
        ret->sub.push_back(MakeStrat(m_store, Strat::Type::WRAP_C, std::vector<const Strat*>{ret}));
        ret->sub.push_back(MakeStrat(m_store, Strat::Type::WRAP_V, std::vector<const Strat*>{ret}));
        ret->sub.push_back(MakeStrat(m_store, Strat::Type::AND, std::vector<const Strat*>{ret, m_true}));
        ret->sub.push_back(MakeStrat(m_store, Strat::Type::WRAP_N, std::vector<const Strat*>{ret}));
        ret->sub.push_back(MakeStrat(m_store, Strat::Type::WRAP_D, std::vector<const Strat*>{ret}));
        ret->sub.push_back(MakeStrat(m_store, Strat::Type::WRAP_J, std::vector<const Strat*>{ret}));
        ret->sub.push_back(MakeStrat(m_store, Strat::Type::OR, std::vector<const Strat*>{ret, m_false}, 1.0));
        ret->sub.push_back(MakeStrat(m_store, Strat::Type::WRAP_AS, std::vector<const Strat*>{ret}));

        return ret;
    }
};

/**
 * A fragment under consideration. Sub-candidates are shared between the
 * many compositions tried; only the winner is turned into a Node.
 */
struct Candidate;
typedef std::shared_ptr<const Candidate> CandidateRef;

struct Candidate {
    NodeType nodetype;
    std::vector<CandidateRef> subs;
    std::vector<Key> keys;
    valtype data;
    uint32_t k;
    Type typ;
    size_t scriptlen;
    Ops ops;
    StackSize ss;

    Candidate(NodeType nt, std::vector<CandidateRef> sub, std::vector<Key> key, valtype arg, uint32_t val, Type t, size_t len, Ops o, StackSize s)
    : nodetype(nt), subs(std::move(sub)), keys(std::move(key)), data(std::move(arg)), k(val), typ(t), scriptlen(len), ops(o), ss(s) {}
};

/** Returns nullptr if the composition is ill-typed. */
CandidateRef MakeCandidate(NodeType nt, std::vector<CandidateRef> subs, std::vector<Key> keys, valtype data, uint32_t k)
{
    std::vector<Type> sub_types;
    std::vector<Ops> sub_ops;
    std::vector<StackSize> sub_ss;
    size_t subsize = 0;
    for (const auto& sub : subs) {
        sub_types.push_back(sub->typ);
        sub_ops.push_back(sub->ops);
        sub_ss.push_back(sub->ss);
        subsize += sub->scriptlen;
    }
    Type x = sub_types.size() > 0 ? sub_types[0] : ""_mst;
    Type y = sub_types.size() > 1 ? sub_types[1] : ""_mst;
    Type z = sub_types.size() > 2 ? sub_types[2] : ""_mst;
    Type typ = SanitizeType(ComputeType(nt, x, y, z, sub_types, k, subs.size(), keys.size()));
    if (typ == ""_mst) return nullptr;
    size_t scriptlen = ComputeScriptLen(nt, x, subsize, k, subs.size(), keys.size());
    Ops ops = ComputeOps(nt, x, sub_ops, k, keys.size());
    StackSize ss = ComputeStackSize(nt, sub_ss, k);
    return std::make_shared<const Candidate>(nt, std::move(subs), std::move(keys), std::move(data), k, typ, scriptlen, ops, ss);
}

NodeRef Materialize(const Candidate& candidate)
{
    std::vector<NodeRef> subs;
    for (const auto& sub : candidate.subs) subs.push_back(Materialize(*sub));
    return MakeNode(candidate.nodetype, std::move(subs), candidate.keys, candidate.data, candidate.k);
}

struct CostPair {
    double sat;
    double nsat;

    constexpr CostPair(double s, double n) : sat(s), nsat(n) {}
};

struct Result {
    CandidateRef node;
    //! Expected witness sizes given the branch probabilities.
    CostPair pair;
    //! Largest witness sizes any branch choice can lead to.
    CostPair worst;
    double cost;
    double worst_cost;

    Result(CandidateRef in_node, const CostPair& in_pair, const CostPair& in_worst, double in_cost, double in_worst_cost)
    : node(std::move(in_node)), pair(in_pair), worst(in_worst), cost(in_cost), worst_cost(in_worst_cost) {}
};

/** Order by expected cost, then worst case cost, then script bytes. */
int Compare(const Result& a, const Result& b)
{
    if (a.cost < b.cost) return -1;
    if (a.cost > b.cost) return 1;
    if (a.worst_cost < b.worst_cost) return -1;
    if (a.worst_cost > b.worst_cost) return 1;
    if (a.node == b.node) return 0;
    Script script_a = ToScript(*Materialize(*a.node));
    Script script_b = ToScript(*Materialize(*b.node));
    if (script_a < script_b) return -1;
    if (script_b < script_a) return 1;
    return 0;
}

double inline Mul(double coef, double val) {
    if (coef == 0) return 0;
    return coef * val;
}

typedef std::pair<Type, Type> TypeFilter; // First element is required type properties; second one is which one we care about

constexpr TypeFilter ParseFilter(const char *c, size_t len, size_t split) {
    return c[split] == '/' ? TypeFilter{operator"" _mst(c, split), operator"" _mst(c + split + 1, len - split - 1)} :
           split == len ? TypeFilter{operator"" _mst(c, len), ""_mst} : ParseFilter(c, len, split + 1);
}

constexpr TypeFilter operator"" _mstf(const char* c, size_t len) { return ParseFilter(c, len, 0); }

struct Compilation {
    std::vector<Result> results;
    double p, q;
    int seq = 0;

    Compilation(double p_, double q_) : p(p_), q(q_) {}

    double Cost(const CostPair& pair, const Candidate& node) const {
        return node.scriptlen + Mul(p, pair.sat) + Mul(q, pair.nsat);
    }

    double WorstCost(const CostPair& worst, const Candidate& node) const {
        return node.scriptlen + std::max(p > 0 ? worst.sat : 0.0, q > 0 ? worst.nsat : 0.0);
    }

    void Add(const CostPair& pair, const CostPair& worst, CandidateRef node, const CostModel& model) {
        auto new_typ = node->typ;
        if (!(new_typ << "mk"_mst)) return;
        if (node->ops.sat.valid && node->ops.count + node->ops.sat.value > (uint32_t)MAX_OPS_PER_SCRIPT) return;
        if (node->ss.sat.valid && node->ss.sat.value > MAX_STANDARD_P2WSH_STACK_ITEMS) return;
        double cost = Cost(pair, *node);
        if (cost > model.max_cost) return;
        double worst_cost = WorstCost(worst, *node);
        Result res(std::move(node), pair, worst, cost, worst_cost);
        for (const Result& x : results) {
            auto old_typ = x.node->typ;
            if (old_typ << new_typ && Compare(x, res) <= 0) return; // There is an existing element that's a subtype and better. New item is not useful.
        }
        // We're at least better in some conditions.
        results.erase(std::remove_if(results.begin(), results.end(), [&](const Result& x){
            auto old_typ = x.node->typ;
            return (new_typ << old_typ && Compare(x, res) >= 0); // Delete existing types which are supertypes of the new type and worse.
        }), results.end());
        // Add the new item.
        results.push_back(std::move(res));
        ++seq;
    }

    void Add(const Result& x, const CostModel& model) { Add(x.pair, x.worst, x.node, model); }

    std::vector<Result> Query(const TypeFilter typ) const {
        std::map<Type, Result> rm;
        for (const Result& x : results) {
            if (x.node->typ << typ.first) {
                auto masked = x.node->typ & typ.second;
                auto r = rm.emplace(masked, x);
                if (!r.second && Compare(x, r.first->second) < 0) r.first->second = x;
            }
        }
        std::vector<Result> ret;
        for (const auto& elem : rm) ret.push_back(elem.second);
        return ret;
    }
};

struct CompilationKey {
    const Strat* strat;
    double p, q;

    bool operator<(const CompilationKey& other) const {
        if (strat < other.strat) return true;
        if (strat > other.strat) return false;
        if (p < other.p) return true;
        if (p > other.p) return false;
        return q < other.q;
    }
};

struct CompileState {
    const CostModel& model;
    std::map<CompilationKey, Compilation> cache;

    explicit CompileState(const CostModel& in_model) : model(in_model) {}
};

const Compilation& GetCompilation(const Strat* strat, double p, double q, CompileState& state);
void CompileStrat(const Strat* strat, Compilation& compilation, CompileState& state);

constexpr double INF = std::numeric_limits<double>::infinity();

CostPair CalcCostPair(NodeType nt, const std::vector<const Result*>& s, double l, uint32_t k, const CostModel& model) {
    double r = 1.0 - l;
    if (nt != NodeType::OR_B && nt != NodeType::OR_D && nt != NodeType::OR_C && nt != NodeType::OR_I && nt != NodeType::THRESH && nt != NodeType::ANDOR && l != 0) {
        throw std::logic_error("CalcCostPair: branch probability given for a non-branching fragment");
    }
    switch (nt) {
        case NodeType::PK_K: return {model.sig_size, 1};
        case NodeType::PK_H: return {model.sig_size + model.pk_size, 1 + model.pk_size};
        case NodeType::OLDER:
        case NodeType::AFTER:
            return {0, INF};
        case NodeType::HASH256:
        case NodeType::HASH160:
        case NodeType::SHA256:
        case NodeType::RIPEMD160:
            return {model.preimage_size, model.hash_dsat_size};
        case NodeType::WRAP_A:
        case NodeType::WRAP_S:
        case NodeType::WRAP_C:
        case NodeType::WRAP_N:
            return s[0]->pair;
        case NodeType::WRAP_D: return {2 + s[0]->pair.sat, 1};
        case NodeType::WRAP_V: return {s[0]->pair.sat, INF};
        case NodeType::WRAP_J: return {s[0]->pair.sat, 1};
        case NodeType::JUST_1: return {0, INF};
        case NodeType::JUST_0: return {INF, 0};
        case NodeType::AND_V: return {s[0]->pair.sat + s[1]->pair.sat, INF};
        case NodeType::AND_B: return {s[0]->pair.sat + s[1]->pair.sat, s[0]->pair.nsat + s[1]->pair.nsat};
        case NodeType::OR_B:
            return {Mul(l, s[0]->pair.sat + s[1]->pair.nsat) + Mul(r, s[0]->pair.nsat + s[1]->pair.sat), s[0]->pair.nsat + s[1]->pair.nsat};
        case NodeType::OR_D:
        case NodeType::OR_C:
            return {Mul(l, s[0]->pair.sat) + Mul(r, s[0]->pair.nsat + s[1]->pair.sat), s[0]->pair.nsat + s[1]->pair.nsat};
        case NodeType::OR_I:
            return {Mul(l, s[0]->pair.sat + 2) + Mul(r, s[1]->pair.sat + 1), std::min(2 + s[0]->pair.nsat, 1 + s[1]->pair.nsat)};
        case NodeType::ANDOR:
            return {Mul(l, s[0]->pair.sat + s[1]->pair.sat) + Mul(r, s[0]->pair.nsat + s[2]->pair.sat), s[0]->pair.nsat + s[2]->pair.nsat};
        case NodeType::MULTI: return CostPair{1.0 + k * model.sig_size, 1.0 + k};
        case NodeType::THRESH: {
            double sat = 0.0, nsat = 0.0;
            for (const auto& sub : s) {
                sat += sub->pair.sat;
                nsat += sub->pair.nsat;
            }
            return CostPair{Mul(l, sat) + Mul(r, nsat), nsat};
        }
    }
    throw std::logic_error("CalcCostPair: unhandled node type");
}

/** The larger of two witness sizes, ignoring an impossible one. */
double MaxPossible(double a, double b) {
    if (a == INF) return b;
    if (b == INF) return a;
    return std::max(a, b);
}

CostPair CalcWorstPair(NodeType nt, const std::vector<const Result*>& s, uint32_t k, const CostModel& model) {
    switch (nt) {
        case NodeType::PK_K:
        case NodeType::PK_H:
        case NodeType::OLDER:
        case NodeType::AFTER:
        case NodeType::HASH256:
        case NodeType::HASH160:
        case NodeType::SHA256:
        case NodeType::RIPEMD160:
        case NodeType::JUST_1:
        case NodeType::JUST_0:
        case NodeType::MULTI:
            return CalcCostPair(nt, s, 0, k, model);
        case NodeType::WRAP_A:
        case NodeType::WRAP_S:
        case NodeType::WRAP_C:
        case NodeType::WRAP_N:
            return s[0]->worst;
        case NodeType::WRAP_D: return {2 + s[0]->worst.sat, 1};
        case NodeType::WRAP_V: return {s[0]->worst.sat, INF};
        case NodeType::WRAP_J: return {s[0]->worst.sat, 1};
        case NodeType::AND_V: return {s[0]->worst.sat + s[1]->worst.sat, INF};
        case NodeType::AND_B: return {s[0]->worst.sat + s[1]->worst.sat, s[0]->worst.nsat + s[1]->worst.nsat};
        case NodeType::OR_B:
            return {MaxPossible(s[0]->worst.sat + s[1]->worst.nsat, s[0]->worst.nsat + s[1]->worst.sat), s[0]->worst.nsat + s[1]->worst.nsat};
        case NodeType::OR_D:
        case NodeType::OR_C:
            return {MaxPossible(s[0]->worst.sat, s[0]->worst.nsat + s[1]->worst.sat), s[0]->worst.nsat + s[1]->worst.nsat};
        case NodeType::OR_I:
            return {MaxPossible(s[0]->worst.sat + 2, s[1]->worst.sat + 1), std::min(2 + s[0]->worst.nsat, 1 + s[1]->worst.nsat)};
        case NodeType::ANDOR:
            return {MaxPossible(s[0]->worst.sat + s[1]->worst.sat, s[0]->worst.nsat + s[2]->worst.sat), s[0]->worst.nsat + s[2]->worst.nsat};
        case NodeType::THRESH: {
            // all dissatisfied, plus the k most expensive switches to satisfaction
            double nsat = 0.0;
            std::vector<double> extra;
            for (const auto& sub : s) {
                nsat += sub->worst.nsat;
                if (sub->worst.sat != INF) extra.push_back(sub->worst.sat - sub->worst.nsat);
            }
            if (extra.size() < k) return CostPair{INF, nsat};
            std::sort(extra.begin(), extra.end(), std::greater<double>());
            double sat = nsat;
            for (uint32_t i = 0; i < k; ++i) sat += extra[i];
            return CostPair{sat, nsat};
        }
    }
    throw std::logic_error("CalcWorstPair: unhandled node type");
}

std::pair<std::vector<double>, std::vector<double>> GetPQs(NodeType nt, double p, double q, double l, int m) {
    static const std::pair<std::vector<double>, std::vector<double>> NONE;
    double r = 1.0 - l;
    switch (nt) {
        case NodeType::JUST_1:
        case NodeType::JUST_0:
        case NodeType::PK_K:
        case NodeType::PK_H:
        case NodeType::MULTI:
        case NodeType::OLDER:
        case NodeType::AFTER:
        case NodeType::HASH256:
        case NodeType::HASH160:
        case NodeType::SHA256:
        case NodeType::RIPEMD160:
            return NONE;
        case NodeType::WRAP_A:
        case NodeType::WRAP_S:
        case NodeType::WRAP_C:
        case NodeType::WRAP_N:
            return {{p}, {q}};
        case NodeType::WRAP_D:
        case NodeType::WRAP_V:
        case NodeType::WRAP_J:
            return {{p}, {0}};
        case NodeType::AND_V:
        case NodeType::AND_B:
            return {{p, p}, {q, q}};
        case NodeType::OR_B: return {{l*p, r*p}, {r*p + q, l*p + q}};
        case NodeType::OR_D: return {{l*p, r*p}, {r*p + q, q}};
        case NodeType::OR_C: return {{l*p, r*p}, {r*p, 0}};
        case NodeType::OR_I: return {{l*p, r*p}, {m == 0 ? q : 0, m == 1 ? q : 0}};
        case NodeType::ANDOR: return {{l*p, l*p, r*p}, {q + r*p, 0, q}};
        case NodeType::THRESH: return {std::vector<double>(m, p * l), std::vector<double>(m, q + p * r)};
    }
    throw std::logic_error("GetPQs: unhandled node type");
}

typedef std::vector<std::vector<TypeFilter>> TypeFilters;

const TypeFilters& GetTypeFilter(NodeType nt) {
    static const TypeFilters FILTER_NO{{}};
    static const TypeFilters FILTER_WRAP_A{{"B/udfems"_mstf}};
    static const TypeFilters FILTER_WRAP_S{{"Bo/udfemsx"_mstf}};
    static const TypeFilters FILTER_WRAP_C{{"K/onde"_mstf}};
    static const TypeFilters FILTER_WRAP_D{{"V/zfms"_mstf}};
    static const TypeFilters FILTER_WRAP_V{{"B/zonmsx"_mstf}};
    static const TypeFilters FILTER_WRAP_J{{"Bn/oufms"_mstf}};
    static const TypeFilters FILTER_WRAP_N{{"B/zondfems"_mstf}};
    static const TypeFilters FILTER_AND_V{
        {"V/nzoms"_mstf, "B/unzofmsx"_mstf},
        {"V/nsoms"_mstf, "K/unzofmsx"_mstf},
        {"V/nzoms"_mstf, "V/unzofmsx"_mstf}
    };
    static const TypeFilters FILTER_AND_B{{"B/zondfems"_mstf, "W/zondfems"_mstf}};
    static const TypeFilters FILTER_OR_B{{"Bde/zoms"_mstf, "Wde/zoms"_mstf}};
    static const TypeFilters FILTER_OR_D{{"Bdue/zoms"_mstf, "B/zoudfems"_mstf}};
    static const TypeFilters FILTER_OR_C{{"Bdue/zoms"_mstf, "V/zoms"_mstf}};
    static const TypeFilters FILTER_OR_I{
        {"V/zudfems"_mstf, "V/zudfems"_mstf},
        {"B/zudfems"_mstf, "B/zudfems"_mstf},
        {"K/zudfems"_mstf, "K/zudfems"_mstf}
    };
    static const TypeFilters FILTER_ANDOR{
        {"Bdue/zoms"_mstf, "B/zoufms"_mstf, "B/zoudfems"_mstf},
        {"Bdue/zoms"_mstf, "K/zoufms"_mstf, "K/zoudfems"_mstf},
        {"Bdue/zoms"_mstf, "V/zoufms"_mstf, "V/zoudfems"_mstf}
    };

    switch (nt) {
        case NodeType::JUST_1:
        case NodeType::JUST_0:
        case NodeType::PK_K:
        case NodeType::PK_H:
        case NodeType::MULTI:
        case NodeType::OLDER:
        case NodeType::AFTER:
        case NodeType::HASH256:
        case NodeType::HASH160:
        case NodeType::SHA256:
        case NodeType::RIPEMD160:
            return FILTER_NO;
        case NodeType::WRAP_A: return FILTER_WRAP_A;
        case NodeType::WRAP_S: return FILTER_WRAP_S;
        case NodeType::WRAP_C: return FILTER_WRAP_C;
        case NodeType::WRAP_D: return FILTER_WRAP_D;
        case NodeType::WRAP_V: return FILTER_WRAP_V;
        case NodeType::WRAP_J: return FILTER_WRAP_J;
        case NodeType::WRAP_N: return FILTER_WRAP_N;
        case NodeType::AND_V: return FILTER_AND_V;
        case NodeType::AND_B: return FILTER_AND_B;
        case NodeType::OR_B: return FILTER_OR_B;
        case NodeType::OR_C: return FILTER_OR_C;
        case NodeType::OR_D: return FILTER_OR_D;
        case NodeType::OR_I: return FILTER_OR_I;
        case NodeType::ANDOR: return FILTER_ANDOR;
        case NodeType::THRESH: break;
    }
    throw std::logic_error("GetTypeFilter: no filter for this node type");
}

void AddInner(Compilation& compilation, CompileState& state, NodeType nt, const std::vector<const Result*>& resp, double prob, const std::vector<Key>& keys, const valtype& data, uint32_t k) {
    std::vector<CandidateRef> subs;
    for (const Result* res : resp) subs.push_back(res->node);
    auto node = MakeCandidate(nt, std::move(subs), keys, data, k);
    if (!node) return;
    compilation.Add(CalcCostPair(nt, resp, prob, k, state.model), CalcWorstPair(nt, resp, k, state.model), std::move(node), state.model);
}

void Add(Compilation& compilation, CompileState& state, NodeType nt, const std::vector<const Strat*>& s, double prob, int m, const std::vector<Key>& keys = {}, const valtype& data = {}, uint32_t k = 0) {
    auto pqs = GetPQs(nt, compilation.p, compilation.q, prob, m);
    const auto& filter = GetTypeFilter(nt);
    std::vector<const Result*> resp;
    resp.resize(s.size());
    for (size_t j = 0; j < filter.size(); ++j) {
        std::vector<std::vector<Result>> res;
        uint32_t num_comb = 1;
        if (s.size() != filter[j].size()) throw std::logic_error("Add: strategy and filter arity differ");
        for (size_t i = 0; i < s.size(); ++i) {
            const Compilation& subcomp = GetCompilation(s[i], pqs.first[i], pqs.second[i], state);
            res.push_back(subcomp.Query(filter[j][i]));
            num_comb *= res.back().size();
        }
        for (uint32_t comb = 0; comb < num_comb; ++comb) {
            uint32_t c = comb;
            for (size_t i = 0; i < s.size(); ++i) {
                resp[i] = &res[i][c % res[i].size()];
                c /= res[i].size();
            }
            AddInner(compilation, state, nt, resp, prob, keys, data, k);
        }
    }
}

const Compilation& GetCompilation(const Strat* strat, double p, double q, CompileState& state) {
    if (strat->node_type != Strat::Type::CACHE) throw std::logic_error("GetCompilation: not a CACHE strategy");
    CompilationKey key{strat, p, q};
    auto it = state.cache.find(key);
    if (it != state.cache.end()) return it->second;
    Compilation new_entry(p, q);
    CompileStrat(strat->sub[0], new_entry, state);
    auto it2 = state.cache.emplace(key, std::move(new_entry));
    Compilation &result = it2.first->second;
    if (strat->sub.size() > 1) {
        size_t last = 1, pos = 1;
        do {
            int prevseq = result.seq;
            CompileStrat(strat->sub[pos], result, state);
            if (result.seq != prevseq) last = pos;
            ++pos;
            if (pos == strat->sub.size()) pos = 1;
        } while (pos != last);
    }

    return result;
}

void CompileStrat(const Strat* strat, Compilation& compilation, CompileState& state) {
    double p = compilation.p, q = compilation.q;
    switch (strat->node_type) {
        case Strat::Type::ALTERNATIVES:
            for (const auto& x : strat->sub) {
                CompileStrat(x, compilation, state);
            }
            return;
        case Strat::Type::CACHE: {
            const Compilation& sub = GetCompilation(strat, p, q, state);
            for (const Result& x : sub.results) {
                compilation.Add(x, state.model);
            }
            return;
        }
        case Strat::Type::JUST_0:
            Add(compilation, state, NodeType::JUST_0, strat->sub, 0, 0);
            return;
        case Strat::Type::JUST_1:
            Add(compilation, state, NodeType::JUST_1, strat->sub, 0, 0);
            return;
        case Strat::Type::AFTER:
        case Strat::Type::OLDER:
            Add(compilation, state, strat->node_type == Strat::Type::OLDER ? NodeType::OLDER : NodeType::AFTER, strat->sub, 0, 0, {}, {}, strat->k);
            return;
        case Strat::Type::HASH160:
            Add(compilation, state, NodeType::HASH160, strat->sub, 0, 0, {}, strat->data);
            return;
        case Strat::Type::HASH256:
            Add(compilation, state, NodeType::HASH256, strat->sub, 0, 0, {}, strat->data);
            return;
        case Strat::Type::RIPEMD160:
            Add(compilation, state, NodeType::RIPEMD160, strat->sub, 0, 0, {}, strat->data);
            return;
        case Strat::Type::SHA256:
            Add(compilation, state, NodeType::SHA256, strat->sub, 0, 0, {}, strat->data);
            return;
        case Strat::Type::PK:
            Add(compilation, state, NodeType::PK_K, strat->sub, 0, 0, strat->keys);
            Add(compilation, state, NodeType::PK_H, strat->sub, 0, 0, {}, strat->keys[0].GetHash160());
            return;
        case Strat::Type::PKH:
            Add(compilation, state, NodeType::PK_H, strat->sub, 0, 0, {}, strat->data);
            return;
        case Strat::Type::MULTI:
            Add(compilation, state, NodeType::MULTI, strat->sub, 0, 0, strat->keys, {}, strat->k);
            return;
        case Strat::Type::WRAP_AS:
            Add(compilation, state, NodeType::WRAP_A, strat->sub, 0, 0);
            Add(compilation, state, NodeType::WRAP_S, strat->sub, 0, 0);
            return;
        case Strat::Type::WRAP_C:
            Add(compilation, state, NodeType::WRAP_C, strat->sub, 0, 0);
            return;
        case Strat::Type::WRAP_D:
            Add(compilation, state, NodeType::WRAP_D, strat->sub, 0, 0);
            return;
        case Strat::Type::WRAP_N:
            Add(compilation, state, NodeType::WRAP_N, strat->sub, 0, 0);
            return;
        case Strat::Type::WRAP_J:
            Add(compilation, state, NodeType::WRAP_J, strat->sub, 0, 0);
            return;
        case Strat::Type::WRAP_V:
            Add(compilation, state, NodeType::WRAP_V, strat->sub, 0, 0);
            return;
        case Strat::Type::AND: {
            const auto& sub = strat->sub;
            const std::vector<const Strat*> rev{sub[1], sub[0]};
            if (q == 0) {
                Add(compilation, state, NodeType::AND_V, sub, 0, 0);
                Add(compilation, state, NodeType::AND_V, rev, 0, 0);
            }
            Add(compilation, state, NodeType::AND_B, sub, 0, 0);
            Add(compilation, state, NodeType::AND_B, rev, 0, 0);
            return;
        }
        case Strat::Type::OR: {
            const auto& sub = strat->sub;
            const std::vector<const Strat*> rev{sub[1], sub[0]};
            double l = strat->prob, r = 1.0 - l;
            if (q == 0) {
                Add(compilation, state, NodeType::OR_C, sub, l, 0);
                Add(compilation, state, NodeType::OR_C, rev, r, 0);
            }
            Add(compilation, state, NodeType::OR_B, sub, l, 0);
            Add(compilation, state, NodeType::OR_B, rev, r, 0);
            Add(compilation, state, NodeType::OR_D, sub, l, 0);
            Add(compilation, state, NodeType::OR_D, rev, r, 0);
            Add(compilation, state, NodeType::OR_I, sub, l, 0);
            Add(compilation, state, NodeType::OR_I, rev, r, 0);
            Add(compilation, state, NodeType::OR_I, sub, l, 1);
            Add(compilation, state, NodeType::OR_I, rev, r, 1);
            return;
        }
        case Strat::Type::ANDOR: {
            const auto& sub = strat->sub;
            const std::vector<const Strat*> rev{sub[1], sub[0], sub[2]};
            double l = strat->prob;
            Add(compilation, state, NodeType::ANDOR, sub, l, 0);
            Add(compilation, state, NodeType::ANDOR, rev, l, 0);
            return;
        }
        case Strat::Type::THRESH: {
            auto pqs = GetPQs(NodeType::THRESH, p, q, strat->prob, (int)strat->sub.size());
            std::vector<Result> Bs, Ws;
            int B_pos = -1;
            double cost_diff = -1.0;
            for (size_t i = 0; i < strat->sub.size(); ++i) {
                const Compilation& comp = GetCompilation(strat->sub[i], pqs.first[i], pqs.second[i], state);
                auto res_B = comp.Query("Bemdu"_mstf);
                if (res_B.size() == 0) {
                    msc_compile_logf("thresh: cannot compile argument %d as B\n", (int)i);
                    return;
                }
                Bs.push_back(std::move(res_B[0]));
                auto res_W = comp.Query("Wemdu"_mstf);
                if (res_W.size() == 0) {
                    msc_compile_logf("thresh: cannot compile argument %d as W\n", (int)i);
                    return;
                }
                Ws.push_back(std::move(res_W[0]));
                if (Ws.back().cost - Bs.back().cost > cost_diff) {
                    cost_diff = Ws.back().cost - Bs.back().cost;
                    B_pos = i;
                }
            }
            std::vector<const Result*> resp;
            resp.push_back(&Bs[B_pos]);
            for (size_t i = 0; i < strat->sub.size(); ++i) {
                if ((int)i != B_pos) resp.push_back(&Ws[i]);
            }
            AddInner(compilation, state, NodeType::THRESH, resp, strat->prob, {}, {}, strat->k);
            return;
        }
    }
}

/** Compile without error reporting; returns false if nothing acceptable exists. */
bool TryCompile(const Policy& policy, const CostModel& model, NodeRef& ret, double& avgcost)
{
    StratStore store;
    const Strat* strat = StrategyBuilder(store).Get(policy);
    if (!strat) return false;

    CompileState state(model);
    const Compilation& compilation = GetCompilation(strat, 1.0, 0.0, state);

    TypeFilter root{model.require_safe ? "Bmks"_mst : "Bmk"_mst, ""_mst};
    auto res = compilation.Query(root);
    if (res.size() != 1) return false;
    ret = Materialize(*res[0].node);
    avgcost = res[0].pair.sat;
    if (msc_enabled(msc_compile_logf)) {
        msc_compile_logf("compiled: %u strategies, %u compilations, cost %f (worst %f)\n", (unsigned)store.size(), (unsigned)state.cache.size(), res[0].cost, res[0].worst_cost);
    }
    return true;
}

/** The smallest sub-policy of policy that fails to compile on its own. */
const Policy& FindFailing(const Policy& policy, const CostModel& model)
{
    for (const auto& sub : policy.sub) {
        NodeRef node;
        double avgcost;
        if (!TryCompile(sub, model, node, avgcost)) return FindFailing(sub, model);
    }
    return policy;
}

} // namespace

NodeRef Compile(const Policy& policy, double& avgcost, const CostModel& model, const KeyContext* ctx)
{
    HexKeyContext hex_ctx;
    const KeyContext& print_ctx = ctx ? *ctx : hex_ctx;
    if (!policy()) throw compile_error("empty policy", "");
    NodeRef ret;
    if (!TryCompile(policy, model, ret, avgcost)) {
        const Policy& failing = FindFailing(policy, model);
        std::string reason = &failing == &policy ? "no well-typed, non-malleable compilation within the resource limits" : "sub-policy has no well-typed, non-malleable compilation within the resource limits";
        throw compile_error(reason, ToString(failing, print_ctx));
    }
    if (ret->ScriptSize() > MAX_STANDARD_P2WSH_SCRIPT_SIZE) {
        throw compile_error(strprintf("script is %u bytes, exceeding the standard limit of %u", ret->ScriptSize(), MAX_STANDARD_P2WSH_SCRIPT_SIZE), ToString(policy, print_ctx));
    }
    return ret;
}

} // namespace msc
