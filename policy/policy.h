// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_policy_policy_h_
#define included_msc_policy_policy_h_

#include <miniscript/key.h>
#include <miniscript/miniscript.h>
#include <miniscript/satisfy.h>

#include <cstdint>
#include <string>
#include <vector>

namespace msc {

/** Maximum number of arguments to a policy thresh. */
static const size_t MAX_POLICY_THRESH_ARGS = 100;

/**
 * An abstract spending policy: what has to be provided, without saying how
 * the script checks it.
 */
struct Policy {
    enum class Type {
        NONE,

        TRIVIAL,
        UNSATISFIABLE,
        PK,
        PKH,
        OLDER,
        AFTER,
        SHA256,
        HASH256,
        RIPEMD160,
        HASH160,
        AND,
        OR,
        THRESH
    };

    Type node_type = Type::NONE;
    std::vector<Policy> sub;
    //! Digest for the hash types, key hash for PKH.
    valtype data;
    std::vector<Key> keys;
    //! Relative weights of the OR branches.
    std::vector<uint32_t> prob;
    uint32_t k = 0;

    ~Policy() = default;
    Policy(const Policy& x) = delete;
    Policy& operator=(const Policy& x) = delete;
    Policy& operator=(Policy&& x) = default;
    Policy(Policy&& x) = default;

    explicit Policy(Type nt) : node_type(nt) {}
    explicit Policy(Type nt, uint32_t kv) : node_type(nt), k(kv) {}
    explicit Policy(Type nt, valtype&& dat) : node_type(nt), data(std::move(dat)) {}
    explicit Policy(Type nt, std::vector<Policy>&& subs) : node_type(nt), sub(std::move(subs)) {}
    explicit Policy(Type nt, std::vector<Key>&& key) : node_type(nt), keys(std::move(key)) {}
    explicit Policy(Type nt, std::vector<Policy>&& subs, std::vector<uint32_t>&& probs) : node_type(nt), sub(std::move(subs)), prob(std::move(probs)) {}
    explicit Policy(Type nt, std::vector<Policy>&& subs, uint32_t kv) : node_type(nt), sub(std::move(subs)), k(kv) {}

    bool operator()() const { return node_type != Type::NONE; }

    Policy Clone() const;

    /** Whether what the oracle has is enough to meet this policy. */
    bool Satisfied(const BaseSatisfier& oracle) const;
};

/**
 * Parse a policy, e.g. "or(9@pk(A),and(pk(B),older(144)))". Whitespace is
 * ignored. Throws parse_error with the span of the offending token.
 */
Policy ParsePolicy(const std::string& str, const KeyContext& ctx);

/** Canonical text form; weights are only left out when all of them are 1. */
std::string ToString(const Policy& policy, const KeyContext& ctx);

/**
 * The policy a fragment enforces. Branch weights come out uniform;
 * TRIVIAL and UNSATISFIABLE parts are folded away.
 */
Policy Lift(const Node& node);

} // namespace msc

#endif // included_msc_policy_policy_h_
