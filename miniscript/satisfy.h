// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_miniscript_satisfy_h_
#define included_msc_miniscript_satisfy_h_

#include <miniscript/miniscript.h>

#include <map>
#include <utility>
#include <vector>

namespace msc {

/** Whether a satisfaction could be produced. NO is the "unsatisfiable" result. */
enum class Availability {
    NO,
    YES,
};

enum class HashType {
    SHA256,
    HASH256,
    RIPEMD160,
    HASH160,
};

/**
 * What is available at spend time. Every query defaults to "no".
 */
class BaseSatisfier {
public:
    virtual ~BaseSatisfier() {}

    /** Produce a signature for key. */
    virtual Availability Sign(const Key& key, valtype& sig) const { return Availability::NO; }

    /** The key behind a pk_h hash. */
    virtual bool LookupKeyHash(const valtype& hash, Key& key) const { return false; }

    /** A preimage of digest under the given hash function. */
    virtual Availability SatHash(HashType type, const valtype& digest, valtype& preimage) const { return Availability::NO; }

    /** Whether the spending input's nSequence satisfies older(n). */
    virtual bool CheckOlder(uint32_t n) const { return false; }

    /** Whether the spending transaction's nLockTime satisfies after(n). */
    virtual bool CheckAfter(uint32_t n) const { return false; }
};

/**
 * A candidate witness for a (sub)fragment, bottom of stack first.
 */
struct InputStack {
    Availability available = Availability::YES;
    //! Needs a signature.
    bool has_sig = false;
    //! A third party could turn it into another valid witness.
    bool malleable = false;
    //! Not the form an honest signer produces; loses ties.
    bool non_canon = false;
    //! Serialized size (each item plus its length byte).
    size_t size = 0;
    std::vector<valtype> stack;

    InputStack() {}
    explicit InputStack(valtype in) : size(in.size() + 1), stack{std::move(in)} {}

    InputStack& SetAvailable(Availability avail);
    InputStack& SetWithSig();
    InputStack& SetNonCanon();
    InputStack& SetMalleable(bool x = true);

    /** a's items below b's; b's items are consumed first. */
    friend InputStack operator+(InputStack a, InputStack b);
};

/** Per node: (dissatisfaction, satisfaction) availability, for display. */
typedef std::map<const Node*, std::pair<Availability, Availability>> SatisfactionReport;

/**
 * Produce the cheapest witness satisfying node. In non-malleable mode only
 * witnesses a third party cannot modify are returned; otherwise the
 * cheapest available witness is. On NO, stack is left empty.
 */
Availability Satisfy(const Node& node, const BaseSatisfier& oracle, std::vector<valtype>& stack, bool nonmalleable = true, SatisfactionReport* report = nullptr);

} // namespace msc

#endif // included_msc_miniscript_satisfy_h_
