// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_miniscript_oracle_h_
#define included_msc_miniscript_oracle_h_

#include <miniscript/satisfy.h>
#include <script/interpreter.h>

#include <set>
#include <vector>

namespace msc {

/**
 * A DER-shaped 72 byte stand-in signature for key (SIGHASH_ALL). Nothing is
 * signed; PretendSignatureChecker accepts exactly these.
 */
valtype PretendSignature(const Key& key);

/** Whether an input with the given nSequence satisfies a relative lock of n. */
bool SequenceSatisfies(uint32_t sequence, int64_t n);

/** Whether a transaction with the given nLockTime satisfies an absolute lock of n. */
bool LockTimeSatisfies(uint32_t locktime, int64_t n);

/**
 * A satisfier over a fixed inventory: the keys that can sign, the known
 * preimages, and the nSequence and nLockTime of the spend.
 */
class InventorySatisfier : public BaseSatisfier {
public:
    std::set<Key> signers;
    std::vector<valtype> preimages;
    //! Relative locks are unusable by default.
    uint32_t sequence = SEQUENCE_LOCKTIME_DISABLE_FLAG;
    uint32_t locktime = 0;
    //! Resolves pk_h hashes; optional.
    const KeyContext* ctx = nullptr;

    Availability Sign(const Key& key, valtype& sig) const override;
    bool LookupKeyHash(const valtype& hash, Key& key) const override;
    Availability SatHash(HashType type, const valtype& digest, valtype& preimage) const override;
    bool CheckOlder(uint32_t n) const override { return SequenceSatisfies(sequence, n); }
    bool CheckAfter(uint32_t n) const override { return LockTimeSatisfies(locktime, n); }
};

class PretendSignatureChecker : public BaseSignatureChecker {
    const uint32_t m_sequence;
    const uint32_t m_locktime;

public:
    PretendSignatureChecker(uint32_t sequence, uint32_t locktime) : m_sequence(sequence), m_locktime(locktime) {}

    bool CheckSig(const valtype& sig, const valtype& pubkey) const override;
    bool CheckLockTime(const ScriptNum& nLockTime) const override { return LockTimeSatisfies(m_locktime, nLockTime.GetInt64()); }
    bool CheckSequence(const ScriptNum& nSequence) const override { return SequenceSatisfies(m_sequence, nSequence.GetInt64()); }
};

} // namespace msc

#endif // included_msc_miniscript_oracle_h_
