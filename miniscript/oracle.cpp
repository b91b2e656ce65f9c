// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <miniscript/oracle.h>

#include <crypto/hash.h>
#include <logging.h>
#include <util/strings.h>

namespace msc {

valtype PretendSignature(const Key& key)
{
    valtype r = SHA256(key.data());
    valtype s = SHA256(r);
    s[0] &= 0x7f; // keep s positive without a padding byte
    valtype sig{0x30, 0x45, 0x02, 0x21, 0x00};
    sig.insert(sig.end(), r.begin(), r.end());
    sig.push_back(0x02);
    sig.push_back(0x20);
    sig.insert(sig.end(), s.begin(), s.end());
    sig.push_back(0x01); // SIGHASH_ALL
    return sig;
}

bool SequenceSatisfies(uint32_t sequence, int64_t n)
{
    if (n < 0 || (sequence & SEQUENCE_LOCKTIME_DISABLE_FLAG)) return false;
    const uint32_t mask = SEQUENCE_LOCKTIME_TYPE_FLAG | SEQUENCE_LOCKTIME_MASK;
    const int64_t tx_masked = sequence & mask;
    const int64_t n_masked = n & mask;
    // blocks and time (512 second units) don't compare
    if ((tx_masked < SEQUENCE_LOCKTIME_TYPE_FLAG) != (n_masked < SEQUENCE_LOCKTIME_TYPE_FLAG)) return false;
    return n_masked <= tx_masked;
}

bool LockTimeSatisfies(uint32_t locktime, int64_t n)
{
    if (n < 0) return false;
    // heights and timestamps don't compare
    if ((locktime < LOCKTIME_THRESHOLD) != (n < LOCKTIME_THRESHOLD)) return false;
    return n <= locktime;
}

Availability InventorySatisfier::Sign(const Key& key, valtype& sig) const
{
    if (!signers.count(key)) return Availability::NO;
    sig = PretendSignature(key);
    return Availability::YES;
}

bool InventorySatisfier::LookupKeyHash(const valtype& hash, Key& key) const
{
    for (const Key& signer : signers) {
        if (signer.GetHash160() == hash) {
            key = signer;
            return true;
        }
    }
    return ctx && ctx->LookupKeyHash(hash, key);
}

Availability InventorySatisfier::SatHash(HashType type, const valtype& digest, valtype& preimage) const
{
    for (const valtype& candidate : preimages) {
        if (candidate.size() != 32) continue; // scripts check SIZE 32
        valtype hash;
        switch (type) {
            case HashType::SHA256: hash = SHA256(candidate); break;
            case HashType::HASH256: hash = Hash256(candidate); break;
            case HashType::RIPEMD160: hash = RIPEMD160(candidate); break;
            case HashType::HASH160: hash = Hash160(candidate); break;
        }
        if (hash == digest) {
            preimage = candidate;
            return Availability::YES;
        }
    }
    return Availability::NO;
}

bool PretendSignatureChecker::CheckSig(const valtype& sig, const valtype& pubkey) const
{
    Key key(pubkey);
    if (!key.IsValid()) return false;
    bool ok = sig == PretendSignature(key);
    if (msc_enabled(msc_verify_logf)) msc_verify_logf("pretend signature check for %s: %s\n", HexStr(pubkey).c_str(), ok ? "valid" : "invalid");
    return ok;
}

} // namespace msc
