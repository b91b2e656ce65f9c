// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_test_testutil_h_
#define included_msc_test_testutil_h_

#include <miniscript/codec.h>
#include <miniscript/key.h>
#include <miniscript/miniscript.h>
#include <miniscript/oracle.h>
#include <miniscript/satisfy.h>
#include <script/interpreter.h>
#include <util/strings.h>

#include <initializer_list>
#include <string>
#include <vector>

namespace msc {
namespace test {

/** Symbolic keys print as their names. */
inline CompilerContext& Ctx()
{
    static CompilerContext ctx;
    ctx.symbolic_outputs = true;
    return ctx;
}

inline Key K(const std::string& name)
{
    Key key;
    Ctx().FromString(name, key);
    return key;
}

inline NodeRef Parse(const std::string& str)
{
    return FromString(str, Ctx());
}

inline std::string Str(const Node& node)
{
    return node.ToString(Ctx());
}

/** A 32 byte preimage, distinct per seed. */
inline valtype Preimage(unsigned char seed)
{
    return valtype(32, seed);
}

inline InventorySatisfier Oracle(std::initializer_list<const char*> signers, std::vector<valtype> preimages = {}, uint32_t sequence = SEQUENCE_LOCKTIME_DISABLE_FLAG, uint32_t locktime = 0)
{
    InventorySatisfier oracle;
    for (const char* name : signers) oracle.signers.insert(K(name));
    oracle.preimages = std::move(preimages);
    oracle.sequence = sequence;
    oracle.locktime = locktime;
    oracle.ctx = &Ctx();
    return oracle;
}

/** Run the witness through the interpreter with the same nSequence/nLockTime the oracle assumed. */
inline bool Verify(const Node& node, const InventorySatisfier& oracle, const std::vector<valtype>& witness, ScriptError* serror = nullptr, std::vector<SatisfiedConstraint>* trace = nullptr)
{
    PretendSignatureChecker checker(oracle.sequence, oracle.locktime);
    return VerifyWitness(witness, ToScript(node), STANDARD_SCRIPT_VERIFY_FLAGS, checker, serror, trace);
}

} // namespace test
} // namespace msc

#endif // included_msc_test_testutil_h_
