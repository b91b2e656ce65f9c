// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <catch2/catch.hpp>

#include <crypto/hash.h>

#include "testutil.h"

using namespace msc;
using namespace msc::test;

static bool Run(const std::string& fragment, const std::vector<valtype>& witness, ScriptError& serror, std::vector<SatisfiedConstraint>* trace = nullptr, uint32_t sequence = SEQUENCE_LOCKTIME_DISABLE_FLAG, uint32_t locktime = 0)
{
    PretendSignatureChecker checker(sequence, locktime);
    return VerifyWitness(witness, ToScript(*Parse(fragment)), STANDARD_SCRIPT_VERIFY_FLAGS, checker, &serror, trace);
}

static valtype Sig(const char* name)
{
    return PretendSignature(K(name));
}

TEST_CASE("Signature checks", "[interpreter]") {
    ScriptError serror;
    std::vector<SatisfiedConstraint> trace;

    SECTION("valid signature") {
        REQUIRE(Run("pk(A)", {Sig("A")}, serror, &trace));
        REQUIRE(serror == SCRIPT_ERR_OK);
        REQUIRE(trace.size() == 1);
        REQUIRE(trace[0].kind == SatisfiedConstraint::Kind::SIGNATURE);
        REQUIRE(trace[0].data == K("A").data());
        REQUIRE(trace[0].ToString() == "signature for " + K("A").ToHex());
    }
    SECTION("signature for another key") {
        REQUIRE(!Run("pk(A)", {Sig("B")}, serror, &trace));
        REQUIRE(serror == SCRIPT_ERR_SIG_NULLFAIL);
        REQUIRE(trace.empty());
    }
    SECTION("empty signature") {
        REQUIRE(!Run("pk(A)", {valtype()}, serror));
        REQUIRE(serror == SCRIPT_ERR_EVAL_FALSE);
    }
    SECTION("leftover items") {
        REQUIRE(!Run("pk(A)", {valtype(), Sig("A")}, serror));
        REQUIRE(serror == SCRIPT_ERR_CLEANSTACK);
    }
    SECTION("empty witness") {
        REQUIRE(!Run("pk(A)", {}, serror));
        REQUIRE(serror == SCRIPT_ERR_INVALID_STACK_OPERATION);
    }
    SECTION("verify form") {
        REQUIRE(!Run("and_v(v:pk(A),pk(B))", {Sig("B"), valtype()}, serror));
        REQUIRE(serror == SCRIPT_ERR_CHECKSIGVERIFY);
        REQUIRE(Run("and_v(v:pk(A),pk(B))", {Sig("B"), Sig("A")}, serror, &trace));
        REQUIRE(trace.size() == 2);
        REQUIRE(trace[0].data == K("A").data());
        REQUIRE(trace[1].data == K("B").data());
    }
    SECTION("key hashes") {
        REQUIRE(Run("pkh(A)", {Sig("A"), K("A").data()}, serror));
        REQUIRE(!Run("pkh(A)", {Sig("B"), K("B").data()}, serror));
        REQUIRE(serror == SCRIPT_ERR_EQUALVERIFY);
    }
}

TEST_CASE("Multisig checks", "[interpreter]") {
    ScriptError serror;
    std::vector<SatisfiedConstraint> trace;

    SECTION("signatures in key order") {
        REQUIRE(Run("multi(2,A,B,C)", {valtype(), Sig("A"), Sig("C")}, serror, &trace));
        REQUIRE(trace.size() == 2);
    }
    SECTION("signatures out of order") {
        REQUIRE(!Run("multi(2,A,B,C)", {valtype(), Sig("C"), Sig("A")}, serror));
        REQUIRE(serror == SCRIPT_ERR_SIG_NULLFAIL);
    }
    SECTION("non-empty dummy") {
        REQUIRE(!Run("multi(1,A,B)", {valtype{1}, Sig("A")}, serror));
        REQUIRE(serror == SCRIPT_ERR_SIG_NULLDUMMY);
    }
    SECTION("dissatisfaction with empty signatures") {
        REQUIRE(!Run("multi(1,A,B)", {valtype(), valtype()}, serror));
        REQUIRE(serror == SCRIPT_ERR_EVAL_FALSE);
    }
}

TEST_CASE("Hash and time locks", "[interpreter]") {
    ScriptError serror;
    std::vector<SatisfiedConstraint> trace;
    valtype preimage = Preimage(7);
    valtype digest = SHA256(preimage);
    std::string fragment = "sha256(" + HexStr(digest) + ")";

    SECTION("correct preimage") {
        REQUIRE(Run(fragment, {preimage}, serror, &trace));
        REQUIRE(trace.size() == 1);
        REQUIRE(trace[0].kind == SatisfiedConstraint::Kind::HASHLOCK);
        REQUIRE(trace[0].hash_op == OP_SHA256);
        REQUIRE(trace[0].data == digest);
    }
    SECTION("wrong preimage") {
        REQUIRE(!Run(fragment, {Preimage(8)}, serror, &trace));
        REQUIRE(serror == SCRIPT_ERR_EVAL_FALSE);
        REQUIRE(trace.empty());
    }
    SECTION("preimage of the wrong size") {
        valtype shorter(preimage.begin(), preimage.end() - 1);
        REQUIRE(!Run("sha256(" + HexStr(SHA256(shorter)) + ")", {shorter}, serror));
        REQUIRE(serror == SCRIPT_ERR_EQUALVERIFY);
    }
    SECTION("other hash functions") {
        REQUIRE(Run("hash256(" + HexStr(Hash256(preimage)) + ")", {preimage}, serror));
        REQUIRE(Run("ripemd160(" + HexStr(RIPEMD160(preimage)) + ")", {preimage}, serror));
        REQUIRE(Run("hash160(" + HexStr(Hash160(preimage)) + ")", {preimage}, serror, &trace));
        REQUIRE(trace.back().hash_op == OP_HASH160);
    }
    SECTION("relative timelock") {
        REQUIRE(Run("and_v(v:pk(A),older(144))", {Sig("A")}, serror, &trace, 144));
        REQUIRE(trace.size() == 2);
        REQUIRE(trace[1].kind == SatisfiedConstraint::Kind::RELATIVE_TIMELOCK);
        REQUIRE(trace[1].value == 144);
        REQUIRE(!Run("and_v(v:pk(A),older(144))", {Sig("A")}, serror, nullptr, 143));
        REQUIRE(serror == SCRIPT_ERR_UNSATISFIED_LOCKTIME);
        // a time based nSequence does not meet a height based lock
        REQUIRE(!Run("and_v(v:pk(A),older(144))", {Sig("A")}, serror, nullptr, SEQUENCE_LOCKTIME_TYPE_FLAG | 1000));
        REQUIRE(!Run("and_v(v:pk(A),older(144))", {Sig("A")}, serror));
    }
    SECTION("absolute timelock") {
        REQUIRE(Run("and_v(v:pk(A),after(500000000))", {Sig("A")}, serror, &trace, SEQUENCE_LOCKTIME_DISABLE_FLAG, 500000001));
        REQUIRE(trace.back().kind == SatisfiedConstraint::Kind::ABSOLUTE_TIMELOCK);
        REQUIRE(trace.back().ToString() == "absolute timelock 500000000");
        REQUIRE(!Run("and_v(v:pk(A),after(500000000))", {Sig("A")}, serror, nullptr, SEQUENCE_LOCKTIME_DISABLE_FLAG, 1000));
        REQUIRE(serror == SCRIPT_ERR_UNSATISFIED_LOCKTIME);
    }
}

TEST_CASE("Standardness rules", "[interpreter]") {
    ScriptError serror;

    SECTION("MINIMALIF") {
        REQUIRE(Run("or_i(pk(A),pk(B))", {Sig("A"), valtype{1}}, serror));
        REQUIRE(Run("or_i(pk(A),pk(B))", {Sig("B"), valtype()}, serror));
        REQUIRE(!Run("or_i(pk(A),pk(B))", {Sig("A"), valtype{2}}, serror));
        REQUIRE(serror == SCRIPT_ERR_MINIMALIF);
    }
    SECTION("opcodes outside the fragment language") {
        PretendSignatureChecker checker(SEQUENCE_LOCKTIME_DISABLE_FLAG, 0);
        REQUIRE(!VerifyWitness({}, Script(ParseHex("51ab")), STANDARD_SCRIPT_VERIFY_FLAGS, checker, &serror));
        REQUIRE(serror == SCRIPT_ERR_BAD_OPCODE);
        // also when not executed
        REQUIRE(!VerifyWitness({valtype()}, Script(ParseHex("63ab6851")), STANDARD_SCRIPT_VERIFY_FLAGS, checker, &serror));
        REQUIRE(serror == SCRIPT_ERR_BAD_OPCODE);
    }
    SECTION("unbalanced conditionals") {
        PretendSignatureChecker checker(SEQUENCE_LOCKTIME_DISABLE_FLAG, 0);
        REQUIRE(!VerifyWitness({valtype{1}}, Script(ParseHex("6351")), STANDARD_SCRIPT_VERIFY_FLAGS, checker, &serror));
        REQUIRE(serror == SCRIPT_ERR_UNBALANCED_CONDITIONAL);
    }
    SECTION("error strings") {
        REQUIRE(!ScriptErrorString(SCRIPT_ERR_SIG_NULLFAIL).empty());
        REQUIRE(ScriptErrorString(SCRIPT_ERR_OK) != ScriptErrorString(SCRIPT_ERR_CLEANSTACK));
    }
}
