// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <catch2/catch.hpp>

#include <crypto/hash.h>
#include <policy/policy.h>

#include "testutil.h"

#include <algorithm>

using namespace msc;
using namespace msc::test;

namespace {

std::vector<std::string> Fragments()
{
    std::string h = HexStr(SHA256(Preimage(1)));
    return {
        "pk(A)", "pkh(A)", "c:pk_h(B)", "multi(1,A,B)", "multi(2,A,B)",
        "and_v(v:pk(A),pk(B))", "and_b(pk(A),s:pk(B))", "and_v(v:pk(A),older(144))",
        "or_b(pk(A),s:pk(B))", "t:or_c(pk(A),v:pk(B))", "or_d(pk(A),pk(B))",
        "or_d(pk(A),older(144))", "or_i(pk(A),pk(B))", "or_i(pk(A),older(144))",
        "andor(pk(A),pk(B),older(144))", "and_n(pk(A),older(144))",
        "thresh(2,pk(A),s:pk(B),sln:older(144))", "thresh(1,pk(A),s:pk(B))",
        "j:pk(A)", "n:pk(A)", "d:v:older(144)", "older(144)",
        "sha256(" + h + ")", "and_v(v:sha256(" + h + "),pk(A))", "or_d(sha256(" + h + "),pk(A))",
        "or_i(older(144),sha256(" + h + "))", "or_b(sha256(" + h + "),s:pk(A))",
        "andor(pk(A),sha256(" + h + "),and_v(v:pk(B),older(144)))",
    };
}

struct Situation {
    std::vector<const char*> signers;
    bool preimage;
    bool timelock;

    InventorySatisfier Make() const
    {
        InventorySatisfier oracle = Oracle({}, {}, timelock ? 144 : SEQUENCE_LOCKTIME_DISABLE_FLAG);
        for (const char* name : signers) oracle.signers.insert(K(name));
        if (preimage) oracle.preimages.push_back(Preimage(1));
        return oracle;
    }

    std::string Describe() const
    {
        std::string ret = "signers:";
        for (const char* name : signers) ret += std::string(" ") + name;
        if (preimage) ret += " preimage";
        if (timelock) ret += " timelock";
        return ret;
    }
};

std::vector<Situation> Situations()
{
    std::vector<Situation> ret;
    const std::vector<std::vector<const char*>> signer_sets{{}, {"A"}, {"B"}, {"A", "B"}};
    for (const auto& signers : signer_sets) {
        for (int preimage = 0; preimage < 2; ++preimage) {
            for (int timelock = 0; timelock < 2; ++timelock) {
                ret.push_back(Situation{signers, preimage == 1, timelock == 1});
            }
        }
    }
    return ret;
}

/** Call fn on every stack of at most max_size items drawn from elements. */
template<typename Fn>
void ForEachStack(const std::vector<valtype>& elements, size_t max_size, std::vector<valtype>& stack, Fn& fn)
{
    fn(stack);
    if (stack.size() == max_size) return;
    for (const valtype& element : elements) {
        stack.push_back(element);
        ForEachStack(elements, max_size, stack, fn);
        stack.pop_back();
    }
}

std::string StackString(const std::vector<valtype>& stack)
{
    std::vector<std::string> items;
    for (const valtype& item : stack) items.push_back("<" + HexStr(item) + ">");
    return Join(items, " ");
}

} // namespace

TEST_CASE("Produced witnesses verify", "[malleability]") {
    for (const std::string& str : Fragments()) {
        NodeRef n = Parse(str);
        for (const Situation& situation : Situations()) {
            INFO(str << " with " << situation.Describe());
            InventorySatisfier oracle = situation.Make();
            for (bool nonmalleable : {true, false}) {
                std::vector<valtype> stack;
                if (Satisfy(*n, oracle, stack, nonmalleable) != Availability::YES) continue;
                ScriptError serror = SCRIPT_ERR_OK;
                bool verified = Verify(*n, oracle, stack, &serror);
                INFO(ScriptErrorString(serror));
                REQUIRE(verified);
                if (nonmalleable) REQUIRE(stack.size() <= n->GetStackSize());
            }
        }
    }
}

TEST_CASE("Malleable mode finds a witness exactly when the lifted policy holds", "[malleability]") {
    for (const std::string& str : Fragments()) {
        NodeRef n = Parse(str);
        Policy lifted = Lift(*n);
        for (const Situation& situation : Situations()) {
            INFO(str << " with " << situation.Describe());
            InventorySatisfier oracle = situation.Make();
            std::vector<valtype> stack;
            bool found = Satisfy(*n, oracle, stack, false) == Availability::YES;
            REQUIRE(found == lifted.Satisfied(oracle));
        }
    }
}

TEST_CASE("Non-malleable mode is a restriction of malleable mode", "[malleability]") {
    for (const std::string& str : Fragments()) {
        NodeRef n = Parse(str);
        for (const Situation& situation : Situations()) {
            INFO(str << " with " << situation.Describe());
            InventorySatisfier oracle = situation.Make();
            std::vector<valtype> strict, loose;
            if (Satisfy(*n, oracle, strict, true) == Availability::YES) {
                REQUIRE(Satisfy(*n, oracle, loose, false) == Availability::YES);
            } else {
                REQUIRE(strict.empty());
            }
        }
    }

    SECTION("non-malleable fragments with signatures") {
        // every satisfiable situation has a non-malleable witness
        for (const char* str : {"pk(A)", "or_d(pk(A),pk(B))", "andor(pk(A),pk(B),older(144))", "thresh(2,pk(A),s:pk(B),sln:older(144))"}) {
            NodeRef n = Parse(str);
            REQUIRE(n->IsNonMalleable());
            Policy lifted = Lift(*n);
            for (const Situation& situation : Situations()) {
                INFO(str << " with " << situation.Describe());
                InventorySatisfier oracle = situation.Make();
                std::vector<valtype> stack;
                REQUIRE((Satisfy(*n, oracle, stack, true) == Availability::YES) == lifted.Satisfied(oracle));
            }
        }
    }
}

TEST_CASE("No other witness can be built from what a spend reveals", "[malleability]") {
    for (const std::string& str : Fragments()) {
        NodeRef n = Parse(str);
        if (!n->IsNonMalleable() || n->GetStackSize() > 4) continue;
        Script script = ToScript(*n);
        for (const Situation& situation : Situations()) {
            InventorySatisfier oracle = situation.Make();
            std::vector<valtype> witness;
            if (Satisfy(*n, oracle, witness) != Availability::YES) continue;
            INFO(str << " with " << situation.Describe() << ": " << StackString(witness));

            // anyone can push these, plus whatever the witness itself revealed
            std::vector<valtype> elements{valtype(), valtype(1, 1), valtype(32, 0)};
            for (const valtype& item : witness) {
                if (std::find(elements.begin(), elements.end(), item) == elements.end()) elements.push_back(item);
            }
            PretendSignatureChecker checker(oracle.sequence, oracle.locktime);
            size_t valid = 0;
            auto check = [&](const std::vector<valtype>& stack) {
                if (!VerifyWitness(stack, script, STANDARD_SCRIPT_VERIFY_FLAGS, checker)) return;
                ++valid;
                INFO("also valid: " << StackString(stack));
                REQUIRE(stack == witness);
            };
            std::vector<valtype> stack;
            ForEachStack(elements, n->GetStackSize(), stack, check);
            REQUIRE(valid == 1);
        }
    }
}
