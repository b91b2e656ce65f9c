// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <catch2/catch.hpp>

#include <crypto/hash.h>
#include <miniscript/compiler.h>
#include <miniscript/errors.h>
#include <policy/policy.h>

#include "testutil.h"

using namespace msc;
using namespace msc::test;

namespace {

Policy P(const std::string& str)
{
    return ParsePolicy(str, Ctx());
}

/** Script size plus expected satisfaction witness size. */
double Cost(const Node& node, double avgcost)
{
    return node.ScriptSize() + avgcost;
}

NodeRef CompileStr(const std::string& str, double& cost, const CostModel& model = CostModel())
{
    double avgcost;
    NodeRef ret = Compile(P(str), avgcost, model, &Ctx());
    cost = Cost(*ret, avgcost);
    return ret;
}

valtype Sig(const char* name)
{
    return PretendSignature(K(name));
}

std::vector<InventorySatisfier> Oracles()
{
    std::vector<InventorySatisfier> ret;
    const std::vector<std::vector<const char*>> signer_sets{{}, {"A"}, {"B"}, {"C"}, {"A", "B"}, {"B", "C"}, {"A", "C"}, {"A", "B", "C"}};
    for (const auto& signers : signer_sets) {
        for (uint32_t sequence : {(uint32_t)SEQUENCE_LOCKTIME_DISABLE_FLAG, (uint32_t)144}) {
            InventorySatisfier oracle = Oracle({}, {}, sequence);
            for (const char* name : signers) oracle.signers.insert(K(name));
            ret.push_back(oracle);
            oracle.preimages.push_back(Preimage(1));
            ret.push_back(oracle);
        }
    }
    return ret;
}

} // namespace

TEST_CASE("Compilation baselines", "[compiler]") {
    double cost;

    SECTION("single key") {
        NodeRef n = CompileStr("pk(A)", cost);
        REQUIRE(Str(*n) == "pk(A)");
        REQUIRE(cost <= 108 + 1e-9);
    }
    SECTION("either key") {
        CompileStr("or(pk(A),pk(B))", cost);
        REQUIRE(cost <= 146 + 1e-9);
    }
    SECTION("both keys") {
        CompileStr("and(pk(A),pk(B))", cost);
        REQUIRE(cost <= 216 + 1e-9);
    }
    SECTION("key threshold") {
        NodeRef n = CompileStr("thresh(2,pk(A),pk(B),pk(C))", cost);
        REQUIRE(Str(*n) == "multi(2,A,B,C)");
        REQUIRE(cost <= 252 + 1e-9);

        // A only gets the dummy placeholder
        std::vector<valtype> stack;
        REQUIRE(Satisfy(*n, Oracle({"B", "C"}), stack) == Availability::YES);
        REQUIRE(stack == (std::vector<valtype>{valtype(), Sig("B"), Sig("C")}));
    }
    SECTION("likely timelock") {
        NodeRef n = CompileStr("or(1@and(pk(A),pk(B)),9@older(144))", cost);
        REQUIRE(Str(*n) == "or_i(and_v(v:pkh(B),pkh(A)),older(144))");
        REQUIRE(n->ScriptSize() == 57);
        REQUIRE(cost <= 79.5 + 1e-9);

        std::vector<valtype> stack;
        REQUIRE(Satisfy(*n, Oracle({}, {}, 144), stack) == Availability::YES);
        REQUIRE(stack == std::vector<valtype>{valtype()});
        REQUIRE(Satisfy(*n, Oracle({"A", "B"}), stack) == Availability::YES);
        REQUIRE(stack == (std::vector<valtype>{Sig("A"), K("A").data(), Sig("B"), K("B").data(), valtype(1, 1)}));
        REQUIRE(Satisfy(*n, Oracle({}), stack) == Availability::NO);
        REQUIRE(stack.empty());

        double unlikely;
        CompileStr("or(9@and(pk(A),pk(B)),1@older(144))", unlikely);
        REQUIRE(unlikely > cost);
    }
}

TEST_CASE("Compiled fragments", "[compiler]") {
    std::string h = HexStr(SHA256(Preimage(1)));
    const std::string policies[] = {
        "pk(A)", "pkh(A)", "older(144)", "sha256(" + h + ")",
        "or(pk(A),pk(B))", "and(pk(A),pk(B))", "and(pk(A),older(144))",
        "or(pk(A),and(pk(B),older(144)))", "or(99@pk(A),and(pk(B),older(144)))",
        "thresh(2,pk(A),pk(B),pk(C))", "thresh(2,pk(A),pk(B),older(144))",
        "or(and(pk(A),sha256(" + h + ")),and(pk(B),older(144)))",
        "and(or(pk(A),pk(B)),or(pk(C),older(144)))", "or(pk(A),pk(B),pk(C))",
        "thresh(1,pk(A),pkh(B),pk(C))", "and(pk(A),pk(B),pk(C))",
        "or(3@pk(A),and(thresh(2,pk(B),pk(C),sha256(" + h + ")),older(144)))",
    };
    for (const std::string& str : policies) {
        INFO(str);
        Policy policy = P(str);
        double avgcost;
        NodeRef n = Compile(policy, avgcost, CostModel(), &Ctx());
        INFO(Str(*n));

        REQUIRE(n->IsValidTopLevel());
        REQUIRE(n->IsNonMalleable());
        REQUIRE(n->CheckTimeLocksMix());
        REQUIRE(n->ScriptSize() == ToScript(*n).size());
        REQUIRE(*FromScript(ToScript(*n), Ctx()) == *n);

        // the fragment enforces exactly the policy
        Policy lifted = Lift(*n);
        for (const InventorySatisfier& oracle : Oracles()) {
            bool expected = policy.Satisfied(oracle);
            REQUIRE(lifted.Satisfied(oracle) == expected);

            std::vector<valtype> stack;
            REQUIRE((Satisfy(*n, oracle, stack, false) == Availability::YES) == expected);
            if (Satisfy(*n, oracle, stack, true) == Availability::YES) {
                REQUIRE(expected);
                ScriptError serror = SCRIPT_ERR_OK;
                bool verified = Verify(*n, oracle, stack, &serror);
                INFO(ScriptErrorString(serror));
                REQUIRE(verified);
            }
        }
    }
}

TEST_CASE("Cost model", "[compiler]") {
    double avgcost;

    SECTION("signature size") {
        CostModel model;
        model.sig_size = 64;
        Compile(P("pk(A)"), avgcost, model);
        REQUIRE(avgcost == Approx(64));
        Compile(P("pk(A)"), avgcost);
        REQUIRE(avgcost == Approx(73));
    }
    SECTION("cost cap") {
        CostModel model;
        model.max_cost = 10;
        REQUIRE_THROWS_AS(Compile(P("pk(A)"), avgcost, model), compile_error);
    }
    SECTION("safe results") {
        CostModel model;
        model.require_safe = true;
        REQUIRE(Str(*Compile(P("older(144)"), avgcost)) == "older(144)");
        REQUIRE_THROWS_AS(Compile(P("older(144)"), avgcost, model), compile_error);
        REQUIRE_THROWS_AS(Compile(P("or(pk(A),older(144))"), avgcost, model), compile_error);
        REQUIRE(Compile(P("and(pk(A),older(144))"), avgcost, model, &Ctx())->NeedsSignature());
    }
}

TEST_CASE("Compile errors", "[compiler]") {
    double avgcost;

    SECTION("empty policy") {
        REQUIRE_THROWS_WITH(Compile(Policy(Policy::Type::NONE), avgcost), Catch::Contains("empty policy"));
    }
    SECTION("two signature-free alternatives") {
        try {
            Compile(P("or(older(144),older(288))"), avgcost, CostModel(), &Ctx());
            FAIL("expected a compile error");
        } catch (const compile_error& e) {
            REQUIRE(e.policy() == "or(older(144),older(288))");
            REQUIRE(e.reason().find("non-malleable") != std::string::npos);
        }
    }
    SECTION("the smallest failing sub-policy is named") {
        try {
            Compile(P("and(pk(A),or(older(1),older(2)))"), avgcost, CostModel(), &Ctx());
            FAIL("expected a compile error");
        } catch (const compile_error& e) {
            REQUIRE(e.policy() == "or(older(1),older(2))");
            REQUIRE(e.reason().find("sub-policy") != std::string::npos);
        }
    }
    SECTION("mixed timelocks") {
        REQUIRE_THROWS_AS(Compile(P("and(pk(A),older(144),older(4194305))"), avgcost), compile_error);
    }
    SECTION("keys print as hex without a context") {
        try {
            Compile(P("or(older(144),older(288))"), avgcost);
            FAIL("expected a compile error");
        } catch (const compile_error& e) {
            REQUIRE(e.policy() == "or(older(144),older(288))");
        }
        REQUIRE_THROWS_WITH(Compile(P("and(pk(A),older(144),older(4194305))"), avgcost), Catch::Contains(K("A").ToHex()));
    }
}
