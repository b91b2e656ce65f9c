// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <catch2/catch.hpp>

#include "testutil.h"

#include <type_traits>

using namespace msc;
using namespace msc::test;

TEST_CASE("Type strings", "[types]") {
    SECTION("round trip") {
        Type t = ""_mst;
        REQUIRE(ParseType("Bonduesmk", t));
        REQUIRE(t == "Bonduesmk"_mst);
        REQUIRE(t.ToString() == "Bonduesmk");
        REQUIRE(ParseType("kmseudnoB", t));
        REQUIRE(t.ToString() == "Bonduesmk");
    }
    SECTION("unknown letters") {
        Type t = ""_mst;
        REQUIRE(!ParseType("Bq", t));
    }
    SECTION("subset test") {
        REQUIRE("Bonduesmk"_mst << "Bd"_mst);
        REQUIRE(!("Bonduesmk"_mst << "Bf"_mst));
        REQUIRE(("Bzfmxk"_mst & "Kzf"_mst) == "zf"_mst);
        REQUIRE("x"_mst.If(false) == ""_mst);
    }
}

TEST_CASE("Fragment types", "[types]") {
    SECTION("leaves") {
        REQUIRE(Parse("pk_k(A)")->GetType() == "Konudemsxk"_mst);
        REQUIRE(Parse("pk_h(A)")->GetType() == "Knudemsxk"_mst);
        REQUIRE(Parse("pk(A)")->GetType().ToString() == "Bonduesmk");
        REQUIRE(Parse("older(144)")->GetType().ToString() == "Bzfmxhk");
        REQUIRE(Parse("older(4194305)")->GetType() << "g"_mst);
        REQUIRE(Parse("after(500000000)")->GetType() << "i"_mst);
        REQUIRE(Parse("after(499999999)")->GetType() << "j"_mst);
        REQUIRE(Parse("multi(2,A,B,C)")->GetType() == "Bnudemsk"_mst);
        REQUIRE(Parse("0")->GetType() << "Bzud"_mst);
        REQUIRE(Parse("1")->GetType() << "Bzuf"_mst);
    }
    SECTION("wrappers") {
        REQUIRE(Parse("v:pk(A)")->GetType() == "Vonmsfxk"_mst);
        REQUIRE(Parse("s:pk(A)")->GetType() << "W"_mst);
        REQUIRE(Parse("a:older(144)")->GetType() << "W"_mst);
        REQUIRE(Parse("d:v:older(144)")->GetType() << "Bou"_mst);
        REQUIRE(Parse("j:pk(A)")->GetType() << "Bd"_mst);
        REQUIRE(Parse("n:pk(A)")->GetType() << "Bu"_mst);
    }
    SECTION("combinators") {
        Type t = Parse("and_v(v:pk(A),pk(B))")->GetType();
        REQUIRE(t << "Bnmsfuk"_mst);
        REQUIRE(!(t << "d"_mst));
        REQUIRE(Parse("or_b(pk(A),s:pk(B))")->GetType() << "Bdesmu"_mst);
        REQUIRE(Parse("or_d(pk(A),older(144))")->GetType() << "Bm"_mst);
        REQUIRE(Parse("andor(pk(A),older(144),pk(B))")->GetType() << "Bdm"_mst);
        REQUIRE(Parse("thresh(2,pk(A),s:pk(B),s:pk(C))")->GetType() << "Bdusemk"_mst);
    }
    SECTION("timelock mixing") {
        NodeRef n = Parse("and_b(older(144),a:older(4194305))");
        REQUIRE(n->GetType() << "gh"_mst);
        REQUIRE(!n->CheckTimeLocksMix());
        REQUIRE(Parse("or_i(older(144),older(4194305))")->CheckTimeLocksMix());
        REQUIRE(Parse("thresh(1,pk(A),s:pk(B),sln:older(144))")->CheckTimeLocksMix());
    }
}

TEST_CASE("Composition errors", "[types]") {
    SECTION("wrong child types") {
        REQUIRE_THROWS_AS(Parse("and_v(pk(A),pk(B))"), type_error);
        REQUIRE_THROWS_WITH(Parse("and_v(pk(A),pk(B))"), Catch::Contains("argument 1 must be V"));
        REQUIRE_THROWS_WITH(Parse("or_b(pk(A),pk(B))"), Catch::Contains("argument 2 must be Wd"));
        REQUIRE_THROWS_WITH(Parse("c:older(144)"), Catch::Contains("argument 1 must be K"));
        REQUIRE_THROWS_AS(Parse("or_i(pk(A),v:pk(B))"), type_error);
        REQUIRE_THROWS_AS(Parse("d:pk(A)"), type_error);
    }
    SECTION("every combinator checks its arguments") {
        struct {
            const char* fragment;
            const char* reason;
        } cases[] = {
            {"and_b(v:pk(A),s:pk(B))", "argument 1 must be B"},
            {"and_b(pk(A),pk(B))", "argument 2 must be W"},
            {"or_b(v:pk(A),s:pk(B))", "argument 1 must be Bd"},
            {"or_c(v:pk(A),v:pk(B))", "argument 1 must be Bdu"},
            {"or_c(pk(A),pk(B))", "argument 2 must be V"},
            {"or_d(and_v(v:pk(A),pk(B)),pk(C))", "argument 1 must be Bdu"},
            {"or_d(pk(A),v:pk(B))", "argument 2 must be B"},
            {"or_i(pk(A),v:pk(B))", "arguments 1 and 2 must share basic type"},
            {"andor(v:pk(A),pk(B),pk(C))", "argument 1 must be Bdu"},
            {"andor(pk(A),pk(B),v:pk(C))", "arguments 2 and 3 must share basic type"},
            {"thresh(1,s:pk(A),s:pk(B))", "argument 1 must be Bdu"},
            {"thresh(1,pk(A),pk(B))", "argument 2 must be Wdu"},
            {"thresh(2,pk(A),s:pk(B),pk(C))", "argument 3 must be Wdu"},
            {"a:v:pk(A)", "argument 1 must be B"},
            {"s:pk_k(A)", "argument 1 must be Bo"},
            {"s:older(144)", "argument 1 must be Bo"},
            {"j:older(144)", "argument 1 must be Bn"},
            {"n:v:pk(A)", "argument 1 must be B"},
            {"v:v:pk(A)", "argument 1 must be B"},
            {"d:pk(A)", "argument 1 must be Vz"},
        };
        for (const auto& c : cases) {
            INFO(c.fragment);
            try {
                Parse(c.fragment);
                FAIL("expected a type error");
            } catch (const type_error& e) {
                REQUIRE(e.reason().find(c.reason) != std::string::npos);
            }
        }
    }
    SECTION("nodes are only built through MakeNode") {
        REQUIRE(!std::is_constructible<Node, NodeType, std::vector<NodeRef>, std::vector<Key>, valtype, uint32_t>::value);
    }
    SECTION("the error names the composition") {
        try {
            MakeNode(NodeType::WRAP_C, Subs(MakeNode(NodeType::OLDER, (uint32_t)144)));
            FAIL("expected a type error");
        } catch (const type_error& e) {
            REQUIRE(e.reason().find("must be K") != std::string::npos);
            REQUIRE(e.node().find("c") != std::string::npos);
        }
    }
    SECTION("bad arguments") {
        REQUIRE_THROWS_AS(MakeNode(NodeType::OLDER, (uint32_t)0), type_error);
        REQUIRE_THROWS_AS(MakeNode(NodeType::AFTER, (uint32_t)0x80000000), type_error);
        REQUIRE_THROWS_AS(MakeNode(NodeType::MULTI, std::vector<Key>{K("A"), K("B")}, 3), type_error);
        REQUIRE_THROWS_AS(MakeNode(NodeType::MULTI, std::vector<Key>{K("A")}, 0), type_error);
        REQUIRE_THROWS_AS(MakeNode(NodeType::SHA256, valtype(20, 0x11)), type_error);
        REQUIRE_THROWS_AS(MakeNode(NodeType::THRESH, Subs(Parse("pk(A)"), Parse("s:pk(B)")), 3), type_error);
        REQUIRE_THROWS_AS(MakeNode(NodeType::AND_B, Subs(Parse("pk(A)"))), type_error);
        std::vector<Key> keys;
        for (int i = 0; i < 21; ++i) keys.push_back(K(strprintf("K%d", i)));
        REQUIRE_THROWS_AS(MakeNode(NodeType::MULTI, keys, 1), type_error);
    }
}

TEST_CASE("Derived sizes", "[types]") {
    const char* fragments[] = {
        "0", "1", "pk(A)", "pkh(A)", "older(144)", "after(1000000)", "older(16)",
        "sha256(0101010101010101010101010101010101010101010101010101010101010101)",
        "hash160(0202020202020202020202020202020202020202)",
        "multi(2,A,B,C)", "and_v(v:pk(A),pk(B))", "and_b(pk(A),s:pk(B))",
        "or_b(pk(A),s:pk(B))", "or_c(pk(A),v:older(144))", "or_d(pk(A),pkh(B))",
        "or_i(pk(A),pkh(B))", "andor(pk(A),older(144),pk(B))",
        "thresh(2,pk(A),s:pk(B),sln:older(144))", "j:pk(A)", "n:pk(A)", "d:v:older(144)",
        "and_v(v:sha256(0101010101010101010101010101010101010101010101010101010101010101),pk(A))",
    };
    for (const char* str : fragments) {
        NodeRef n = Parse(str);
        INFO(str);
        REQUIRE(n->ScriptSize() == ToScript(*n).size());
    }

    SECTION("opcode counts") {
        REQUIRE(Parse("pk(A)")->GetOps() == 1);
        REQUIRE(Parse("and_v(v:pk(A),pk(B))")->GetOps() == 2);
        REQUIRE(Parse("multi(2,A,B,C)")->GetOps() == 4);
        REQUIRE(Parse("pkh(A)")->GetOps() == 4);
        REQUIRE(Parse("or_i(pk(A),pkh(B))")->GetOps() == 8);
    }
    SECTION("stack sizes") {
        REQUIRE(Parse("pk(A)")->GetStackSize() == 1);
        REQUIRE(Parse("pkh(A)")->GetStackSize() == 2);
        REQUIRE(Parse("multi(2,A,B,C)")->GetStackSize() == 3);
        REQUIRE(Parse("or_i(pk(A),pkh(B))")->GetStackSize() == 3);
        REQUIRE(Parse("thresh(2,pk(A),s:pk(B),s:pk(C))")->GetStackSize() == 3);
        REQUIRE(!Parse("v:pk(A)")->GetStackSizeInfo().dsat.valid);
    }
    SECTION("sanity") {
        REQUIRE(Parse("pk(A)")->IsSane());
        REQUIRE(Parse("and_v(v:pk(A),older(144))")->IsSane());
        REQUIRE(!Parse("older(144)")->IsSane());
        REQUIRE(!Parse("v:pk(A)")->IsSane());
        REQUIRE(!Parse("or_i(pk(A),older(144))")->NeedsSignature());
    }
}
