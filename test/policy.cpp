// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <catch2/catch.hpp>

#include <crypto/hash.h>
#include <miniscript/errors.h>
#include <policy/policy.h>

#include "testutil.h"

using namespace msc;
using namespace msc::test;

static Policy P(const std::string& str)
{
    return ParsePolicy(str, Ctx());
}

static std::string Str(const Policy& policy)
{
    return ToString(policy, Ctx());
}

static void RequirePolicyError(const std::string& str, const std::string& message, size_t begin, size_t end)
{
    INFO(str);
    try {
        P(str);
        FAIL("expected a parse error");
    } catch (const parse_error& e) {
        INFO(e.what());
        REQUIRE(std::string(e.what()).find(message) != std::string::npos);
        REQUIRE(e.begin() == begin);
        REQUIRE(e.end() == end);
    }
}

TEST_CASE("Policy parsing", "[policy]") {
    SECTION("canonical strings print back unchanged") {
        const char* canonical[] = {
            "pk(A)", "pkh(B)", "older(144)", "after(500000000)", "TRIVIAL", "UNSATISFIABLE",
            "and(pk(A),pk(B))", "and(pk(A),pk(B),pk(C))", "or(pk(A),pk(B))", "or(9@pk(A),1@older(144))",
            "or(3@pk(A),2@pk(B),1@pk(C))", "thresh(2,pk(A),pk(B),pk(C))",
            "or(1@and(pk(A),pk(B)),9@older(144))",
            "sha256(0101010101010101010101010101010101010101010101010101010101010101)",
            "hash160(0202020202020202020202020202020202020202)",
        };
        for (const char* str : canonical) {
            INFO(str);
            REQUIRE(Str(P(str)) == str);
        }
    }
    SECTION("structure") {
        Policy p = P("or(9@pk(A),and(pk(B),older(144)))");
        REQUIRE(p.node_type == Policy::Type::OR);
        REQUIRE(p.prob == (std::vector<uint32_t>{9, 1}));
        REQUIRE(p.sub[0].node_type == Policy::Type::PK);
        REQUIRE(p.sub[0].keys[0] == K("A"));
        REQUIRE(p.sub[1].node_type == Policy::Type::AND);
        REQUIRE(p.sub[1].sub[1].k == 144);
    }
    SECTION("whitespace is ignored") {
        REQUIRE(Str(P(" and( pk(A) ,\n\tpk(B) ) ")) == "and(pk(A),pk(B))");
        REQUIRE(Str(P("or(2 @ pk(A), pk(B))")) == "or(2@pk(A),1@pk(B))");
        REQUIRE(Str(P("or(1@pk(A),1@pk(B))")) == "or(pk(A),pk(B))");
    }
    SECTION("key hashes") {
        std::string hash(40, 'c');
        REQUIRE(Str(P("pkh(" + hash + ")")) == "pkh(" + hash + ")");
        REQUIRE(P("pkh(B)").data == K("B").GetHash160());
    }
    SECTION("clones are independent") {
        Policy p = P("thresh(2,pk(A),pk(B),or(pk(C),older(10)))");
        Policy q = p.Clone();
        REQUIRE(Str(q) == Str(p));
        q.sub[2].prob[0] = 5;
        REQUIRE(Str(q) != Str(p));
    }
}

TEST_CASE("Policy parse errors", "[policy]") {
    RequirePolicyError("", "expected policy, got end of input", 0, 0);
    RequirePolicyError("foo(pk(A))", "unknown policy 'foo'", 0, 3);
    RequirePolicyError("144", "expected policy, got '144'", 0, 3);
    RequirePolicyError("pk(A", "got end of input", 4, 4);
    RequirePolicyError("pk(A,B)", "got ','", 4, 5);
    RequirePolicyError("pk(A))", "unexpected ')' after policy", 5, 6);
    RequirePolicyError("pk(A)$", "unexpected character '$'", 5, 6);
    RequirePolicyError("pk(abcdefghijklmnopq)", "invalid key 'abcdefghijklmnopq'", 3, 20);
    RequirePolicyError("older(0)", "out of range", 6, 7);
    RequirePolicyError("after(2147483648)", "out of range", 6, 16);
    RequirePolicyError("older(x)", "expected number, got 'x'", 6, 7);
    RequirePolicyError("sha256(abcd)", "expected 32 hex encoded bytes", 7, 11);
    RequirePolicyError("and(pk(A))", "and() needs at least two arguments", 0, 9);
    RequirePolicyError("or(pk(A))", "or() needs at least two arguments", 0, 8);
    RequirePolicyError("or(0@pk(A),pk(B))", "weights must be positive", 3, 4);
    RequirePolicyError("thresh(3,pk(A),pk(B))", "threshold 3 out of range 1..2", 7, 8);
    RequirePolicyError("thresh(0,pk(A))", "threshold 0 out of range", 7, 8);

    SECTION("nesting limit") {
        std::string deep;
        for (int i = 0; i < 5000; ++i) deep += "and(pk(A),";
        deep += "pk(B)" + std::string(5000, ')');
        REQUIRE_THROWS_WITH(P(deep), Catch::Contains("nesting deeper than 402"));

        std::string ok;
        for (int i = 0; i < 300; ++i) ok += "or(pk(A),";
        ok += "pk(B)" + std::string(300, ')');
        REQUIRE(Str(P(ok)) == ok);
    }
    SECTION("thresh argument limit") {
        std::string str = "thresh(1";
        for (size_t i = 0; i <= MAX_POLICY_THRESH_ARGS; ++i) str += ",older(" + std::to_string(i + 1) + ")";
        str += ")";
        REQUIRE_THROWS_WITH(P(str), Catch::Contains("at most 100"));
    }
}

TEST_CASE("Policy satisfaction", "[policy]") {
    Policy p = P("or(and(pk(A),pk(B)),thresh(2,pk(C),older(144),sha256(" + HexStr(SHA256(Preimage(1))) + ")))");
    REQUIRE(p.Satisfied(Oracle({"A", "B"})));
    REQUIRE(!p.Satisfied(Oracle({"A"})));
    REQUIRE(p.Satisfied(Oracle({"C"}, {}, 144)));
    REQUIRE(p.Satisfied(Oracle({}, {Preimage(1)}, 144)));
    REQUIRE(!p.Satisfied(Oracle({}, {Preimage(2)}, 144)));
    REQUIRE(p.Satisfied(Oracle({"C"}, {Preimage(1)})));

    REQUIRE(P("pkh(A)").Satisfied(Oracle({"A"})));
    REQUIRE(!P("pkh(" + std::string(40, 'c') + ")").Satisfied(Oracle({"A"})));
    REQUIRE(P("after(1000)").Satisfied(Oracle({}, {}, SEQUENCE_LOCKTIME_DISABLE_FLAG, 1000)));
    REQUIRE(!P("after(1000)").Satisfied(Oracle({}, {}, SEQUENCE_LOCKTIME_DISABLE_FLAG, 999)));
    REQUIRE(P("TRIVIAL").Satisfied(Oracle({})));
    REQUIRE(!P("UNSATISFIABLE").Satisfied(Oracle({"A"})));
}

TEST_CASE("Lifting fragments", "[policy]") {
    SECTION("structure is kept") {
        REQUIRE(Str(Lift(*Parse("pk(A)"))) == "pk(A)");
        REQUIRE(Str(Lift(*Parse("pkh(B)"))) == "pkh(B)");
        REQUIRE(Str(Lift(*Parse("and_v(v:pk(A),older(144))"))) == "and(pk(A),older(144))");
        REQUIRE(Str(Lift(*Parse("or_d(pk(A),pkh(B))"))) == "or(pk(A),pkh(B))");
        REQUIRE(Str(Lift(*Parse("andor(pk(A),pk(B),older(144))"))) == "or(and(pk(A),pk(B)),older(144))");
        REQUIRE(Str(Lift(*Parse("multi(2,A,B,C)"))) == "thresh(2,pk(A),pk(B),pk(C))");
        REQUIRE(Str(Lift(*Parse("thresh(2,pk(A),s:pk(B),sln:older(144))"))) == "thresh(2,pk(A),pk(B),older(144))");
    }
    SECTION("constants are folded") {
        REQUIRE(Str(Lift(*Parse("and_v(v:pk(A),1)"))) == "pk(A)");
        REQUIRE(Str(Lift(*Parse("or_i(0,pk(A))"))) == "pk(A)");
        REQUIRE(Str(Lift(*Parse("and_n(pk(A),older(144))"))) == "and(pk(A),older(144))");
        REQUIRE(Str(Lift(*Parse("and_b(pk(A),a:0)"))) == "UNSATISFIABLE");
        REQUIRE(Str(Lift(*Parse("or_i(pk(A),1)"))) == "TRIVIAL");
        REQUIRE(Str(Lift(*Parse("d:v:older(144)"))) == "older(144)");
        REQUIRE(Str(Lift(*Parse("thresh(2,pk(A),s:pk(B),a:0)"))) == "thresh(2,pk(A),pk(B))");
        REQUIRE(Str(Lift(*Parse("thresh(2,pk(A),s:pk(B),a:or_i(1,0))"))) == "thresh(1,pk(A),pk(B))");
        REQUIRE(Str(Lift(*Parse("thresh(1,pk(A),a:or_i(1,0))"))) == "TRIVIAL");
        REQUIRE(Str(Lift(*Parse("thresh(2,pk(A),a:0)"))) == "UNSATISFIABLE");
        REQUIRE(Str(Lift(*Parse("thresh(1,pk(A),a:0)"))) == "pk(A)");
    }
}
