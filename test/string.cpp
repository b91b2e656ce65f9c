// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <catch2/catch.hpp>

#include "testutil.h"

using namespace msc;
using namespace msc::test;

static void RequireParseError(const std::string& str, const std::string& message, size_t begin, size_t end)
{
    INFO(str);
    try {
        Parse(str);
        FAIL("expected a parse error");
    } catch (const parse_error& e) {
        REQUIRE(std::string(e.what()).find(message) != std::string::npos);
        REQUIRE(e.begin() == begin);
        REQUIRE(e.end() == end);
    }
}

TEST_CASE("Canonical text form", "[string]") {
    SECTION("canonical strings print back unchanged") {
        const char* canonical[] = {
            "0", "1", "pk(A)", "pkh(A)", "pk_k(A)", "pk_h(A)", "v:pk(A)", "older(144)", "after(500000000)",
            "multi(2,A,B,C)", "and_v(v:pk(A),pk(B))", "and_b(pk(A),s:pk(B))", "or_b(pk(A),a:pk(B))",
            "or_c(pk(A),v:pk(B))", "or_d(pk(A),pkh(B))", "or_i(pk(A),pkh(B))", "andor(pk(A),older(144),pk(B))",
            "and_n(pk(A),older(144))", "t:or_c(pk(A),v:pk(B))", "l:pk(A)", "u:pk(A)", "sln:older(144)",
            "thresh(2,pk(A),s:pk(B),sdv:older(144))", "j:pk(A)", "n:pk(A)",
            "sha256(0101010101010101010101010101010101010101010101010101010101010101)",
            "hash160(0202020202020202020202020202020202020202)",
        };
        for (const char* str : canonical) {
            INFO(str);
            REQUIRE(Str(*Parse(str)) == str);
        }
    }
    SECTION("long forms print with the shorthands") {
        REQUIRE(Str(*Parse("c:pk_k(A)")) == "pk(A)");
        REQUIRE(Str(*Parse("c:pk_h(A)")) == "pkh(A)");
        REQUIRE(Str(*Parse("vc:pk_k(A)")) == "v:pk(A)");
        REQUIRE(Str(*Parse("and_v(v:pk(A),1)")) == "tv:pk(A)");
        REQUIRE(Str(*Parse("or_i(0,pk(A))")) == "l:pk(A)");
        REQUIRE(Str(*Parse("or_i(pk(A),0)")) == "u:pk(A)");
        REQUIRE(Str(*Parse("andor(pk(A),pk(B),0)")) == "and_n(pk(A),pk(B))");
    }
    SECTION("key hashes") {
        std::string hash(40, 'c');
        REQUIRE(Str(*Parse("pk_h(" + hash + ")")) == "pk_h(" + hash + ")");
        REQUIRE(Str(*Parse("pk_h(" + HexStr(K("B").GetHash160()) + ")")) == "pk_h(B)");
    }
    SECTION("hex keys") {
        HexKeyContext hex;
        std::string key = K("A").ToHex();
        NodeRef n = FromString("and_v(v:pk(" + key + "),pkh(" + key + "))", hex);
        REQUIRE(n->ToString(hex) == "and_v(v:pk(" + key + "),pkh(" + HexStr(K("A").GetHash160()) + "))");
        REQUIRE_THROWS_AS(FromString("pk(A)", hex), parse_error);
    }
}

TEST_CASE("Fragment equality", "[string]") {
    NodeRef a = Parse("andor(pk(A),older(144),pk(B))");
    REQUIRE(*a->Clone() == *a);
    REQUIRE(*a != *Parse("andor(pk(A),older(145),pk(B))"));
    REQUIRE(*a != *Parse("andor(pk(A),older(144),pk(C))"));
    REQUIRE(*Parse("multi(1,A,B)") != *Parse("multi(1,B,A)"));
    REQUIRE(*Parse("and_v(v:pk(A),and_v(v:pk(B),pk(C)))") == *Parse("and_v(and_v(v:pk(A),v:pk(B)),pk(C))"));
    REQUIRE(*Parse("and_v(v:pk(A),pk(B))") != *Parse("and_v(v:pk(B),pk(A))"));
}

TEST_CASE("Parse errors", "[string]") {
    RequireParseError("", "expected expression, got end of input", 0, 0);
    RequireParseError("Pk(A)", "expected expression", 0, 1);
    RequireParseError("foo(A)", "unknown fragment 'foo'", 0, 3);
    RequireParseError("x:pk(A)", "unknown wrapper 'x'", 0, 1);
    RequireParseError("vx:pk(A)", "unknown wrapper 'x'", 1, 2);
    RequireParseError("pk(A", "expected ')', got end of input", 4, 4);
    RequireParseError("pk(A))", "unexpected characters after expression", 5, 6);
    RequireParseError("pk()", "empty argument", 3, 3);
    RequireParseError("pk(!!)", "invalid key '!!'", 3, 5);
    RequireParseError("older(0)", "timelock 0 out of range", 6, 7);
    RequireParseError("after(2147483648)", "out of range", 6, 16);
    RequireParseError("older(abc)", "invalid number 'abc'", 6, 9);
    RequireParseError("sha256(00)", "expected 32 hex encoded bytes", 7, 9);
    RequireParseError("and_v(v:pk(A)pk(B))", "expected ','", 13, 14);
    RequireParseError("multi(1,A,B", "expected ')', got end of input", 11, 11);

    SECTION("nesting limit") {
        RequireParseError(std::string(500, 'n') + ":pk(A)", "nesting deeper than 402", 0, 500);
        REQUIRE(Str(*Parse(std::string(300, 'n') + ":pk(A)")) == std::string(300, 'n') + ":pk(A)");
        std::string deep, ok;
        for (int i = 0; i < 1000; ++i) deep += "and_v(v:pk(A),";
        deep += "pk(B)" + std::string(1000, ')');
        REQUIRE_THROWS_WITH(Parse(deep), Catch::Contains("nesting deeper than 402"));
        for (int i = 0; i < 200; ++i) ok += "and_v(v:pk(A),";
        ok += "pk(B)" + std::string(200, ')');
        REQUIRE_NOTHROW(Parse(ok));
    }
    SECTION("type errors are not parse errors") {
        REQUIRE_THROWS_AS(Parse("and_v(pk(A),pk(B))"), type_error);
        REQUIRE_THROWS_AS(Parse("thresh(3,pk(A),s:pk(B))"), type_error);
        REQUIRE_THROWS_AS(Parse("multi(0,A)"), type_error);
    }
}
