// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <catch2/catch.hpp>

#include <script/script.h>

using namespace msc;

TEST_CASE("Number pushes", "[script]") {
    SECTION("small numbers use OP_N") {
        REQUIRE((Script() << (int64_t)0) == Script(valtype{OP_0}));
        REQUIRE((Script() << (int64_t)1) == Script(valtype{OP_1}));
        REQUIRE((Script() << (int64_t)16) == Script(valtype{OP_16}));
        REQUIRE((Script() << (int64_t)-1) == Script(valtype{OP_1NEGATE}));
    }
    SECTION("larger numbers are minimal ScriptNum pushes") {
        REQUIRE((Script() << (int64_t)17) == Script(valtype{0x01, 0x11}));
        REQUIRE((Script() << (int64_t)144) == Script(valtype{0x02, 0x90, 0x00}));
        REQUIRE((Script() << (int64_t)0x7fffffff) == Script(valtype{0x04, 0xff, 0xff, 0xff, 0x7f}));
    }
}

TEST_CASE("ScriptNum encoding", "[script]") {
    REQUIRE(ScriptNum::serialize(0) == valtype{});
    REQUIRE(ScriptNum::serialize(128) == (valtype{0x80, 0x00}));
    REQUIRE(ScriptNum::serialize(-1) == valtype{0x81});
    REQUIRE(ScriptNum::serialize(-255) == (valtype{0xff, 0x80}));

    REQUIRE(ScriptNum::IsMinimallyEncoded(valtype{}));
    REQUIRE(ScriptNum::IsMinimallyEncoded(valtype{0x80, 0x00}));
    REQUIRE_FALSE(ScriptNum::IsMinimallyEncoded(valtype{0x00}));
    REQUIRE_FALSE(ScriptNum::IsMinimallyEncoded(valtype{0x01, 0x00}));
    REQUIRE_FALSE(ScriptNum::IsMinimallyEncoded(valtype{0x80}));

    REQUIRE(ScriptNum(valtype{0x90, 0x00}, true).GetInt64() == 144);
    REQUIRE_THROWS_AS(ScriptNum(valtype{0x01, 0x00}, true), scriptnum_error);
    REQUIRE_THROWS_AS(ScriptNum(valtype{1, 2, 3, 4, 5}, false), scriptnum_error);
    REQUIRE(ScriptNum(valtype{1, 2, 3, 4, 5}, false, 5).GetInt64() == 0x0504030201LL);
}

TEST_CASE("Reading opcodes", "[script]") {
    SECTION("pushes and opcodes") {
        Script s = Script() << valtype(20, 0xab) << OP_EQUAL;
        auto it = s.cbegin();
        opcodetype opcode;
        valtype data;
        REQUIRE(GetScriptOp(it, s.cend(), opcode, &data));
        REQUIRE(opcode == 20);
        REQUIRE(data == valtype(20, 0xab));
        REQUIRE(GetScriptOp(it, s.cend(), opcode, &data));
        REQUIRE(opcode == OP_EQUAL);
        REQUIRE(it == s.cend());
    }
    SECTION("truncated push") {
        Script s(valtype{0x02, 0x01});
        auto it = s.cbegin();
        opcodetype opcode;
        REQUIRE_FALSE(GetScriptOp(it, s.cend(), opcode, nullptr));
    }
    SECTION("minimal pushes") {
        REQUIRE(CheckMinimalPush(valtype{}, OP_0));
        REQUIRE_FALSE(CheckMinimalPush(valtype{}, opcodetype(1)));
        REQUIRE_FALSE(CheckMinimalPush(valtype{5}, opcodetype(1)));
        REQUIRE_FALSE(CheckMinimalPush(valtype{0x81}, opcodetype(1)));
        REQUIRE(CheckMinimalPush(valtype{0x11}, opcodetype(1)));
        REQUIRE_FALSE(CheckMinimalPush(valtype(20, 0), OP_PUSHDATA1));
    }
}

TEST_CASE("Opcode names", "[script]") {
    REQUIRE(GetOpName(OP_CHECKSIG) == "OP_CHECKSIG");
    REQUIRE(GetOpName(OP_CHECKSEQUENCEVERIFY) == "OP_CHECKSEQUENCEVERIFY");
    REQUIRE(GetOpCode("OP_CHECKSIG") == OP_CHECKSIG);
    REQUIRE(GetOpCode("CHECKSIG") == OP_CHECKSIG);
    REQUIRE(GetOpCode("CSV") == OP_CHECKSEQUENCEVERIFY);
    REQUIRE(GetOpCode("NOT_AN_OPCODE") == OP_INVALIDOPCODE);
    REQUIRE(DecodeOP_N(OP_7) == 7);
    REQUIRE(EncodeOP_N(16) == OP_16);
}
