// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <catch2/catch.hpp>

#include <miniscript/errors.h>
#include <policy/tokenizer.h>

#include <cstring>

using namespace msc;

TEST_CASE("Simple Tokenize", "[tokenizer]") {
    SECTION("single tokens") {
        struct {
            const char* input;
            token_type token;
        } cases[] = {
            {"0", tok_number},
            {"144", tok_number},
            {"pk", tok_symbol},
            {"my_key", tok_symbol},
            {"k1", tok_symbol},
            {"0a1b", tok_number},
            {"ab12", tok_symbol},
            {"(", tok_lparen},
            {")", tok_rparen},
            {",", tok_comma},
            {"@", tok_at},
        };
        for (const auto& c : cases) {
            GIVEN(c.input) {
                std::vector<token_t> t = tokenize(c.input);
                REQUIRE(t.size() == 1);
                REQUIRE(t[0].token == c.token);
                REQUIRE(t[0].value == c.input);
                REQUIRE(t[0].begin == 0);
                REQUIRE(t[0].end == strlen(c.input));
            }
        }
    }
    SECTION("whitespace only") {
        REQUIRE(tokenize("").empty());
        REQUIRE(tokenize(" \t\r\n").empty());
    }
    SECTION("hex arguments") {
        REQUIRE(tokenize("0a1b")[0].is_hex());
        REQUIRE(tokenize("ab12")[0].is_hex());
        REQUIRE(!tokenize("pk")[0].is_hex());
        REQUIRE(!tokenize("k1")[0].is_hex());
    }
}

TEST_CASE("Multi-token Tokenize", "[tokenizer]") {
    SECTION("weighted policy") {
        std::vector<token_t> t = tokenize("or(9@pk(A), older(144))");
        struct {
            token_type token;
            const char* value;
            size_t begin, end;
        } expected[] = {
            {tok_symbol, "or", 0, 2},
            {tok_lparen, "(", 2, 3},
            {tok_number, "9", 3, 4},
            {tok_at, "@", 4, 5},
            {tok_symbol, "pk", 5, 7},
            {tok_lparen, "(", 7, 8},
            {tok_symbol, "A", 8, 9},
            {tok_rparen, ")", 9, 10},
            {tok_comma, ",", 10, 11},
            {tok_symbol, "older", 12, 17},
            {tok_lparen, "(", 17, 18},
            {tok_number, "144", 18, 21},
            {tok_rparen, ")", 21, 22},
            {tok_rparen, ")", 22, 23},
        };
        REQUIRE(t.size() == sizeof(expected) / sizeof(expected[0]));
        for (size_t i = 0; i < t.size(); ++i) {
            INFO(i);
            REQUIRE(t[i].token == expected[i].token);
            REQUIRE(t[i].value == expected[i].value);
            REQUIRE(t[i].begin == expected[i].begin);
            REQUIRE(t[i].end == expected[i].end);
        }
    }
    SECTION("numbers end at the first non-hex letter") {
        std::vector<token_t> t = tokenize("12g");
        REQUIRE(t.size() == 2);
        REQUIRE(t[0].value == "12");
        REQUIRE(t[0].token == tok_number);
        REQUIRE(t[1].value == "g");
        REQUIRE(t[1].token == tok_symbol);

        t = tokenize("0x10");
        REQUIRE(t.size() == 2);
        REQUIRE(t[0].value == "0");
        REQUIRE(t[1].value == "x10");
    }
    SECTION("token classification") {
        REQUIRE(determine_token('(', tok_symbol) == tok_lparen);
        REQUIRE(determine_token('7', tok_symbol) == tok_symbol);
        REQUIRE(determine_token('7', tok_undef) == tok_number);
        REQUIRE(determine_token('e', tok_number) == tok_number);
        REQUIRE(determine_token('e', tok_undef) == tok_symbol);
        REQUIRE(determine_token('$', tok_undef) == tok_undef);
    }
}

TEST_CASE("Tokenize errors", "[tokenizer]") {
    try {
        tokenize("pk(A)#");
        FAIL("expected a parse error");
    } catch (const parse_error& e) {
        REQUIRE(std::string(e.what()).find("unexpected character '#'") != std::string::npos);
        REQUIRE(e.begin() == 5);
        REQUIRE(e.end() == 6);
    }
    REQUIRE_THROWS_AS(tokenize("and(pk(A);pk(B))"), parse_error);
}
