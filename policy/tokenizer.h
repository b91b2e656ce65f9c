// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_policy_tokenizer_h_
#define included_msc_policy_tokenizer_h_

#include <cstddef>
#include <string>
#include <vector>

namespace msc {

enum token_type {
    tok_undef,
    tok_symbol,    // function name, key name, hex starting with a letter
    tok_number,    // decimal, or hex starting with a digit
    tok_lparen,
    tok_rparen,
    tok_comma,
    tok_at,        // weight separator
    tok_ws,
};

extern const char* token_type_str[];

/** A token and the byte span [begin, end) it was read from. */
struct token_t {
    token_type token = tok_undef;
    std::string value;
    size_t begin = 0;
    size_t end = 0;

    token_t(token_type token_in, std::string value_in, size_t begin_in, size_t end_in)
    : token(token_in), value(std::move(value_in)), begin(begin_in), end(end_in) {}

    /** Whether every character is a hex digit (a hex argument may come in as a symbol or a number). */
    bool is_hex() const;
};

/**
 * Classify character c, given the type of the token currently being read.
 */
inline token_type determine_token(const char c, token_type current)
{
    if (c == '(') return tok_lparen;
    if (c == ')') return tok_rparen;
    if (c == ',') return tok_comma;
    if (c == '@') return tok_at;
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') return tok_ws;
    if (c >= '0' && c <= '9') return current == tok_symbol ? tok_symbol : tok_number;
    if (current == tok_number &&
        ((c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F'))) return tok_number; // hexadecimal
    if ((c >= 'a' && c <= 'z') ||
        (c >= 'A' && c <= 'Z') ||
        c == '_') return tok_symbol;
    return tok_undef;
}

/** Split s into tokens, dropping whitespace. Throws parse_error on a character no token can contain. */
std::vector<token_t> tokenize(const std::string& s);

} // namespace msc

#endif // included_msc_policy_tokenizer_h_
