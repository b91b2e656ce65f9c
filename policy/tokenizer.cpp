// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <policy/tokenizer.h>

#include <miniscript/errors.h>

#include <tinyformat.h>

namespace msc {

const char* token_type_str[] = {
    "???",
    "symbol",
    "number",
    "'('",
    "')'",
    "','",
    "'@'",
    "ws",
};

bool token_t::is_hex() const
{
    if (value.empty()) return false;
    for (char c : value) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) return false;
    }
    return true;
}

std::vector<token_t> tokenize(const std::string& s)
{
    std::vector<token_t> ret;
    bool open = false;
    size_t token_start = 0;
    size_t i;
    for (i = 0; i < s.size(); ++i) {
        auto token = determine_token(s[i], open ? ret.back().token : tok_undef);
        if (token == tok_undef) {
            throw parse_error(strprintf("unexpected character '%c'", s[i]), i, i + 1);
        }
        // if open, see if it stays open
        if (open) {
            open = token == ret.back().token;
            if (open) continue;
            ret.back().value = s.substr(token_start, i - token_start);
            ret.back().end = i;
        }
        switch (token) {
        case tok_symbol:
        case tok_number:
            token_start = i;
            ret.emplace_back(token, "", i, i);
            open = true;
            break;
        case tok_lparen:
        case tok_rparen:
        case tok_comma:
        case tok_at:
            ret.emplace_back(token, s.substr(i, 1), i, i + 1);
            break;
        case tok_ws:
        case tok_undef:
            break;
        }
    }
    if (open) {
        ret.back().value = s.substr(token_start, i - token_start);
        ret.back().end = i;
    }
    return ret;
}

} // namespace msc
