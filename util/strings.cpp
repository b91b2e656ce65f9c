// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util/strings.h>

#include <cctype>
#include <limits>

namespace msc {

static const char* HEXDIGITS = "0123456789abcdef";

static int HexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string HexStr(const valtype& data)
{
    std::string rv;
    rv.reserve(data.size() * 2);
    for (unsigned char v : data) {
        rv += HEXDIGITS[v >> 4];
        rv += HEXDIGITS[v & 15];
    }
    return rv;
}

bool IsHex(const std::string& str)
{
    if (str.empty() || (str.size() & 1)) return false;
    for (char c : str) {
        if (HexDigit(c) < 0) return false;
    }
    return true;
}

valtype ParseHex(const std::string& str)
{
    if (!IsHex(str)) return {};
    valtype ret;
    ret.reserve(str.size() / 2);
    for (size_t i = 0; i < str.size(); i += 2) {
        ret.push_back((unsigned char)((HexDigit(str[i]) << 4) | HexDigit(str[i + 1])));
    }
    return ret;
}

bool ParseUInt32(const std::string& str, uint32_t* out)
{
    if (str.empty() || str.size() > 10) return false;
    uint64_t v = 0;
    for (char c : str) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    if (v > std::numeric_limits<uint32_t>::max()) return false;
    if (out) *out = (uint32_t)v;
    return true;
}

std::string Join(const std::vector<std::string>& list, const std::string& separator)
{
    std::string ret;
    for (size_t i = 0; i < list.size(); ++i) {
        if (i) ret += separator;
        ret += list[i];
    }
    return ret;
}

void DelimiterSet(const std::string& input, std::set<std::string>& output, bool lowercase)
{
    size_t len = input.size();
    std::string s;
    for (size_t j = 0; j <= len; ++j) {
        if (j == len || input[j] == ',' || input[j] == ' ') {
            if (s.empty()) continue;
            output.insert(s);
            s.clear();
        } else s += lowercase ? (char)tolower(input[j]) : input[j];
    }
}

} // namespace msc
