// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_util_strings_h_
#define included_msc_util_strings_h_

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace msc {

typedef std::vector<unsigned char> valtype;

std::string HexStr(const valtype& data);
bool IsHex(const std::string& str);

/** Decode an even-length hex string; returns an empty vector on malformed input. */
valtype ParseHex(const std::string& str);

/** Strict decimal parse; rejects signs, whitespace and overflow. */
bool ParseUInt32(const std::string& str, uint32_t* out);

std::string Join(const std::vector<std::string>& list, const std::string& separator);

/**
 * Parse a comma and/or space separated list of inputs into an existing set.
 */
void DelimiterSet(const std::string& input, std::set<std::string>& output, bool lowercase = true);

} // namespace msc

#endif // included_msc_util_strings_h_
