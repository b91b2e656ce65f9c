// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef included_msc_crypto_hash_h_
#define included_msc_crypto_hash_h_

#include <vector>

namespace msc {

typedef std::vector<unsigned char> valtype;

valtype SHA256(const valtype& data);
valtype RIPEMD160(const valtype& data);

/** RIPEMD160(SHA256(x)) */
valtype Hash160(const valtype& data);

/** SHA256(SHA256(x)) */
valtype Hash256(const valtype& data);

} // namespace msc

#endif // included_msc_crypto_hash_h_
