// Copyright (c) 2021 The msc developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <crypto/hash.h>

#include <openssl/evp.h>

#include <stdexcept>

namespace msc {

static valtype Digest(const EVP_MD* md, const valtype& data)
{
    if (!md) throw std::runtime_error("digest algorithm unavailable in libcrypto");
    valtype out(EVP_MAX_MD_SIZE);
    unsigned int out_len = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    bool ok = EVP_DigestInit_ex(ctx, md, nullptr) == 1
        && EVP_DigestUpdate(ctx, data.data(), data.size()) == 1
        && EVP_DigestFinal_ex(ctx, out.data(), &out_len) == 1;
    EVP_MD_CTX_free(ctx);
    if (!ok) throw std::runtime_error("digest computation failed");
    out.resize(out_len);
    return out;
}

valtype SHA256(const valtype& data)
{
    return Digest(EVP_sha256(), data);
}

valtype RIPEMD160(const valtype& data)
{
    return Digest(EVP_ripemd160(), data);
}

valtype Hash160(const valtype& data)
{
    return RIPEMD160(SHA256(data));
}

valtype Hash256(const valtype& data)
{
    return SHA256(SHA256(data));
}

} // namespace msc
