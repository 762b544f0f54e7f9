#pragma once

#ifndef CHAUMAUTH_CRYPTO_TOOLS_HPP
#define CHAUMAUTH_CRYPTO_TOOLS_HPP

#include <openssl/bn.h>      // for BN_new, BN_free
#include <openssl/crypto.h>  // for OPENSSL_free
#include <openssl/evp.h>     // for EVP_MD_CTX_free, EVP_MD_free
#include <openssl/types.h>   // for BIGNUM, BN_CTX, EVP_MD

#include <memory>  // for unique_ptr

namespace chaumauth {

using EVP_MD_CTX_unique_ptr =
    typename std::unique_ptr<EVP_MD_CTX, decltype(&::EVP_MD_CTX_free)>;
using EVP_MD_unique_ptr =
    typename std::unique_ptr<EVP_MD, decltype(&::EVP_MD_free)>;
using BN_CTX_unique_ptr =
    typename std::unique_ptr<BN_CTX, decltype(&::BN_CTX_free)>;
// Secret values (x, k) are held with ::BN_clear_free as deleter, which has the
// same signature as ::BN_free.
using BN_unique_ptr = typename std::unique_ptr<BIGNUM, decltype(&::BN_free)>;
inline auto crypto_char_free(void *const ptr) -> void { OPENSSL_free(ptr); }
using CRYPTO_char_unique_ptr =
    typename std::unique_ptr<char, decltype(&chaumauth::crypto_char_free)>;

}  // namespace chaumauth

#endif /* CHAUMAUTH_CRYPTO_TOOLS_HPP */
