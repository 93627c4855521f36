#pragma once

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <stddef.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "result_monad.hpp"

namespace clusterboot {
namespace cryptutil {

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using X509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using BIO_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

// Standard alphabet with '=' padding.
std::string base64_encode(std::string_view bytes);

// Strict decoder for the standard alphabet; nullopt on any malformed input.
std::optional<std::string> base64_decode(std::string_view text);

// '+' -> '-', '/' -> '_', padding removed.
std::string base64_to_base64url(std::string base64);

inline std::string base64url_encode(std::string_view bytes) {
  return base64_to_base64url(base64_encode(bytes));
}

std::string sha256_hex(std::string_view data);

monad::MyResult<std::string> random_bytes(size_t size);

// Unsigned big-endian magnitude, no leading zero bytes.
std::string bn_to_bytes(const BIGNUM* bn);

}  // namespace cryptutil
}  // namespace clusterboot
