#include "openssl/jwks.hpp"

#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/objects.h>
#include <openssl/pem.h>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"

namespace clusterboot {
namespace jwks {

namespace {

std::string last_openssl_error() {
  unsigned long code = ERR_get_error();
  if (code == 0) {
    return "unknown OpenSSL error";
  }
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

}  // namespace

monad::MyResult<cryptutil::X509_ptr> load_certificate(const std::string& pem) {
  using Result = monad::MyResult<cryptutil::X509_ptr>;
  if (pem.empty()) {
    return Result::Err(
        monad::Error{.code = my_errors::OPENSSL::MALFORMED_INPUT,
                     .what = "Certificate PEM is empty."});
  }
  cryptutil::BIO_ptr bio(
      BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
  if (!bio) {
    return Result::Err(
        monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                     .what = "Failed to create BIO for certificate PEM."});
  }
  cryptutil::X509_ptr cert(
      PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), &X509_free);
  if (!cert) {
    return Result::Err(monad::Error{
        .code = my_errors::OPENSSL::MALFORMED_INPUT,
        .what = "Failed to parse certificate PEM: " + last_openssl_error()});
  }
  return Result::Ok(std::move(cert));
}

monad::MyResult<json::object> rsa_public_jwk(const std::string& certificate_pem,
                                             const std::string& key_id) {
  using Result = monad::MyResult<json::object>;
  auto cert_r = load_certificate(certificate_pem);
  if (cert_r.is_err()) {
    return Result::Err(cert_r.error());
  }
  cryptutil::EVP_PKEY_ptr pkey(X509_get_pubkey(cert_r.value().get()),
                               &EVP_PKEY_free);
  if (!pkey) {
    return Result::Err(monad::Error{
        .code = my_errors::OPENSSL::MALFORMED_INPUT,
        .what = "Certificate carries no readable public key: " +
                last_openssl_error()});
  }
  if (EVP_PKEY_id(pkey.get()) != EVP_PKEY_RSA) {
    const char* sn = OBJ_nid2sn(EVP_PKEY_id(pkey.get()));
    return Result::Err(monad::Error{
        .code = my_errors::OPENSSL::UNSUPPORTED_KEY_TYPE,
        .what = std::string("Certificate public key is not RSA: ") +
                (sn ? sn : "unknown")});
  }

  BIGNUM *n_raw = nullptr, *e_raw = nullptr;
  cryptutil::BIGNUM_ptr n(nullptr, &BN_free), e(nullptr, &BN_free);
  if (EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_RSA_N, &n_raw) != 1) {
    return Result::Err(
        monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                     .what = "Failed to get RSA parameters n."});
  }
  n.reset(n_raw);
  if (EVP_PKEY_get_bn_param(pkey.get(), OSSL_PKEY_PARAM_RSA_E, &e_raw) != 1) {
    return Result::Err(
        monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                     .what = "Failed to get RSA parameters e."});
  }
  e.reset(e_raw);

  json::object jwk;
  jwk["kty"] = "RSA";
  jwk["kid"] = key_id;
  jwk["use"] = "sig";
  jwk["alg"] = "RS256";
  jwk["n"] = cryptutil::base64url_encode(cryptutil::bn_to_bytes(n.get()));
  jwk["e"] = cryptutil::base64url_encode(cryptutil::bn_to_bytes(e.get()));
  return Result::Ok(std::move(jwk));
}

monad::MyResult<std::string> derive_key_set(const std::string& certificate_pem,
                                            const std::string& key_id) {
  return rsa_public_jwk(certificate_pem, key_id)
      .map([&key_id](json::object jwk) {
        json::array keys;
        keys.emplace_back(std::move(jwk));
        json::object doc;
        doc["keys"] = std::move(keys);
        BOOST_LOG_SEV(app_logger(), trivial::debug)
            << "Derived key set for kid " << key_id;
        return json::serialize(doc);
      });
}

}  // namespace jwks
}  // namespace clusterboot
