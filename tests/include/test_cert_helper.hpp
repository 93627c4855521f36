#pragma once

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>

#include <stdexcept>
#include <string>

#include "openssl/crypt_util.hpp"

namespace testutil {

using clusterboot::cryptutil::BIO_ptr;
using clusterboot::cryptutil::EVP_PKEY_ptr;
using clusterboot::cryptutil::X509_ptr;

// Fixed self-signed RSA-2048 certificate (CN=registry-auth, e=65537) for
// known-answer checks.
inline constexpr const char *kFixedRsaCertificatePem =
    "-----BEGIN CERTIFICATE-----\n"
    "MIIDEzCCAfugAwIBAgIUYBA422JWtk7P3ZyFRJqXKySqWfUwDQYJKoZIhvcNAQEL\n"
    "BQAwGDEWMBQGA1UEAwwNcmVnaXN0cnktYXV0aDAgFw0yNjEwMTgwNjIzMThaGA8y\n"
    "MTI2MDkyNDA2MjMxOFowGDEWMBQGA1UEAwwNcmVnaXN0cnktYXV0aDCCASIwDQYJ\n"
    "KoZIhvcNAQEBBQADggEPADCCAQoCggEBAJkSkNrPcOw8erjunOyPa802tP5+uPfF\n"
    "oi40mwOEfuaJp5QN1AixHviSlFe1J6TdS2tT3XYNCuqBnSlX9qTHyi1oaKKS+1Le\n"
    "UgTIIVUBA4M1snYrdrCG15R+s4CJ7izAx7ZstxaFPHzpNeQGKRq0TyGgdFl+r+G/\n"
    "9XETsZNPTJeTW7YYeutL8R75Yy7ts7M/X4W1z9yWVFZK2FZ9eUsF+e31bdj9roab\n"
    "J/bqXq9xxk3iyfcdRSBVdwhJEh0/OZKpG4SsIKTt1H74b9rXsg1pJeIUluUkya76\n"
    "ZtXW2/vp6xYW7JfI1Yp4AvaE4AEhupCRKAIgI0/oWTaDpheRVBTjlIsCAwEAAaNT\n"
    "MFEwHQYDVR0OBBYEFI4epLNZBAmtlMRok3G6xVxXPOffMB8GA1UdIwQYMBaAFI4e\n"
    "pLNZBAmtlMRok3G6xVxXPOffMA8GA1UdEwEB/wQFMAMBAf8wDQYJKoZIhvcNAQEL\n"
    "BQADggEBABNXAc+P2yRJFLtTjClwwPhCjd9+NImYpWnqyVrTIKyJcTK5Zr2zC5YC\n"
    "ftX7kmSFIcyUioznSgmvz+vDNE26/iSKzo+Sp7+gQvaYBEke69m2PygyWMB5LK4n\n"
    "LXqrnFxSyZfXXAzlY8D1k4TTDcxvm2Odr+p1IA2wbLShGz5lhDlNHeXag8X7BUeU\n"
    "mbhXOWgLZJhaMTM1LCr+rHzGGIQoS8DkbLzStgYgtIH/cnAiWpVmWknq2zq+5roy\n"
    "qEN1/jS6jL3V9AFu43Cce8TDuTaFE+3EkobEQq47WM46s+SiC9EqULHbp2lV9ya/\n"
    "8PZvSNVT9i1jAO0Eo3AJUxYtFJd02WU=\n"
    "-----END CERTIFICATE-----\n";

// base64url of the modulus in kFixedRsaCertificatePem.
inline constexpr const char *kFixedRsaModulusB64Url =
    "mRKQ2s9w7Dx6uO6c7I9rzTa0_n6498WiLjSbA4R-5omnlA3UCLEe-JKUV7Un"
    "pN1La1Pddg0K6oGdKVf2pMfKLWhoopL7Ut5SBMghVQEDgzWydit2sIbXlH6z"
    "gInuLMDHtmy3FoU8fOk15AYpGrRPIaB0WX6v4b_1cROxk09Ml5Nbthh660vx"
    "HvljLu2zsz9fhbXP3JZUVkrYVn15SwX57fVt2P2uhpsn9uper3HGTeLJ9x1F"
    "IFV3CEkSHT85kqkbhKwgpO3Ufvhv2teyDWkl4hSW5STJrvpm1dbb--nrFhbs"
    "l8jVingC9oTgASG6kJEoAiAjT-hZNoOmF5FUFOOUiw";

inline EVP_PKEY_ptr generate_rsa_key(unsigned int bits = 2048) {
  EVP_PKEY_ptr key(EVP_RSA_gen(bits), &EVP_PKEY_free);
  if (!key) {
    throw std::runtime_error("EVP_RSA_gen failed");
  }
  return key;
}

inline EVP_PKEY_ptr generate_ec_key() {
  EVP_PKEY_ptr key(EVP_EC_gen("P-256"), &EVP_PKEY_free);
  if (!key) {
    throw std::runtime_error("EVP_EC_gen failed");
  }
  return key;
}

// Self-signed certificate over key, PEM encoded.
inline std::string self_signed_pem(EVP_PKEY *key,
                                   const std::string &cn = "registry-auth") {
  X509_ptr cert(X509_new(), &X509_free);
  if (!cert) {
    throw std::runtime_error("X509_new failed");
  }
  X509_set_version(cert.get(), 2);
  ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
  X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
  X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24 * 365);
  X509_set_pubkey(cert.get(), key);
  X509_NAME *name = X509_get_subject_name(cert.get());
  X509_NAME_add_entry_by_txt(
      name, "CN", MBSTRING_ASC,
      reinterpret_cast<const unsigned char *>(cn.c_str()), -1, -1, 0);
  X509_set_issuer_name(cert.get(), name);
  if (X509_sign(cert.get(), key, EVP_sha256()) <= 0) {
    throw std::runtime_error("X509_sign failed");
  }

  BIO_ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!bio || PEM_write_bio_X509(bio.get(), cert.get()) != 1) {
    throw std::runtime_error("PEM_write_bio_X509 failed");
  }
  char *data = nullptr;
  long len = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<size_t>(len));
}

inline std::string rsa_certificate_pem() {
  auto key = generate_rsa_key();
  return self_signed_pem(key.get());
}

inline std::string ec_certificate_pem() {
  auto key = generate_ec_key();
  return self_signed_pem(key.get());
}

} // namespace testutil
