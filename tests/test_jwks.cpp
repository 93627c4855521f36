#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "my_error_codes.hpp"
#include "openssl/jwks.hpp"
#include "test_cert_helper.hpp"

namespace clusterboot {
namespace {

namespace json = boost::json;

class JwksTest : public ::testing::Test {
protected:
  static void SetUpTestSuite() {
    rsa_pem_ = testutil::rsa_certificate_pem();
    ec_pem_ = testutil::ec_certificate_pem();
  }

  static inline std::string rsa_pem_;
  static inline std::string ec_pem_;
};

TEST_F(JwksTest, RsaJwkHasFixedFieldOrder) {
  auto jwk = jwks::rsa_public_jwk(rsa_pem_, "registry-auth-jwt-signer");
  ASSERT_TRUE(jwk.is_ok()) << jwk.error().what;
  const auto &obj = jwk.value();
  std::vector<std::string> keys;
  for (const auto &kv : obj) {
    keys.emplace_back(kv.key());
  }
  EXPECT_EQ(keys, (std::vector<std::string>{"kty", "kid", "use", "alg", "n",
                                            "e"}));
  EXPECT_EQ(obj.at("kty"), "RSA");
  EXPECT_EQ(obj.at("kid"), "registry-auth-jwt-signer");
  EXPECT_EQ(obj.at("use"), "sig");
  EXPECT_EQ(obj.at("alg"), "RS256");
  // 65537 -> 01 00 01
  EXPECT_EQ(obj.at("e"), "AQAB");

  std::string n(obj.at("n").as_string().c_str());
  EXPECT_EQ(n.find('='), std::string::npos);
  EXPECT_EQ(n.find('+'), std::string::npos);
  EXPECT_EQ(n.find('/'), std::string::npos);
  // 2048-bit modulus, 256 bytes, no leading zero: ceil(256 * 4 / 3) chars.
  EXPECT_EQ(n.size(), 342u);
}

TEST_F(JwksTest, KnownCertificateGivesKnownKeySet) {
  auto jwk = jwks::rsa_public_jwk(testutil::kFixedRsaCertificatePem,
                                  "registry-auth-jwt-signer");
  ASSERT_TRUE(jwk.is_ok()) << jwk.error().what;
  EXPECT_EQ(jwk.value().at("n").as_string(), testutil::kFixedRsaModulusB64Url);
  EXPECT_EQ(jwk.value().at("e").as_string(), "AQAB");

  auto doc = jwks::derive_key_set(testutil::kFixedRsaCertificatePem,
                                  "registry-auth-jwt-signer");
  ASSERT_TRUE(doc.is_ok()) << doc.error().what;
  EXPECT_EQ(doc.value(),
            std::string(R"({"keys":[{"kty":"RSA","kid":"registry-auth-jwt-signer",)"
                        R"("use":"sig","alg":"RS256","n":")") +
                testutil::kFixedRsaModulusB64Url + R"(","e":"AQAB"}]})");
}

TEST_F(JwksTest, DeriveKeySetIsDeterministic) {
  auto first = jwks::derive_key_set(rsa_pem_, "kid-1");
  auto second = jwks::derive_key_set(rsa_pem_, "kid-1");
  ASSERT_TRUE(first.is_ok());
  ASSERT_TRUE(second.is_ok());
  EXPECT_EQ(first.value(), second.value());

  auto doc = json::parse(first.value()).as_object();
  ASSERT_EQ(doc.size(), 1u);
  const auto &keys = doc.at("keys").as_array();
  ASSERT_EQ(keys.size(), 1u);
  EXPECT_EQ(keys[0].as_object().at("kid"), "kid-1");
}

TEST_F(JwksTest, EcCertificateIsUnsupported) {
  auto r = jwks::derive_key_set(ec_pem_, "kid");
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::OPENSSL::UNSUPPORTED_KEY_TYPE);
}

TEST_F(JwksTest, GarbageIsMalformedInput) {
  auto empty = jwks::derive_key_set("", "kid");
  ASSERT_TRUE(empty.is_err());
  EXPECT_EQ(empty.error().code, my_errors::OPENSSL::MALFORMED_INPUT);

  auto junk = jwks::derive_key_set(
      "-----BEGIN CERTIFICATE-----\nnot base64 at all\n"
      "-----END CERTIFICATE-----\n",
      "kid");
  ASSERT_TRUE(junk.is_err());
  EXPECT_EQ(junk.error().code, my_errors::OPENSSL::MALFORMED_INPUT);
}

TEST_F(JwksTest, DifferentKeysGiveDifferentModulus) {
  auto other = testutil::rsa_certificate_pem();
  auto a = jwks::rsa_public_jwk(rsa_pem_, "k");
  auto b = jwks::rsa_public_jwk(other, "k");
  ASSERT_TRUE(a.is_ok());
  ASSERT_TRUE(b.is_ok());
  EXPECT_NE(a.value().at("n"), b.value().at("n"));
}

} // namespace
} // namespace clusterboot
