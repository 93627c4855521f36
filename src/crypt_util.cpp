#include "openssl/crypt_util.hpp"

#include <fmt/format.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>
#include <vector>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"

namespace clusterboot {
namespace cryptutil {

std::string base64_encode(std::string_view bytes) {
  if (bytes.empty()) {
    return {};
  }
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<const unsigned char*>(bytes.data()),
      static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::optional<std::string> base64_decode(std::string_view text) {
  if (text.empty()) {
    return std::string{};
  }
  if (text.size() % 4 != 0) {
    return std::nullopt;
  }
  size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  // EVP_DecodeBlock tolerates embedded whitespace and padding in the middle.
  auto body = text.substr(0, text.size() - padding);
  bool valid = std::all_of(body.begin(), body.end(), [](char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
  });
  if (!valid) {
    return std::nullopt;
  }
  std::string out(3 * (text.size() / 4), '\0');
  int written = EVP_DecodeBlock(
      reinterpret_cast<unsigned char*>(out.data()),
      reinterpret_cast<const unsigned char*>(text.data()),
      static_cast<int>(text.size()));
  if (written < 0 || static_cast<size_t>(written) < padding) {
    return std::nullopt;
  }
  out.resize(static_cast<size_t>(written) - padding);
  return out;
}

std::string base64_to_base64url(std::string base64) {
  std::replace(base64.begin(), base64.end(), '+', '-');
  std::replace(base64.begin(), base64.end(), '/', '_');
  stringutil::remove_right_paddings(base64, '=');
  return base64;
}

std::string sha256_hex(std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         digest);
  std::string hex;
  hex.reserve(SHA256_DIGEST_LENGTH * 2);
  for (unsigned char b : digest) {
    hex += fmt::format("{:02x}", b);
  }
  return hex;
}

monad::MyResult<std::string> random_bytes(size_t size) {
  std::vector<unsigned char> buffer(size);
  if (RAND_bytes(buffer.data(), static_cast<int>(size)) != 1) {
    return monad::MyResult<std::string>::Err(
        monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                     .what = "RAND_bytes failed to generate random data."});
  }
  return monad::MyResult<std::string>::Ok(
      std::string(buffer.begin(), buffer.end()));
}

std::string bn_to_bytes(const BIGNUM* bn) {
  std::string bytes(static_cast<size_t>(BN_num_bytes(bn)), '\0');
  BN_bn2bin(bn, reinterpret_cast<unsigned char*>(bytes.data()));
  auto first = bytes.find_first_not_of('\0');
  if (first == std::string::npos) {
    return std::string(1, '\0');
  }
  return bytes.substr(first);
}

}  // namespace cryptutil
}  // namespace clusterboot
