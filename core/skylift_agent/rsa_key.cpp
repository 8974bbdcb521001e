// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "rsa_key.hpp"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>
#include <vector>

#include <upload_errors.hpp>

namespace skylift {
namespace agent {

using uploader::CertificateSetupFailed;

namespace {

std::string openssl_error() {
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

std::string base64url_encode(const unsigned char* data, size_t size) {
  if (size == 0) {
    return "";
  }

  std::vector<unsigned char> out(4 * ((size + 2) / 3) + 1);
  int len = EVP_EncodeBlock(out.data(), data, static_cast<int>(size));

  std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  for (char& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return encoded;
}

void RsaKey::PkeyDeleter::operator()(evp_pkey_st* key) const {
  EVP_PKEY_free(key);
}

RsaKey::RsaKey(std::shared_ptr<evp_pkey_st> key)
    : key_(std::move(key)) {}

RsaKey RsaKey::fromPem(const std::string& pem) {
  if (pem.empty()) {
    throw CertificateSetupFailed("certificate PEM is empty");
  }

  std::unique_ptr<BIO, decltype(&BIO_free)> bio(
    BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free
  );
  if (!bio) {
    throw CertificateSetupFailed("BIO_new_mem_buf failed: " + openssl_error());
  }

  EVP_PKEY* raw = PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr);
  if (raw == nullptr) {
    throw CertificateSetupFailed("malformed private key: " + openssl_error());
  }
  std::shared_ptr<evp_pkey_st> key(raw, PkeyDeleter());

  if (EVP_PKEY_get_base_id(key.get()) != EVP_PKEY_RSA) {
    throw CertificateSetupFailed("private key is not an RSA key");
  }

  return RsaKey(std::move(key));
}

RsaKey RsaKey::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw CertificateSetupFailed("Can't open certificate file " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return fromPem(buffer.str());
}

int RsaKey::bits() const {
  return EVP_PKEY_get_bits(key_.get());
}

std::string RsaKey::bignum_param_b64url(const char* param) const {
  BIGNUM* bn = nullptr;
  if (EVP_PKEY_get_bn_param(key_.get(), param, &bn) != 1 || bn == nullptr) {
    throw CertificateSetupFailed(std::string("can't read RSA parameter ") + param);
  }
  std::unique_ptr<BIGNUM, decltype(&BN_free)> guard(bn, &BN_free);

  std::vector<unsigned char> bytes(static_cast<size_t>(BN_num_bytes(bn)));
  BN_bn2bin(bn, bytes.data());
  return base64url_encode(bytes.data(), bytes.size());
}

std::string RsaKey::modulus_b64url() const {
  return bignum_param_b64url(OSSL_PKEY_PARAM_RSA_N);
}

std::string RsaKey::exponent_b64url() const {
  return bignum_param_b64url(OSSL_PKEY_PARAM_RSA_E);
}

std::string RsaKey::public_jwk_json(const std::string& key_id) const {
  nlohmann::json jwk;
  jwk["kty"] = "RSA";
  jwk["n"] = modulus_b64url();
  jwk["e"] = exponent_b64url();
  jwk["kid"] = key_id;
  return jwk.dump();
}

}  // namespace agent
}  // namespace skylift
