// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_RSA_KEY_HPP
#define SKYLIFT_RSA_KEY_HPP

#include <memory>
#include <string>

// Forward declaration to keep OpenSSL out of public headers
struct evp_pkey_st;

namespace skylift {
namespace agent {

/**
 * RSA private key used as the agent's certificate material.
 *
 * Copies share the underlying key. The private part never leaves this class;
 * only the public modulus and exponent are exported (as a JWK).
 */
class RsaKey {
public:
  /**
   * Parse a PEM private key (PKCS#1 or PKCS#8).
   *
   * @throws CertificateSetupFailed if the PEM is malformed or not RSA
   */
  static RsaKey fromPem(const std::string& pem);

  /**
   * @throws CertificateSetupFailed if the file can't be read or parsed
   */
  static RsaKey loadFromFile(const std::string& path);

  int bits() const;

  /**
   * Public modulus, base64url without padding
   */
  std::string modulus_b64url() const;

  /**
   * Public exponent, base64url without padding
   */
  std::string exponent_b64url() const;

  /**
   * Public key as a JWK object: {"kty":"RSA","n":...,"e":...,"kid":...}
   */
  std::string public_jwk_json(const std::string& key_id) const;

private:
  struct PkeyDeleter {
    void operator()(evp_pkey_st* key) const;
  };

  explicit RsaKey(std::shared_ptr<evp_pkey_st> key);

  std::string bignum_param_b64url(const char* param) const;

  std::shared_ptr<evp_pkey_st> key_;
};

/**
 * base64url encoding without padding (RFC 7515 appendix C).
 */
std::string base64url_encode(const unsigned char* data, size_t size);

}  // namespace agent
}  // namespace skylift

#endif  // SKYLIFT_RSA_KEY_HPP
