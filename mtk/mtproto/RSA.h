//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/BigNum.h"
#include "mtk/utils/common.h"
#include "mtk/utils/logging.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/Status.h"

namespace mtk {

extern int VERBOSITY_NAME(rsa);

namespace mtproto {

namespace detail {
class EvpKey;
}  // namespace detail

class RsaPublicKey {
 public:
  // PKCS#1 "RSA PUBLIC KEY" is tried first, then SubjectPublicKeyInfo "PUBLIC KEY"
  static Result<RsaPublicKey> from_pem(Slice pem);
  static Result<RsaPublicKey> from_der(Slice der);

  // big-endian modulus and public exponent
  static Result<RsaPublicKey> from_components(Slice n, Slice e);

  // low 64 bits of SHA-1 of the TL-serialized rsa_public_key n:bytes e:bytes
  static int64 calc_fingerprint(Slice n, Slice e);

  RsaPublicKey(const RsaPublicKey &) = delete;
  RsaPublicKey &operator=(const RsaPublicKey &) = delete;
  RsaPublicKey(RsaPublicKey &&other) noexcept;
  RsaPublicKey &operator=(RsaPublicKey &&other) noexcept;
  ~RsaPublicKey();

  RsaPublicKey clone() const;

  int64 get_fingerprint() const {
    return fingerprint_;
  }

  int bits() const {
    return bits_;
  }

  // modulus length in bytes
  size_t size() const;

  string n_binary() const {
    return n_.to_binary();
  }

  string e_binary() const {
    return e_.to_binary();
  }

  // RSA-OAEP with SHA-256 and MGF1-SHA-256; only for 2048-bit keys and at most size() - 42 bytes of data
  Result<string> encrypt_oaep(Slice data) const;

  Result<string> encrypt_pkcs1v15(Slice data) const;

  // textbook data^e mod n; data must be exactly size() bytes
  Result<string> encrypt_raw(Slice data) const;

  Status verify(Slice signature, Slice data) const;

  // SubjectPublicKeyInfo
  Result<string> to_pem() const;
  Result<string> to_der() const;

 private:
  BigNum n_;
  BigNum e_;
  int bits_ = 0;
  int64 fingerprint_ = 0;
  unique_ptr<detail::EvpKey> key_;

  RsaPublicKey(BigNum n, BigNum e, unique_ptr<detail::EvpKey> key);

  static Result<RsaPublicKey> from_evp_key(unique_ptr<detail::EvpKey> key);

  friend class RsaPrivateKey;
};

class RsaPrivateKey {
 public:
  // only 2048-bit and 4096-bit keys are supported
  static Result<RsaPrivateKey> generate(int bits);

  // PKCS#1 "RSA PRIVATE KEY" is tried first, then unencrypted PKCS#8 "PRIVATE KEY"
  static Result<RsaPrivateKey> from_pem(Slice pem);
  static Result<RsaPrivateKey> from_der(Slice der);

  RsaPrivateKey(const RsaPrivateKey &) = delete;
  RsaPrivateKey &operator=(const RsaPrivateKey &) = delete;
  RsaPrivateKey(RsaPrivateKey &&other) noexcept;
  RsaPrivateKey &operator=(RsaPrivateKey &&other) noexcept;
  ~RsaPrivateKey();

  RsaPrivateKey clone() const;

  int bits() const;

  size_t size() const;

  Result<RsaPublicKey> public_key() const;

  Result<string> decrypt_oaep(Slice data) const;

  Result<string> decrypt_pkcs1v15(Slice data) const;

  // PKCS#8
  Result<string> to_pem() const;
  Result<string> to_der() const;

 private:
  unique_ptr<detail::EvpKey> key_;

  explicit RsaPrivateKey(unique_ptr<detail::EvpKey> key);
};

class PublicRsaKeyInterface {
 public:
  PublicRsaKeyInterface() = default;
  PublicRsaKeyInterface(const PublicRsaKeyInterface &) = delete;
  PublicRsaKeyInterface &operator=(const PublicRsaKeyInterface &) = delete;
  PublicRsaKeyInterface(PublicRsaKeyInterface &&) = delete;
  PublicRsaKeyInterface &operator=(PublicRsaKeyInterface &&) = delete;
  virtual ~PublicRsaKeyInterface() = default;

  struct RsaKey {
    RsaPublicKey rsa;
    int64 fingerprint;
  };
  virtual Result<RsaKey> get_rsa_key(const vector<int64> &fingerprints) = 0;
  virtual void drop_keys() = 0;
};

}  // namespace mtproto
}  // namespace mtk
