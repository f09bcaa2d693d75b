//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/mtproto/RSA.h"

#include "mtk/tl/ErrorKind.h"
#include "mtk/tl/tl_object_store.h"
#include "mtk/tl/tl_storers.h"

#include "mtk/utils/as.h"
#include "mtk/utils/crypto.h"
#include "mtk/utils/misc.h"
#include "mtk/utils/ScopeGuard.h"
#include "mtk/utils/SliceBuilder.h"

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/decoder.h>
#include <openssl/encoder.h>
#include <openssl/evp.h>
#include <openssl/param_build.h>
#include <openssl/rsa.h>

namespace mtk {

int VERBOSITY_NAME(rsa) = VERBOSITY_NAME(DEBUG);

namespace mtproto {

namespace detail {

class EvpKey {
 public:
  explicit EvpKey(EVP_PKEY *pkey) : pkey_(pkey) {
    CHECK(pkey_ != nullptr);
  }
  EvpKey(const EvpKey &) = delete;
  EvpKey &operator=(const EvpKey &) = delete;
  EvpKey(EvpKey &&) = delete;
  EvpKey &operator=(EvpKey &&) = delete;
  ~EvpKey() {
    EVP_PKEY_free(pkey_);
  }

  EVP_PKEY *get() const {
    return pkey_;
  }

  // keys are never modified after creation, so the OpenSSL object can be shared
  unique_ptr<EvpKey> share() const {
    auto up_ref_result = EVP_PKEY_up_ref(pkey_);
    LOG_IF(FATAL, up_ref_result != 1);
    return make_unique<EvpKey>(pkey_);
  }

 private:
  EVP_PKEY *pkey_;
};

}  // namespace detail

namespace {

// rsa_public_key n:bytes e:bytes = RSAPublicKey, the bare form is hashed for the fingerprint
class rsa_public_key {
 public:
  Slice n_;
  Slice e_;

  rsa_public_key(Slice n, Slice e) : n_(n), e_(e) {
  }

  template <class StorerT>
  void store(StorerT &s) const {
    TlStoreString::store(n_, s);
    TlStoreString::store(e_, s);
  }
};

Status openssl_error(ErrorKind kind, Slice message) {
  return create_openssl_error(static_cast<int>(kind), message);
}

Result<unique_ptr<detail::EvpKey>> decode_key(Slice data, const char *input_type, const char *structure,
                                              int selection) {
  EVP_PKEY *pkey = nullptr;
  auto *ctx = OSSL_DECODER_CTX_new_for_pkey(&pkey, input_type, structure, "RSA", selection, nullptr, nullptr);
  if (ctx == nullptr) {
    return openssl_error(ErrorKind::KeyDecode, PSLICE() << "Can't create " << structure << " decoder");
  }
  SCOPE_EXIT {
    OSSL_DECODER_CTX_free(ctx);
  };

  auto ptr = data.ubegin();
  auto left_len = data.size();
  if (OSSL_DECODER_from_data(ctx, &ptr, &left_len) != 1 || pkey == nullptr) {
    EVP_PKEY_free(pkey);
    return openssl_error(ErrorKind::KeyDecode, PSLICE() << "Can't read " << input_type << ' ' << structure << " key");
  }
  return make_unique<detail::EvpKey>(pkey);
}

Result<unique_ptr<detail::EvpKey>> decode_key_with_fallback(Slice data, const char *input_type,
                                                            const char *first_structure,
                                                            const char *second_structure, int selection) {
  init_crypto();
  auto r_key = decode_key(data, input_type, first_structure, selection);
  if (r_key.is_ok()) {
    return r_key;
  }
  auto first_error = r_key.move_as_error();
  r_key = decode_key(data, input_type, second_structure, selection);
  if (r_key.is_ok()) {
    return r_key;
  }
  auto second_error = r_key.move_as_error();
  return create_error(ErrorKind::KeyDecode,
                      PSLICE() << "Failed to decode RSA key: " << first_error.message() << "; "
                               << second_error.message());
}

Result<string> encode_key(const detail::EvpKey &key, const char *output_type, const char *structure,
                          int selection) {
  auto *ctx = OSSL_ENCODER_CTX_new_for_pkey(key.get(), selection, output_type, structure, nullptr);
  if (ctx == nullptr) {
    return openssl_error(ErrorKind::KeyEncode, PSLICE() << "Can't create " << structure << " encoder");
  }
  SCOPE_EXIT {
    OSSL_ENCODER_CTX_free(ctx);
  };

  unsigned char *data = nullptr;
  size_t data_len = 0;
  if (OSSL_ENCODER_to_data(ctx, &data, &data_len) != 1 || data == nullptr) {
    return openssl_error(ErrorKind::KeyEncode, PSLICE() << "Can't write " << output_type << ' ' << structure);
  }
  SCOPE_EXIT {
    OPENSSL_free(data);
  };
  return string(reinterpret_cast<const char *>(data), data_len);
}

Result<BigNum> get_key_number(const detail::EvpKey &key, const char *name) {
  BIGNUM *value = nullptr;
  if (EVP_PKEY_get_bn_param(key.get(), name, &value) != 1 || value == nullptr) {
    return openssl_error(ErrorKind::KeyDecode, PSLICE() << "Can't get RSA key parameter " << name);
  }
  return BigNum::from_raw(value);
}

// applies the requested padding in a fresh EVP_PKEY_CTX, the data is encrypted or decrypted in one block
template <class InitF, class CryptF>
Result<string> evp_crypt(const detail::EvpKey &key, int padding, bool use_sha256, ErrorKind error_kind, InitF init,
                         CryptF crypt, Slice data) {
  auto *ctx = EVP_PKEY_CTX_new_from_pkey(nullptr, key.get(), nullptr);
  if (ctx == nullptr) {
    return openssl_error(error_kind, "Can't create EVP_PKEY_CTX");
  }
  SCOPE_EXIT {
    EVP_PKEY_CTX_free(ctx);
  };

  if (init(ctx) <= 0) {
    return openssl_error(error_kind, "Can't init EVP_PKEY_CTX");
  }
  if (EVP_PKEY_CTX_set_rsa_padding(ctx, padding) <= 0) {
    return openssl_error(error_kind, "Can't set RSA padding");
  }
  if (use_sha256) {
    if (EVP_PKEY_CTX_set_rsa_oaep_md(ctx, EVP_sha256()) <= 0 || EVP_PKEY_CTX_set_rsa_mgf1_md(ctx, EVP_sha256()) <= 0) {
      return openssl_error(error_kind, "Can't set RSA-OAEP digests");
    }
  }

  size_t result_len = 0;
  if (crypt(ctx, nullptr, &result_len, data.ubegin(), data.size()) <= 0) {
    return openssl_error(error_kind, "Can't calculate result length");
  }
  string result(result_len, '\0');
  if (crypt(ctx, MutableSlice(result).ubegin(), &result_len, data.ubegin(), data.size()) <= 0) {
    return openssl_error(error_kind, error_kind == ErrorKind::EncryptionFailed ? Slice("Can't encrypt")
                                                                               : Slice("Can't decrypt"));
  }
  result.resize(result_len);
  return std::move(result);
}

Result<string> public_crypt(const detail::EvpKey &key, int padding, bool use_sha256, Slice data) {
  return evp_crypt(key, padding, use_sha256, ErrorKind::EncryptionFailed, &EVP_PKEY_encrypt_init, &EVP_PKEY_encrypt,
                   data);
}

Result<string> private_crypt(const detail::EvpKey &key, int padding, bool use_sha256, Slice data) {
  return evp_crypt(key, padding, use_sha256, ErrorKind::DecryptionFailed, &EVP_PKEY_decrypt_init, &EVP_PKEY_decrypt,
                   data);
}

// accepted plaintext length is size() - 42; OpenSSL itself still rejects more than size() - 66 bytes
constexpr size_t OAEP_MAX_DATA_OVERHEAD = 42;

}  // namespace

RsaPublicKey::RsaPublicKey(BigNum n, BigNum e, unique_ptr<detail::EvpKey> key)
    : n_(std::move(n)), e_(std::move(e)), key_(std::move(key)) {
  bits_ = EVP_PKEY_get_bits(key_->get());
  fingerprint_ = calc_fingerprint(n_.to_binary(), e_.to_binary());
}

RsaPublicKey::RsaPublicKey(RsaPublicKey &&) noexcept = default;
RsaPublicKey &RsaPublicKey::operator=(RsaPublicKey &&) noexcept = default;
RsaPublicKey::~RsaPublicKey() = default;

Result<RsaPublicKey> RsaPublicKey::from_evp_key(unique_ptr<detail::EvpKey> key) {
  TRY_RESULT(n, get_key_number(*key, OSSL_PKEY_PARAM_RSA_N));
  TRY_RESULT(e, get_key_number(*key, OSSL_PKEY_PARAM_RSA_E));
  RsaPublicKey result(std::move(n), std::move(e), std::move(key));
  VLOG(rsa) << "Load " << result.bits() << "-bit RSA public key with fingerprint " << result.get_fingerprint();
  return std::move(result);
}

Result<RsaPublicKey> RsaPublicKey::from_pem(Slice pem) {
  TRY_RESULT(key, decode_key_with_fallback(pem, "PEM", "type-specific", "SubjectPublicKeyInfo", EVP_PKEY_PUBLIC_KEY));
  return from_evp_key(std::move(key));
}

Result<RsaPublicKey> RsaPublicKey::from_der(Slice der) {
  TRY_RESULT(key, decode_key_with_fallback(der, "DER", "type-specific", "SubjectPublicKeyInfo", EVP_PKEY_PUBLIC_KEY));
  return from_evp_key(std::move(key));
}

Result<RsaPublicKey> RsaPublicKey::from_components(Slice n, Slice e) {
  init_crypto();
  auto n_num = BigNum::from_binary(n);
  auto e_num = BigNum::from_binary(e);
  if (n_num.is_zero() || e_num.is_zero()) {
    return create_error(ErrorKind::KeyDecode, "RSA modulus and exponent must be positive");
  }

  BIGNUM *n_value = BN_bin2bn(n.ubegin(), narrow_cast<int>(n.size()), nullptr);
  BIGNUM *e_value = BN_bin2bn(e.ubegin(), narrow_cast<int>(e.size()), nullptr);
  SCOPE_EXIT {
    BN_free(n_value);
    BN_free(e_value);
  };
  if (n_value == nullptr || e_value == nullptr) {
    return openssl_error(ErrorKind::KeyDecode, "Can't create BIGNUM");
  }

  auto *builder = OSSL_PARAM_BLD_new();
  if (builder == nullptr) {
    return openssl_error(ErrorKind::KeyDecode, "Can't create OSSL_PARAM_BLD");
  }
  SCOPE_EXIT {
    OSSL_PARAM_BLD_free(builder);
  };
  if (OSSL_PARAM_BLD_push_BN(builder, OSSL_PKEY_PARAM_RSA_N, n_value) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder, OSSL_PKEY_PARAM_RSA_E, e_value) != 1) {
    return openssl_error(ErrorKind::KeyDecode, "Can't set RSA key parameters");
  }
  auto *params = OSSL_PARAM_BLD_to_param(builder);
  if (params == nullptr) {
    return openssl_error(ErrorKind::KeyDecode, "Can't build RSA key parameters");
  }
  SCOPE_EXIT {
    OSSL_PARAM_free(params);
  };

  auto *ctx = EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr);
  if (ctx == nullptr) {
    return openssl_error(ErrorKind::KeyDecode, "Can't create EVP_PKEY_CTX");
  }
  SCOPE_EXIT {
    EVP_PKEY_CTX_free(ctx);
  };
  EVP_PKEY *pkey = nullptr;
  if (EVP_PKEY_fromdata_init(ctx) <= 0 || EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params) <= 0 ||
      pkey == nullptr) {
    return openssl_error(ErrorKind::KeyDecode, "Can't create RSA public key");
  }
  auto key = make_unique<detail::EvpKey>(pkey);
  return RsaPublicKey(std::move(n_num), std::move(e_num), std::move(key));
}

int64 RsaPublicKey::calc_fingerprint(Slice n, Slice e) {
  auto serialized = tl_serialize(rsa_public_key(n, e));
  unsigned char key_sha1[20];
  sha1(serialized, key_sha1);
  return as<int64>(key_sha1 + 12);
}

RsaPublicKey RsaPublicKey::clone() const {
  return RsaPublicKey(n_.clone(), e_.clone(), key_->share());
}

size_t RsaPublicKey::size() const {
  return static_cast<size_t>(n_.get_num_bytes());
}

Result<string> RsaPublicKey::encrypt_oaep(Slice data) const {
  if (bits_ != 2048) {
    return invalid_key_size_error(bits_);
  }
  auto max_data_size = size() - OAEP_MAX_DATA_OVERHEAD;
  if (data.size() > max_data_size) {
    return data_too_large_error(data.size(), max_data_size);
  }
  return public_crypt(*key_, RSA_PKCS1_OAEP_PADDING, true, data);
}

Result<string> RsaPublicKey::encrypt_pkcs1v15(Slice data) const {
  return public_crypt(*key_, RSA_PKCS1_PADDING, false, data);
}

Result<string> RsaPublicKey::encrypt_raw(Slice data) const {
  if (data.size() != size()) {
    return data_too_large_error(data.size(), size());
  }
  auto x = BigNum::from_binary(data);
  if (BigNum::compare(x, n_) >= 0) {
    return create_error(ErrorKind::EncryptionFailed, "Data is not less than the RSA modulus");
  }

  BigNumContext ctx;
  BigNum y;
  BigNum::mod_exp(y, x, e_, n_, ctx);
  return y.to_binary(narrow_cast<int>(size()));
}

Status RsaPublicKey::verify(Slice /*signature*/, Slice /*data*/) const {
  return not_implemented_error("RSA signature verification");
}

Result<string> RsaPublicKey::to_pem() const {
  return encode_key(*key_, "PEM", "SubjectPublicKeyInfo", EVP_PKEY_PUBLIC_KEY);
}

Result<string> RsaPublicKey::to_der() const {
  return encode_key(*key_, "DER", "SubjectPublicKeyInfo", EVP_PKEY_PUBLIC_KEY);
}

RsaPrivateKey::RsaPrivateKey(unique_ptr<detail::EvpKey> key) : key_(std::move(key)) {
}

RsaPrivateKey::RsaPrivateKey(RsaPrivateKey &&) noexcept = default;
RsaPrivateKey &RsaPrivateKey::operator=(RsaPrivateKey &&) noexcept = default;
RsaPrivateKey::~RsaPrivateKey() = default;

Result<RsaPrivateKey> RsaPrivateKey::generate(int bits) {
  if (bits != 2048 && bits != 4096) {
    return invalid_key_size_error(bits);
  }
  init_crypto();

  auto *ctx = EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr);
  if (ctx == nullptr) {
    return openssl_error(ErrorKind::OperationFailed, "Can't create EVP_PKEY_CTX");
  }
  SCOPE_EXIT {
    EVP_PKEY_CTX_free(ctx);
  };
  if (EVP_PKEY_keygen_init(ctx) <= 0) {
    return openssl_error(ErrorKind::OperationFailed, "Can't init RSA key generation");
  }
  if (EVP_PKEY_CTX_set_rsa_keygen_bits(ctx, bits) <= 0) {
    return openssl_error(ErrorKind::OperationFailed, "Can't set RSA key size");
  }
  EVP_PKEY *pkey = nullptr;
  if (EVP_PKEY_generate(ctx, &pkey) <= 0 || pkey == nullptr) {
    return openssl_error(ErrorKind::OperationFailed, "Can't generate RSA key");
  }
  VLOG(rsa) << "Generated " << bits << "-bit RSA private key";
  return RsaPrivateKey(make_unique<detail::EvpKey>(pkey));
}

Result<RsaPrivateKey> RsaPrivateKey::from_pem(Slice pem) {
  TRY_RESULT(key, decode_key_with_fallback(pem, "PEM", "type-specific", "PrivateKeyInfo", EVP_PKEY_KEYPAIR));
  return RsaPrivateKey(std::move(key));
}

Result<RsaPrivateKey> RsaPrivateKey::from_der(Slice der) {
  TRY_RESULT(key, decode_key_with_fallback(der, "DER", "type-specific", "PrivateKeyInfo", EVP_PKEY_KEYPAIR));
  return RsaPrivateKey(std::move(key));
}

RsaPrivateKey RsaPrivateKey::clone() const {
  return RsaPrivateKey(key_->share());
}

int RsaPrivateKey::bits() const {
  return EVP_PKEY_get_bits(key_->get());
}

size_t RsaPrivateKey::size() const {
  return static_cast<size_t>(EVP_PKEY_get_size(key_->get()));
}

Result<RsaPublicKey> RsaPrivateKey::public_key() const {
  TRY_RESULT(n, get_key_number(*key_, OSSL_PKEY_PARAM_RSA_N));
  TRY_RESULT(e, get_key_number(*key_, OSSL_PKEY_PARAM_RSA_E));
  return RsaPublicKey::from_components(n.to_binary(), e.to_binary());
}

Result<string> RsaPrivateKey::decrypt_oaep(Slice data) const {
  return private_crypt(*key_, RSA_PKCS1_OAEP_PADDING, true, data);
}

Result<string> RsaPrivateKey::decrypt_pkcs1v15(Slice data) const {
  return private_crypt(*key_, RSA_PKCS1_PADDING, false, data);
}

Result<string> RsaPrivateKey::to_pem() const {
  return encode_key(*key_, "PEM", "PrivateKeyInfo", EVP_PKEY_KEYPAIR);
}

Result<string> RsaPrivateKey::to_der() const {
  return encode_key(*key_, "DER", "PrivateKeyInfo", EVP_PKEY_KEYPAIR);
}

}  // namespace mtproto
}  // namespace mtk
