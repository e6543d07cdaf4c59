#include "crypto/secp256k1.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include <stdexcept>

namespace Crypto {
  static secp256k1_context* GetCtx() {
    static secp256k1_context* ctx = []{
      return secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    }();
    return ctx;
  }

  Signature SignDigest(const std::vector<unsigned char>& priv32, const std::vector<unsigned char>& digest32) {
    if (priv32.size() != 32 || digest32.size() != 32) throw std::invalid_argument("bad key/digest size");
    secp256k1_ecdsa_recoverable_signature sig_raw;
    if (!secp256k1_ecdsa_sign_recoverable(GetCtx(), &sig_raw, digest32.data(), priv32.data(), nullptr, nullptr))
      throw std::runtime_error("sign failed");
    unsigned char out64[64]; int recid = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(GetCtx(), out64, &recid, &sig_raw);
    Signature sig; sig.r.assign(out64, out64 + 32); sig.s.assign(out64 + 32, out64 + 64); sig.v = static_cast<unsigned char>(27 + recid);
    return sig;
  }

  std::vector<unsigned char> PublicKeyFromPrivate(const std::vector<unsigned char>& priv32) {
    if (priv32.size() != 32) throw std::invalid_argument("bad key size");
    secp256k1_pubkey pub;
    if (!secp256k1_ec_pubkey_create(GetCtx(), &pub, priv32.data()))
      throw std::runtime_error("pubkey create failed");
    unsigned char out[65]; size_t outlen = sizeof(out);
    secp256k1_ec_pubkey_serialize(GetCtx(), out, &outlen, &pub, SECP256K1_EC_UNCOMPRESSED);
    return std::vector<unsigned char>(out, out + outlen);
  }

  std::vector<unsigned char> RecoverPublicKey(const std::vector<unsigned char>& digest32, const Signature& sig) {
    if (digest32.size() != 32) throw std::invalid_argument("bad digest size");
    if (sig.r.size() != 32 || sig.s.size() != 32) throw std::invalid_argument("bad signature size");
    if (sig.v != 27 && sig.v != 28) throw std::invalid_argument("bad recovery id");
    unsigned char in64[64];
    std::copy(sig.r.begin(), sig.r.end(), in64);
    std::copy(sig.s.begin(), sig.s.end(), in64 + 32);
    secp256k1_ecdsa_recoverable_signature sig_raw;
    if (!secp256k1_ecdsa_recoverable_signature_parse_compact(GetCtx(), &sig_raw, in64, sig.v - 27))
      throw std::runtime_error("signature parse failed");
    secp256k1_pubkey pub;
    if (!secp256k1_ecdsa_recover(GetCtx(), &pub, &sig_raw, digest32.data()))
      throw std::runtime_error("public key recovery failed");
    unsigned char out[65]; size_t outlen = sizeof(out);
    secp256k1_ec_pubkey_serialize(GetCtx(), out, &outlen, &pub, SECP256K1_EC_UNCOMPRESSED);
    return std::vector<unsigned char>(out, out + outlen);
  }

  std::string AddressFromPublicKey(const std::vector<unsigned char>& pub65) {
    if (pub65.size() != 65 || pub65[0] != 0x04) throw std::invalid_argument("expected uncompressed public key");
    // keccak256 of pubkey[1:] (skip 0x04), keep last 20 bytes
    auto hash = Keccak256(std::vector<unsigned char>(pub65.begin() + 1, pub65.end()));
    return BytesToHex0x(hash.data() + 12, 20);
  }

  std::vector<unsigned char> SerializeSignature(const Signature& sig) {
    std::vector<unsigned char> out; out.reserve(65);
    out.insert(out.end(), sig.r.begin(), sig.r.end());
    out.insert(out.end(), sig.s.begin(), sig.s.end());
    out.push_back(sig.v);
    return out;
  }

  Signature ParseSignature(const std::vector<unsigned char>& sig65) {
    if (sig65.size() != 65) throw std::invalid_argument("signature must be 65 bytes");
    Signature sig;
    sig.r.assign(sig65.begin(), sig65.begin() + 32);
    sig.s.assign(sig65.begin() + 32, sig65.begin() + 64);
    sig.v = sig65[64] < 27 ? static_cast<unsigned char>(sig65[64] + 27) : sig65[64];
    return sig;
  }
}
