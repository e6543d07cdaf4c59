#include "signature/typed_data_signer.hpp"
#include "signature/voucher_codec.hpp"
#include "protocols/erc20.hpp"
#include "protocols/token_erc20.hpp"
#include "numeric/decimal_converter.hpp"
#include "wallet/signer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

namespace {
  Token::SignedPayload Package(const Token::MintRequest& req, const Crypto::Signature& sig) {
    Token::SignedPayload out;
    out.signature = BytesToHex0x(Crypto::SerializeSignature(sig));
    out.payload = VoucherCodec::ToSignedPayloadOutput(req);
    return out;
  }
}

TypedDataSigner::TypedDataSigner(ContractReader& reader, ContractWriter& writer, WalletContext& wallet, std::string token)
  : reader_(reader), writer_(writer), wallet_(wallet), token_(std::move(token)) {}

EIP712::Domain TypedDataSigner::ResolveDomain() {
  EIP712::Domain d;
  d.name = ERC20::Name(reader_, token_);
  d.version = "1";
  d.chain_id = wallet_.ChainId();
  d.verifying_contract = token_;
  return d;
}

std::string TypedDataSigner::ResolvePrimarySaleRecipient(const Token::MintPayload& payload) {
  if (!payload.primary_sale_recipient.empty() && !SameAddress(payload.primary_sale_recipient, Token::kZeroAddress))
    return payload.primary_sale_recipient;
  return TokenERC20::PrimarySaleRecipient(reader_, token_);
}

Token::SignedPayload TypedDataSigner::Generate(const Token::MintPayload& payload,
                                               const std::optional<std::string>& signing_key) {
  auto req = VoucherCodec::BuildMintRequest(payload, ResolvePrimarySaleRecipient(payload));
  auto domain = ResolveDomain();
  if (signing_key && !signing_key->empty()) return SignRequest(req, domain, *signing_key);
  return Package(req, wallet_.SignDigest(EIP712::Digest(domain, req)));
}

Token::SignedPayload TypedDataSigner::SignRequest(const Token::MintRequest& req,
                                                  const EIP712::Domain& domain,
                                                  const std::string& private_key_hex) {
  Signer signer(private_key_hex);
  return Package(req, signer.SignDigest(EIP712::Digest(domain, req)));
}

std::string TypedDataSigner::RecoverSigner(const Token::SignedPayload& signed_payload, const EIP712::Domain& domain) {
  auto req = VoucherCodec::RequestFromSignedPayload(signed_payload.payload);
  auto sig = Crypto::ParseSignature(HexToBytes(signed_payload.signature));
  auto pub = Crypto::RecoverPublicKey(EIP712::Digest(domain, req), sig);
  return Crypto::AddressFromPublicKey(pub);
}

BigInt TypedDataSigner::PayableValue(const Token::MintRequest& req) {
  if (!Token::IsNativeToken(req.currency)) return 0;
  return req.quantity * req.price / BigInts::Pow10(DecimalConverter::kWeiDecimals);
}

bool TypedDataSigner::Verify(const Token::SignedPayload& signed_payload) {
  auto req = VoucherCodec::RequestFromSignedPayload(signed_payload.payload);
  auto sig_bytes = HexToBytes(signed_payload.signature);
  auto domain = ResolveDomain();

  std::string local_signer;
  try {
    local_signer = RecoverSigner(signed_payload, domain);
  } catch (const std::invalid_argument& e) {
    Logger::Debug(std::string("voucher signature rejected: ") + e.what());
    return false;
  } catch (const std::runtime_error& e) {
    Logger::Debug(std::string("voucher signer recovery failed: ") + e.what());
    return false;
  }

  auto onchain = TokenERC20::Verify(reader_, token_, req, sig_bytes);
  if (!onchain.success) return false;
  if (!SameAddress(onchain.signer, local_signer)) {
    Logger::Warning("verify: contract signer " + onchain.signer + " differs from recovered " + local_signer);
    return false;
  }
  return true;
}

Token::TransactionResult TypedDataSigner::Mint(const Token::SignedPayload& signed_payload) {
  auto req = VoucherCodec::RequestFromSignedPayload(signed_payload.payload);
  auto sig_bytes = HexToBytes(signed_payload.signature);
  auto domain = ResolveDomain();

  std::string local_signer;
  try {
    local_signer = RecoverSigner(signed_payload, domain);
  } catch (const std::invalid_argument& e) {
    throw SignatureMismatch(e.what());
  } catch (const std::runtime_error& e) {
    throw SignatureMismatch(e.what());
  }

  auto onchain = TokenERC20::Verify(reader_, token_, req, sig_bytes);
  if (!SameAddress(onchain.signer, local_signer))
    throw SignatureMismatch("recovered " + local_signer + ", contract recovered " + onchain.signer);

  Logger::Info("mintWithSignature to=" + req.to + " quantity=" + BigInts::ToDecimalString(req.quantity) +
               " signer=" + local_signer);
  return writer_.Write(token_, TokenERC20::MintWithSignatureCall(req, sig_bytes), PayableValue(req));
}
