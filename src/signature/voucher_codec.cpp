#include "signature/voucher_codec.hpp"
#include "numeric/decimal_converter.hpp"
#include "common/errors.hpp"
#include "utils/hex.hpp"
#include <chrono>
#include <vector>
#include <cryptopp/osrng.h>

namespace {
  std::vector<unsigned char> DecodeUid(const std::string& uid) {
    auto bytes = HexToBytes(uid);
    if (bytes.size() != 32) throw ParseError("uid must be 32 bytes, got " + std::to_string(bytes.size()));
    return bytes;
  }

  long long NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  }
}

namespace VoucherCodec {
  Token::MintRequest BuildMintRequest(const Token::MintPayload& payload, const std::string& primary_sale_recipient) {
    Token::MintRequest req;
    req.to = payload.to;
    req.primary_sale_recipient = primary_sale_recipient;
    req.quantity = DecimalConverter::ToWei(payload.quantity);
    req.price = DecimalConverter::ToWei(payload.price.empty() ? "0" : payload.price);
    req.currency = payload.currency_address;
    if (payload.mint_start_time < 0 || payload.mint_end_time < 0) throw ParseError("negative validity timestamp");
    req.validity_start_timestamp = payload.mint_start_time;
    req.validity_end_timestamp = payload.mint_end_time;
    req.uid = DecodeUid(payload.uid);
    return req;
  }

  std::string RandomUid() {
    CryptoPP::AutoSeededRandomPool rng;
    std::vector<unsigned char> uid(32);
    rng.GenerateBlock(uid.data(), uid.size());
    return BytesToHex0x(uid);
  }

  Token::MintPayload NewMintPayload(const std::string& to, const std::string& quantity) {
    Token::MintPayload p;
    p.to = to;
    p.quantity = quantity;
    p.uid = RandomUid();
    p.mint_start_time = NowSeconds();
    p.mint_end_time = p.mint_start_time + kDefaultValiditySeconds;
    return p;
  }

  Token::SignedPayloadOutput ToSignedPayloadOutput(const Token::MintRequest& req) {
    Token::SignedPayloadOutput out;
    out.to = req.to;
    out.primary_sale_recipient = req.primary_sale_recipient;
    out.quantity = BigInts::ToDecimalString(req.quantity);
    out.price = BigInts::ToDecimalString(req.price);
    out.currency_address = req.currency;
    out.uid = BytesToHex0x(req.uid);
    out.mint_start_time = req.validity_start_timestamp.convert_to<long long>();
    out.mint_end_time = req.validity_end_timestamp.convert_to<long long>();
    return out;
  }

  Token::MintRequest RequestFromSignedPayload(const Token::SignedPayloadOutput& out) {
    Token::MintRequest req;
    req.to = out.to;
    req.primary_sale_recipient = out.primary_sale_recipient;
    req.quantity = BigInts::FromDecimalString(out.quantity);
    req.price = BigInts::FromDecimalString(out.price);
    req.currency = out.currency_address;
    if (out.mint_start_time < 0 || out.mint_end_time < 0) throw ParseError("negative validity timestamp");
    req.validity_start_timestamp = out.mint_start_time;
    req.validity_end_timestamp = out.mint_end_time;
    req.uid = DecodeUid(out.uid);
    return req;
  }
}
