#include "protocols/token_erc20.hpp"
#include "token/contract_io.hpp"
#include <stdexcept>
#include <string>

namespace {
  const BigInt kUint128Limit = BigInt(1) << 128;

  void append(ABI::Bytes& buf, const ABI::Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  std::vector<ABI::Arg> RequestAndSignature(const Token::MintRequest& req, const std::vector<unsigned char>& signature) {
    return { ABI::Static(TokenERC20::EncodeMintRequest(req)), ABI::Dynamic(ABI::EncodeBytesDynamic(signature)) };
  }
}

namespace TokenERC20 {
  ABI::Bytes EncodeMintRequest(const Token::MintRequest& req) {
    if (req.validity_start_timestamp >= kUint128Limit || req.validity_end_timestamp >= kUint128Limit)
      throw std::invalid_argument("validity timestamp exceeds uint128");
    ABI::Bytes out;
    append(out, ABI::EncodeAddress(req.to));
    append(out, ABI::EncodeAddress(req.primary_sale_recipient));
    append(out, ABI::EncodeUint(req.quantity));
    append(out, ABI::EncodeUint(req.price));
    append(out, ABI::EncodeAddress(req.currency));
    append(out, ABI::EncodeUint(req.validity_start_timestamp));
    append(out, ABI::EncodeUint(req.validity_end_timestamp));
    append(out, ABI::EncodeBytes32(req.uid));
    return out;
  }

  std::string PrimarySaleRecipient(ContractReader& reader, const std::string& token) {
    return ABI::Reader(reader.Call(token, ABI::EncodeCall("primarySaleRecipient()", {}))).Address(0);
  }

  VerifyResult Verify(ContractReader& reader, const std::string& token,
                      const Token::MintRequest& req, const std::vector<unsigned char>& signature) {
    auto data = ABI::EncodeCall(std::string("verify(") + kMintRequestTuple + ",bytes)", RequestAndSignature(req, signature));
    ABI::Reader r(reader.Call(token, data));
    VerifyResult out;
    out.success = r.Bool(0);
    out.signer = r.Address(1);
    return out;
  }

  std::string MintWithSignatureCall(const Token::MintRequest& req, const std::vector<unsigned char>& signature) {
    return ABI::EncodeCall(std::string("mintWithSignature(") + kMintRequestTuple + ",bytes)", RequestAndSignature(req, signature));
  }
}
