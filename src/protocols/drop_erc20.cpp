#include "protocols/drop_erc20.hpp"
#include "token/contract_io.hpp"
#include <string>

namespace DropERC20 {
  BigInt ActiveClaimConditionId(ContractReader& reader, const std::string& drop) {
    return ABI::Reader(reader.Call(drop, ABI::EncodeCall("getActiveClaimConditionId()", {}))).Uint(0);
  }

  ClaimConditionData ClaimConditionById(ContractReader& reader, const std::string& drop, const BigInt& condition_id) {
    auto data = ABI::EncodeCall("getClaimConditionById(uint256)", {ABI::Static(ABI::EncodeUint(condition_id))});
    // The struct holds a string, so the return value is an offset to the tuple
    ABI::Reader t = ABI::Reader(reader.Call(drop, data)).Tuple(0);
    ClaimConditionData c;
    c.start_timestamp = t.Uint(0);
    c.max_claimable_supply = t.Uint(1);
    c.supply_claimed = t.Uint(2);
    c.quantity_limit_per_wallet = t.Uint(3);
    c.merkle_root = t.Bytes32(4);
    c.price_per_token = t.Uint(5);
    c.currency = t.Address(6);
    c.metadata = t.String(7);
    return c;
  }

  std::string ClaimCall(const std::string& receiver,
                        const BigInt& quantity,
                        const std::string& currency,
                        const BigInt& price_per_token,
                        const AllowlistProof& proof,
                        const ABI::Bytes& data) {
    std::vector<ABI::Bytes> leaves;
    for (const auto& p : proof.proof) leaves.push_back(ABI::EncodeBytes32(p));
    ABI::Bytes proof_tuple = ABI::EncodeTuple({
      ABI::Dynamic(ABI::EncodeStaticArray(leaves)),
      ABI::Static(ABI::EncodeUint(proof.quantity_limit_per_wallet)),
      ABI::Static(ABI::EncodeUint(proof.price_per_token)),
      ABI::Static(ABI::EncodeAddress(proof.currency))
    });
    return ABI::EncodeCall("claim(address,uint256,address,uint256,(bytes32[],uint256,uint256,address),bytes)", {
      ABI::Static(ABI::EncodeAddress(receiver)),
      ABI::Static(ABI::EncodeUint(quantity)),
      ABI::Static(ABI::EncodeAddress(currency)),
      ABI::Static(ABI::EncodeUint(price_per_token)),
      ABI::Dynamic(proof_tuple),
      ABI::Dynamic(ABI::EncodeBytesDynamic(data))
    });
  }
}
