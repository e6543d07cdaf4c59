#pragma once
#include <string>
#include <vector>
#include "encoding/abi.hpp"
#include "numeric/big_int.hpp"

class ContractReader;

// Claim surface of the DropERC20 contract
namespace DropERC20 {
  // IClaimCondition.ClaimCondition, field for field
  struct ClaimConditionData {
    BigInt start_timestamp = 0;
    BigInt max_claimable_supply = 0;
    BigInt supply_claimed = 0;
    BigInt quantity_limit_per_wallet = 0;
    ABI::Bytes merkle_root;
    BigInt price_per_token = 0;
    std::string currency;
    std::string metadata;
  };

  struct AllowlistProof {
    std::vector<ABI::Bytes> proof;  // bytes32 each
    BigInt quantity_limit_per_wallet = 0;
    BigInt price_per_token = 0;
    std::string currency;
  };

  BigInt ActiveClaimConditionId(ContractReader& reader, const std::string& drop);
  ClaimConditionData ClaimConditionById(ContractReader& reader, const std::string& drop, const BigInt& condition_id);

  // claim(address,uint256,address,uint256,(bytes32[],uint256,uint256,address),bytes)
  std::string ClaimCall(const std::string& receiver,
                        const BigInt& quantity,
                        const std::string& currency,
                        const BigInt& price_per_token,
                        const AllowlistProof& proof,
                        const ABI::Bytes& data);
}
