#pragma once
#include <string>
#include <vector>
#include "numeric/big_int.hpp"

// Solidity ABI encoding for the calls this library makes. Every word is 32 bytes.
namespace ABI {
  using Bytes = std::vector<unsigned char>;

  // First 4 bytes of keccak256(signature), e.g. "transfer(address,uint256)" -> 0xa9059cbb
  std::string Selector(const std::string& signature);

  Bytes EncodeUint(const BigInt& v);
  Bytes EncodeAddress(const std::string& addr);
  Bytes EncodeBool(bool b);
  Bytes EncodeBytes32(const Bytes& b32);
  // length word + data right-padded to a word boundary
  Bytes EncodeBytesDynamic(const Bytes& data);
  Bytes EncodeString(const std::string& s);

  // One tuple component. Static components are placed inline in the head,
  // dynamic ones get an offset in the head and their encoding in the tail.
  struct Arg { bool dynamic = false; Bytes data; };
  inline Arg Static(Bytes b) { return Arg{false, std::move(b)}; }
  inline Arg Dynamic(Bytes b) { return Arg{true, std::move(b)}; }

  // Head/tail layout with offsets relative to the tuple start
  Bytes EncodeTuple(const std::vector<Arg>& args);
  // Dynamic array T[] of already-encoded static elements
  Bytes EncodeStaticArray(const std::vector<Bytes>& elements);

  // 0x + selector + EncodeTuple(args)
  std::string EncodeCall(const std::string& signature, const std::vector<Arg>& args);

  // Reads words out of an eth_call result. Offsets of nested dynamic data are
  // relative to the start of the enclosing tuple.
  class Reader {
  public:
    explicit Reader(const std::string& hex_result);
    Reader(const Bytes& data, size_t base);
    size_t WordCount() const;
    BigInt Uint(size_t word) const;
    std::string Address(size_t word) const;
    bool Bool(size_t word) const;
    Bytes Bytes32(size_t word) const;
    Bytes DynamicBytes(size_t word) const;
    std::string String(size_t word) const;
    // Nested dynamic tuple addressed through the offset stored at `word`
    Reader Tuple(size_t word) const;
  private:
    Bytes data_;
    size_t base_ = 0;
    const unsigned char* WordPtr(size_t word) const;
    size_t OffsetAt(size_t word) const;
  };
}
