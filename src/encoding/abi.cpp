#include "encoding/abi.hpp"
#include "crypto/keccak.hpp"
#include "utils/hex.hpp"
#include <stdexcept>

namespace {
  void append(ABI::Bytes& buf, const ABI::Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
  }

  ABI::Bytes pad32(const ABI::Bytes& in) {
    ABI::Bytes out(32, 0);
    if (in.size() > 32) {
      // take last 32
      std::copy(in.end() - 32, in.end(), out.begin());
    } else {
      std::copy(in.begin(), in.end(), out.begin() + (32 - in.size()));
    }
    return out;
  }

  void padRight(ABI::Bytes& b) {
    size_t pad = (32 - (b.size() % 32)) % 32;
    b.insert(b.end(), pad, 0);
  }
}

namespace ABI {
  std::string Selector(const std::string& signature) {
    auto hash = Crypto::Keccak256Raw(signature);
    return std::string("0x") + Strip0x(hash).substr(0, 8);
  }

  Bytes EncodeUint(const BigInt& v) {
    if (v < 0) throw std::invalid_argument("uint256 cannot be negative");
    if ((v >> 256) != 0) throw std::invalid_argument("value exceeds uint256");
    Bytes out(32, 0);
    BigInt x = v;
    for (int i = 31; i >= 0 && x > 0; --i) {
      out[i] = static_cast<unsigned char>(static_cast<unsigned>(x & 0xFF));
      x >>= 8;
    }
    return out;
  }

  Bytes EncodeAddress(const std::string& addr) {
    auto raw = HexToBytes(addr);
    if (raw.size() != 20) throw ParseError("address must be 20 bytes: '" + addr + "'");
    return pad32(raw);
  }

  Bytes EncodeBool(bool b) {
    return EncodeUint(b ? 1 : 0);
  }

  Bytes EncodeBytes32(const Bytes& b32) {
    if (b32.size() != 32) throw std::invalid_argument("bytes32 value must be 32 bytes");
    return b32;
  }

  Bytes EncodeBytesDynamic(const Bytes& data) {
    Bytes out = EncodeUint(data.size());
    Bytes padded = data;
    padRight(padded);
    append(out, padded);
    return out;
  }

  Bytes EncodeString(const std::string& s) {
    return EncodeBytesDynamic(Bytes(s.begin(), s.end()));
  }

  Bytes EncodeTuple(const std::vector<Arg>& args) {
    Bytes head;
    Bytes tail;
    size_t head_size = 0;
    for (const auto& a : args) head_size += a.dynamic ? 32 : a.data.size();
    for (const auto& a : args) {
      if (a.dynamic) {
        append(head, EncodeUint(head_size + tail.size()));
        append(tail, a.data);
      } else {
        append(head, a.data);
      }
    }
    append(head, tail);
    return head;
  }

  Bytes EncodeStaticArray(const std::vector<Bytes>& elements) {
    Bytes out = EncodeUint(elements.size());
    for (const auto& e : elements) append(out, e);
    return out;
  }

  std::string EncodeCall(const std::string& signature, const std::vector<Arg>& args) {
    Bytes out = HexToBytes(Selector(signature));
    append(out, EncodeTuple(args));
    return BytesToHex0x(out);
  }

  Reader::Reader(const std::string& hex_result) : data_(HexToBytes(hex_result)), base_(0) {}

  Reader::Reader(const Bytes& data, size_t base) : data_(data), base_(base) {}

  size_t Reader::WordCount() const {
    return data_.size() > base_ ? (data_.size() - base_) / 32 : 0;
  }

  const unsigned char* Reader::WordPtr(size_t word) const {
    size_t pos = base_ + word * 32;
    if (pos + 32 > data_.size()) throw std::runtime_error("ABI result too short: word " + std::to_string(word));
    return data_.data() + pos;
  }

  BigInt Reader::Uint(size_t word) const {
    const unsigned char* p = WordPtr(word);
    BigInt out = 0;
    for (int i = 0; i < 32; ++i) { out <<= 8; out += p[i]; }
    return out;
  }

  std::string Reader::Address(size_t word) const {
    return BytesToHex0x(WordPtr(word) + 12, 20);
  }

  bool Reader::Bool(size_t word) const {
    return Uint(word) != 0;
  }

  Bytes Reader::Bytes32(size_t word) const {
    const unsigned char* p = WordPtr(word);
    return Bytes(p, p + 32);
  }

  size_t Reader::OffsetAt(size_t word) const {
    BigInt off = Uint(word);
    if (off > data_.size()) throw std::runtime_error("ABI offset out of range");
    return base_ + static_cast<size_t>(off);
  }

  Bytes Reader::DynamicBytes(size_t word) const {
    size_t pos = OffsetAt(word);
    Reader at(data_, pos);
    BigInt len = at.Uint(0);
    if (pos + 32 + len > data_.size()) throw std::runtime_error("ABI bytes length out of range");
    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(pos + 32);
    return Bytes(begin, begin + static_cast<std::ptrdiff_t>(len));
  }

  std::string Reader::String(size_t word) const {
    auto b = DynamicBytes(word);
    return std::string(b.begin(), b.end());
  }

  Reader Reader::Tuple(size_t word) const {
    return Reader(data_, OffsetAt(word));
  }
}
