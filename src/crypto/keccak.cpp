#include "crypto/keccak.hpp"
#include <stdexcept>
#include <string>
#include <cryptopp/keccak.h>

namespace Crypto {
  static std::string BytesToHex0x(const unsigned char* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string out; out.reserve(len * 2 + 2); out += "0x";
    for (size_t i = 0; i < len; ++i) { unsigned char b = data[i]; out += hex[b >> 4]; out += hex[b & 0xF]; }
    return out;
  }

  static int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + c - 'a';
    if (c >= 'A' && c <= 'F') return 10 + c - 'A';
    return -1;
  }

  std::string Keccak256Raw(const std::string& raw) {
    CryptoPP::Keccak_256 hash;
    unsigned char digest[32];
    hash.CalculateDigest(digest, reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
    return BytesToHex0x(digest, sizeof(digest));
  }

  std::string Keccak256Hex(const std::string& hex_input) {
    size_t start = (hex_input.rfind("0x", 0) == 0) ? 2 : 0;
    if ((hex_input.size() - start) % 2 != 0) throw std::invalid_argument("odd-length hex input");
    std::string bytes; bytes.reserve((hex_input.size() - start) / 2);
    for (size_t i = start; i + 1 < hex_input.size(); i += 2) {
      int hi = HexValue(hex_input[i]), lo = HexValue(hex_input[i + 1]);
      if (hi < 0 || lo < 0) throw std::invalid_argument("invalid hex input");
      bytes.push_back(static_cast<char>((hi << 4) | lo));
    }
    return Keccak256Raw(bytes);
  }

  std::string FunctionSelector(const std::string& signature) {
    return Keccak256Raw(signature).substr(0, 10);
  }
}
