#pragma once
#include <string>
#include <algorithm>
#include <cctype>
#include <sstream>

inline std::string Ensure0x(const std::string& in) {
  if (in.size() >= 2 && (in[0] == '0') && (in[1] == 'x' || in[1] == 'X')) return in;
  return std::string("0x") + in;
}

inline std::string Strip0x(const std::string& s) {
  if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) return s.substr(2);
  return s;
}

inline std::string ToLowerHex(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

// Left-pads a hex word (no 0x) to 32 bytes; longer input keeps the low 32 bytes.
inline std::string Pad32(const std::string& no0x) {
  if (no0x.size() >= 64) return no0x.substr(no0x.size() - 64);
  return std::string(64 - no0x.size(), '0') + no0x;
}

inline bool IsHexString(const std::string& s) {
  const std::string body = Strip0x(s);
  if (body.empty()) return false;
  return std::all_of(body.begin(), body.end(), [](unsigned char c){ return std::isxdigit(c) != 0; });
}

// True for "", "0x", or any all-zero hex string.
inline bool IsZeroAddress(const std::string& s) {
  const std::string body = Strip0x(s);
  return std::all_of(body.begin(), body.end(), [](char c){ return c == '0'; });
}

inline std::string UintToHex(unsigned long long v) {
  std::ostringstream ss;
  ss << std::hex << std::nouppercase << v;
  return ss.str();
}

// uint256 words may exceed 64 bits; accumulate into long double.
inline long double HexToLongDouble(const std::string& h) {
  long double v = 0.0L;
  for (char c : Strip0x(h)) {
    int d = 0;
    if (c >= '0' && c <= '9') d = c - '0';
    else if (c >= 'a' && c <= 'f') d = 10 + c - 'a';
    else if (c >= 'A' && c <= 'F') d = 10 + c - 'A';
    else return -1.0L;
    v = v * 16.0L + static_cast<long double>(d);
  }
  return v;
}
