#include "utils/amount.hpp"
#include <stdexcept>

std::string AmountToString(u128 v) {
  if (v == 0) return "0";
  std::string out;
  while (v != 0) {
    out.insert(out.begin(), static_cast<char>('0' + static_cast<int>(v % 10)));
    v /= 10;
  }
  return out;
}

u128 ParseAmount(const std::string& s) {
  if (s.empty()) throw std::invalid_argument("empty amount");
  u128 v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') throw std::invalid_argument("amount is not a decimal integer: " + s);
    const unsigned d = static_cast<unsigned>(c - '0');
    if (v > (kMaxAmount - d) / 10) throw std::out_of_range("amount exceeds 128 bits: " + s);
    v = v * 10 + d;
  }
  return v;
}

u128 MulDiv(u128 a, u128 b, u128 d, bool round_up) {
  if (d == 0) throw std::domain_error("MulDiv by zero");
  const u128 lo64 = 0xFFFFFFFFFFFFFFFFULL;
  const u128 a0 = a & lo64, a1 = a >> 64, b0 = b & lo64, b1 = b >> 64;
  const u128 p00 = a0 * b0, p01 = a0 * b1, p10 = a1 * b0, p11 = a1 * b1;
  const u128 mid = (p00 >> 64) + (p01 & lo64) + (p10 & lo64);
  const u128 lo = (p00 & lo64) | (mid << 64);
  const u128 hi = p11 + (p01 >> 64) + (p10 >> 64) + (mid >> 64);

  if (hi == 0) {
    u128 q = lo / d;
    if (round_up && lo % d != 0) ++q;
    return q;
  }
  if (hi >= d) return kMaxAmount;

  // Shift-subtract division of hi:lo by d; hi < d keeps the quotient in 128 bits
  u128 rem = hi, q = 0;
  for (int i = 127; i >= 0; --i) {
    const bool carry = (rem >> 127) != 0;
    rem = (rem << 1) | ((lo >> i) & 1);
    q <<= 1;
    if (carry || rem >= d) {
      rem -= d;
      q |= 1;
    }
  }
  if (round_up && rem != 0 && q != kMaxAmount) ++q;
  return q;
}
