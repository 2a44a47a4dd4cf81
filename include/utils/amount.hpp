#pragma once
#include <string>

// Token amounts and borrow shares in base units. 64 bits cap an 18-decimal
// token at ~18.4 units, so balances are carried as uint128 like the lending
// market's own totals.
typedef unsigned __int128 u128;

constexpr u128 kMaxAmount = ~static_cast<u128>(0);

// std::to_string and nlohmann::json have no 128-bit overloads
std::string AmountToString(u128 v);
// Unsigned decimal digits only. Throws std::invalid_argument / std::out_of_range.
u128 ParseAmount(const std::string& s);
// a * b / d with a 256-bit intermediate; saturates at kMaxAmount
u128 MulDiv(u128 a, u128 b, u128 d, bool round_up);
