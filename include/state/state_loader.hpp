#pragma once
#include <string>

class MarketRegistry;
class MarginAccountService;
class TokenLedger;
class InMemoryLendingMarket;
class InMemoryMarginExchange;
class StaticPriceOracle;

// Where a state snapshot is applied. Optional targets (null) skip their section.
struct StateTargets {
  const MarketRegistry& markets;
  MarginAccountService& accounts;
  TokenLedger& ledger;
  InMemoryLendingMarket* lending = nullptr;
  InMemoryMarginExchange* exchange = nullptr;
  StaticPriceOracle* prices = nullptr;
};

struct StateSummary {
  size_t accounts = 0;
  size_t prices = 0;
  size_t markets_seeded = 0;
};

// Seeds the service from a JSON snapshot. Markets are referenced by
// registration index or by id; amounts are base units, strings for big values.
//
// {
//   "liquidity": [{"market": 0, "amount": "5000000000000"}],
//   "prices":    [{"market": 0, "price": 3000}],
//   "accounts":  [{"owner": "0xabc...",
//                  "wallet":     [{"token": "0x...", "amount": "..."}],
//                  "collateral": [{"market": 0, "amount": "10000000000000000000"}],
//                  "borrow":     [{"market": 0, "amount": "19000000000"}],
//                  "exchange":   {"deposits": [{"token": "0x...", "amount": "..."}], "unrealized_pnl": -120.5}}],
//   "interest":  [{"market": 0, "amount": "1000000"}]
// }
//
// Account positions go through the owner operations, so a snapshot that would
// leave an account unhealthy at borrow time is rejected.
class StateLoader {
public:
  static StateSummary ApplyJson(const std::string& json_text, StateTargets& targets);
  static StateSummary ApplyFile(const std::string& path, StateTargets& targets);
};
