#pragma once
#include "markets/market_config.hpp"
#include <optional>
#include <string>
#include <vector>
#include <unordered_map>

// Ordered set of markets. Iteration order is registration order.
// Populate at startup; lookups afterwards are read-only.
class MarketRegistry {
public:
  // Validates, derives the id and appends. Returns a copy of the stored config.
  MarketConfig AddMarket(MarketConfig cfg);
  const std::vector<MarketConfig>& Markets() const { return markets_; }
  const MarketConfig* Find(const std::string& id) const;
  const MarketConfig& Get(const std::string& id) const;
  const MarketConfig& At(size_t index) const;
  size_t Size() const { return markets_.size(); }
  bool Empty() const { return markets_.empty(); }
  // Loan token of the first supported market, empty if none
  std::string PrimaryLoanToken() const;
  // Decimals of a loan or collateral token of any registered market
  std::optional<int> TokenDecimals(const std::string& token) const;

  // {"markets":[{loan_token, collateral_token, oracle, irm, lltv, collateral_factor_bps, ...}]}
  static MarketRegistry LoadFromJson(const std::string& json_text);
  static MarketRegistry LoadFromFile(const std::string& path);
private:
  std::vector<MarketConfig> markets_;
  std::unordered_map<std::string, size_t> index_;
};
