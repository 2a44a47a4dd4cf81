#include "liquidation/position_aggregator.hpp"
#include "markets/market_registry.hpp"
#include "protocols/lending_market.hpp"
#include "protocols/margin_exchange.hpp"
#include "oracle/price_oracle.hpp"
#include "account/sub_account_registry.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <cmath>

const MarketExposure* AggregateValues::Exposure(const std::string& market_id) const {
  for (const auto& e : markets) if (e.market_id == market_id) return &e;
  return nullptr;
}

PositionAggregator::PositionAggregator(const MarketRegistry& markets,
                                       LendingMarket& lending,
                                       MarginExchange& exchange,
                                       PriceOracle& oracle,
                                       const SubAccountRegistry& sub_accounts)
  : markets_(markets), lending_(lending), exchange_(exchange), oracle_(oracle), sub_accounts_(sub_accounts) {}

AggregateValues PositionAggregator::Aggregate(const std::string& owner) {
  const SubAccount* sub = sub_accounts_.Find(owner);
  if (!sub) return AggregateValues{};
  return AggregateSubAccount(sub->id);
}

AggregateValues PositionAggregator::AggregateSubAccount(const std::string& sub_account_id) {
  AggregateValues out;
  for (const auto& m : markets_.Markets()) {
    if (!m.supported) continue;
    auto pos = lending_.GetPosition(m.id, sub_account_id);
    if (!pos.Ok()) {
      throw MarginError(ErrorCode::EXTERNAL_CALL_FAILED, "position " + m.Label() + ": " + Describe(pos.Error()));
    }
    const LendingPosition& p = pos.Value();
    if (p.collateral == 0 && p.borrow_shares == 0) continue;

    MarketExposure e;
    e.market_id = m.id;
    e.label = m.Label();
    e.collateral_units = p.collateral;
    e.borrow_shares = p.borrow_shares;

    if (p.collateral > 0) {
      auto price = oracle_.Price(m);
      if (!price.Ok()) {
        const bool bad_value = price.Error().kind == ExternalErrorKind::INVALID_RESPONSE;
        throw MarginError(bad_value ? ErrorCode::INVALID_PRICE : ErrorCode::ORACLE_UNAVAILABLE,
                          m.Label() + ": " + Describe(price.Error()));
      }
      if (!(price.Value() > 0.0L) || !std::isfinite(price.Value())) {
        throw MarginError(ErrorCode::INVALID_PRICE, m.Label());
      }
      e.price = price.Value();
      const long double whole = static_cast<long double>(p.collateral) / std::pow(10.0L, m.collateral_decimals);
      e.collateral_value = whole * e.price * m.CollateralFactor();
      out.collateral_value += e.collateral_value;
    }

    if (p.borrow_shares > 0) {
      auto state = lending_.GetMarketState(m.id);
      if (!state.Ok()) {
        throw MarginError(ErrorCode::EXTERNAL_CALL_FAILED, "market state " + m.Label() + ": " + Describe(state.Error()));
      }
      e.debt_units = BorrowSharesToAssets(p.borrow_shares, state.Value());
      e.debt_value = static_cast<long double>(e.debt_units) / std::pow(10.0L, m.loan_decimals);
      out.debt_value += e.debt_value;
    }
    out.markets.push_back(std::move(e));
  }

  auto equity = exchange_.GetAccountEquity(sub_account_id);
  if (equity.Ok()) {
    out.external_equity = equity.Value();
  } else if (equity.Error().kind != ExternalErrorKind::NOT_FOUND) {
    throw MarginError(ErrorCode::EXTERNAL_CALL_FAILED, "exchange equity: " + Describe(equity.Error()));
  }
  Logger::Debug("Aggregated " + sub_account_id + " collateral=" + std::to_string(static_cast<double>(out.collateral_value)) +
                " debt=" + std::to_string(static_cast<double>(out.debt_value)));
  return out;
}
