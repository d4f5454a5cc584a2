#pragma once
#include <floorsheet/core/types.h>

namespace floorsheet::rollup {

// Populates avg_buy_price, avg_sell_price, net_quantity and
// avg_holding_price from the accumulators. Every division is guarded:
// an average is 0 when its quantity is 0, and avg_holding_price is 0 unless
// the net position is long.
void ComputeDerivedMetrics(BrokerStockSummary &summary) noexcept;

[[nodiscard]] BrokerStockSummary WithDerivedMetrics(BrokerStockSummary summary) noexcept;

} // namespace floorsheet::rollup
