#include <floorsheet/rollup/derived_metrics.h>

namespace floorsheet::rollup {

void ComputeDerivedMetrics(BrokerStockSummary &summary) noexcept {
  summary.avg_buy_price =
      summary.buy_quantity > 0
          ? summary.buy_amount / static_cast<double>(summary.buy_quantity)
          : 0.0;
  summary.avg_sell_price =
      summary.sell_quantity > 0
          ? summary.sell_amount / static_cast<double>(summary.sell_quantity)
          : 0.0;

  summary.net_quantity = summary.buy_quantity - summary.sell_quantity;

  // a net short position also yields 0
  summary.avg_holding_price =
      summary.net_quantity > 0
          ? (summary.buy_amount - summary.sell_amount) /
                static_cast<double>(summary.net_quantity)
          : 0.0;
}

BrokerStockSummary WithDerivedMetrics(BrokerStockSummary summary) noexcept {
  ComputeDerivedMetrics(summary);
  return summary;
}

} // namespace floorsheet::rollup
