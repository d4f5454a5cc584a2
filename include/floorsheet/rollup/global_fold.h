//
// Global rollup: folds every date of the date summary table into one row per
// (broker_id, symbol). The result always replaces the previous global table.
//

#pragma once
#include <floorsheet/core/types.h>

#include <span>
#include <string>
#include <vector>

namespace floorsheet::rollup {

// Same broker_id seen under another name; the first-seen name is kept.
struct BrokerNameConflict {
  std::string broker_id;
  std::string kept_name;
  std::string other_name;
  Date seen_on;
};

struct GlobalFoldResult {
  // sorted by (broker_id, symbol)
  GlobalSummaryList rows;
  size_t input_rows{0};
  size_t dates_folded{0};
  std::vector<BrokerNameConflict> name_conflicts;
};

// Rows are folded in the given order; last_updated is the latest date seen
// per key. Retention is not applied here.
GlobalFoldResult FoldGlobal(std::span<DateSummaryRow const> rows);

} // namespace floorsheet::rollup
