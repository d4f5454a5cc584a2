#include <floorsheet/rollup/transaction_merge.h>

#include <algorithm>
#include <map>
#include <string>
#include <utility>

namespace floorsheet::rollup {

namespace {
using TransactionKey = std::pair<Date, std::string>;

TransactionKey KeyOf(TransactionRecord const &row) {
  return {row.trading_date, row.transaction_no};
}
} // namespace

void SortTransactions(TransactionList &rows) {
  std::ranges::sort(rows, [](TransactionRecord const &a, TransactionRecord const &b) {
    if (a.trading_date != b.trading_date) {
      return a.trading_date < b.trading_date;
    }
    return a.transaction_no < b.transaction_no;
  });
}

TransactionMergeResult MergeTransactions(TransactionList existing,
                                         TransactionList incoming) {
  TransactionMergeResult result;

  std::map<TransactionKey, TransactionRecord> merged;
  for (auto &row : existing) {
    auto key = KeyOf(row);
    if (!merged.insert_or_assign(std::move(key), std::move(row)).second) {
      ++result.stored_duplicates;
    }
  }

  std::map<TransactionKey, TransactionRecord> batch;
  for (auto &row : incoming) {
    auto key = KeyOf(row);
    if (!batch.insert_or_assign(std::move(key), std::move(row)).second) {
      ++result.batch_duplicates;
    }
  }

  for (auto &[key, row] : batch) {
    auto it = merged.find(key);
    if (it == merged.end()) {
      ++result.added;
      merged.emplace(key, std::move(row));
    } else if (it->second == row) {
      ++result.unchanged;
    } else {
      ++result.replaced;
      it->second = std::move(row);
    }
  }

  result.rows.reserve(merged.size());
  for (auto &[_, row] : merged) {
    result.rows.emplace_back(std::move(row));
  }
  // std::map iteration already yields natural-key order
  return result;
}

} // namespace floorsheet::rollup
