//
// Raw store write path: dedup of a freshly fetched batch against the
// persisted transactions by natural key (trading_date, transaction_no).
//

#pragma once
#include <floorsheet/core/types.h>

namespace floorsheet::rollup {

struct TransactionMergeResult {
  // sorted by (trading_date, transaction_no)
  TransactionList rows;
  size_t added{0};             // keys not stored before
  size_t replaced{0};          // stored keys whose row changed
  size_t unchanged{0};         // stored keys re-fetched with identical values
  size_t batch_duplicates{0};  // keys repeated inside the incoming batch
  size_t stored_duplicates{0}; // keys repeated inside the persisted table

  size_t duplicates() const { return replaced + unchanged; }

  // false when writing `rows` would reproduce the persisted table
  bool changed() const { return added > 0 || replaced > 0 || stored_duplicates > 0; }
};

// Keeps every stored row whose key is absent from `incoming`, plus all of
// `incoming`. On key equality the incoming row wins; inside one batch the
// last occurrence of a key wins.
TransactionMergeResult MergeTransactions(TransactionList existing, TransactionList incoming);

void SortTransactions(TransactionList &rows);

} // namespace floorsheet::rollup
