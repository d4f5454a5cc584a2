#pragma once

#include <arrow/status.h>

namespace floorsheet::storage {
// Registers the Arrow compute kernels once per process. Safe to call from
// every code path that needs them.
arrow::Status InitializeCompute();
} // namespace floorsheet::storage
