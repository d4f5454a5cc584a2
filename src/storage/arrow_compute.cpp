#include "storage/arrow_compute.h"

#include <arrow/compute/initialize.h>

namespace floorsheet::storage {
arrow::Status InitializeCompute() {
  static arrow::Status const status = arrow::compute::Initialize();
  return status;
}
} // namespace floorsheet::storage
