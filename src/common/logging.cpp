#include <floorsheet/common/logging.h>

#include <spdlog/spdlog.h>
#include <stdexcept>

namespace floorsheet {

void ConfigureLogging(std::string const &level) {
  auto const parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    throw std::invalid_argument("Unknown log level: " + level);
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_level(parsed);
}

} // namespace floorsheet
