#pragma once
#include <string>

namespace floorsheet {

// Sets the default spdlog logger's level ("trace" .. "critical", "off") and
// line pattern. Throws std::invalid_argument for an unknown level name.
void ConfigureLogging(std::string const &level);

} // namespace floorsheet
