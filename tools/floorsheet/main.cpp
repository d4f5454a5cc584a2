#include <floorsheet/app/cli.h>

#include <exception>
#include <spdlog/spdlog.h>
#include <vector>

int main(int argc, char *argv[]) {
  std::vector<char const *> args;
  for (int i = 1; i < argc; ++i) {
    args.push_back(argv[i]);
  }

  try {
    return floorsheet::app::Main(args);
  } catch (std::exception const &exp) {
    SPDLOG_CRITICAL("floorsheet aborted: {}", exp.what());
    return floorsheet::app::EXIT_STAGE_FAILED;
  }
}
