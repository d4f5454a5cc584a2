//
// `floorsheet <command> [options]`
//

#pragma once
#include <floorsheet/common/env_loader.h>
#include <floorsheet/config/pipeline_config.h>
#include <floorsheet/pipeline/stage_report.h>
#include <floorsheet/source/itransaction_page_source.h>
#include <floorsheet/storage/itable_store.h>

#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace floorsheet::app {

enum class Command { Fetch, DateSummary, Summarize, RunAll, Help };

enum ExitCode : int { EXIT_OK = 0, EXIT_STAGE_FAILED = 1, EXIT_USAGE = 2 };

struct CommandLine {
  Command command{Command::Help};

  std::optional<std::filesystem::path> config_file;
  std::optional<std::string> log_level;
  std::optional<std::filesystem::path> report;
  std::optional<std::filesystem::path> data_dir;

  std::optional<std::filesystem::path> source_dir;
  std::optional<std::filesystem::path> input;
  std::optional<std::filesystem::path> output;
  std::optional<Date> date;
  std::optional<int> max_pages;
  std::optional<size_t> page_size;
  std::optional<int> retention_days;
};

struct UsageError {
  std::string message;
};

// `args` excludes the program name.
std::expected<CommandLine, UsageError> ParseCommandLine(std::span<char const *const> args);

std::string Usage();

// defaults -> --config YAML -> environment -> flags. Throws
// std::runtime_error / std::invalid_argument for an unusable configuration.
config::PipelineConfig ResolveConfig(CommandLine const &commandLine, EnvLoader const &env);

// Runs the stages of `command` in order, stopping after the first failure.
std::vector<pipeline::StageReport> RunPipeline(Command command,
                                               config::PipelineConfig const &config,
                                               Date const &cutoff,
                                               storage::ITableStore &store,
                                               source::ITransactionPageSource &source);

// Whole program: parse, configure, run, report. Returns the process exit code.
int Main(std::span<char const *const> args);

} // namespace floorsheet::app
