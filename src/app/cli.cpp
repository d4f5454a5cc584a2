#include <floorsheet/app/cli.h>
#include <floorsheet/common/logging.h>
#include <floorsheet/pipeline/date_rollup_stage.h>
#include <floorsheet/pipeline/global_rollup_stage.h>
#include <floorsheet/pipeline/raw_store_stage.h>
#include <floorsheet/source/csv_page_source.h>
#include <floorsheet/source/floorsheet_fetcher.h>
#include <floorsheet/storage/parquet_table_store.h>

#include "storage/arrow_compute.h"
#include <algorithm>
#include <charconv>
#include <format>
#include <iostream>
#include <map>
#include <set>
#include <spdlog/spdlog.h>

namespace floorsheet::app {

namespace {
const std::map<std::string_view, Command> COMMANDS = {
    {"fetch", Command::Fetch},
    {"date-summary", Command::DateSummary},
    {"summarize", Command::Summarize},
    {"run-all", Command::RunAll},
};

const std::set<std::string_view> COMMON_FLAGS = {"--config", "--log-level", "--report",
                                                 "--data-dir"};

const std::map<Command, std::set<std::string_view>> COMMAND_FLAGS = {
    {Command::Fetch,
     {"--source-dir", "--output", "--date", "--max-pages", "--page-size", "--retention-days"}},
    {Command::DateSummary, {"--input", "--output", "--retention-days"}},
    {Command::Summarize, {"--input", "--output", "--retention-days"}},
    {Command::RunAll,
     {"--source-dir", "--date", "--max-pages", "--page-size", "--retention-days"}},
};

template <typename T>
std::expected<T, UsageError> ParseInteger(std::string_view flag, std::string_view text) {
  T value{};
  auto const *end = text.data() + text.size();
  auto const [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::unexpected(UsageError{std::format("{} expects an integer, got '{}'", flag, text)});
  }
  return value;
}

std::optional<UsageError> ApplyFlag(CommandLine &cl, std::string_view flag,
                                    std::string_view value) {
  auto integer = [&]<typename T>(std::optional<T> &target, T minimum) -> std::optional<UsageError> {
    auto parsed = ParseInteger<T>(flag, value);
    if (!parsed) {
      return parsed.error();
    }
    if (*parsed < minimum) {
      return UsageError{std::format("{} must be at least {}", flag, minimum)};
    }
    target = *parsed;
    return std::nullopt;
  };

  if (flag == "--config") {
    cl.config_file = value;
  } else if (flag == "--log-level") {
    cl.log_level = std::string(value);
  } else if (flag == "--report") {
    cl.report = value;
  } else if (flag == "--data-dir") {
    cl.data_dir = value;
  } else if (flag == "--source-dir") {
    cl.source_dir = value;
  } else if (flag == "--input") {
    cl.input = value;
  } else if (flag == "--output") {
    cl.output = value;
  } else if (flag == "--date") {
    cl.date = TryParseDate(value);
    if (!cl.date) {
      return UsageError{std::format("--date expects YYYY-MM-DD, got '{}'", value)};
    }
  } else if (flag == "--max-pages") {
    return integer(cl.max_pages, 1);
  } else if (flag == "--page-size") {
    return integer(cl.page_size, size_t{1});
  } else if (flag == "--retention-days") {
    return integer(cl.retention_days, 0);
  }
  return std::nullopt;
}

void Print(pipeline::StageReport const &report) {
  SPDLOG_INFO("{} finished: {} (input {}, retention removed {}, duplicates {}, written {})",
              report.stage, ToString(report.status), report.input_rows,
              report.retention_removed, report.duplicates, report.rows_written);
  for (auto const &failure : report.date_failures) {
    SPDLOG_WARN("{}: date {} skipped: {}", report.stage, FormatDate(failure.date),
                failure.reason);
  }
}
} // namespace

std::string Usage() {
  return "Usage: floorsheet <command> [options]\n"
         "Commands:\n"
         "  fetch          Fetch one trading day into the raw table\n"
         "  date-summary   Upsert per-date broker x stock summaries\n"
         "  summarize      Rebuild the all-time broker x stock summary\n"
         "  run-all        fetch, date-summary and summarize in sequence\n"
         "Options:\n"
         "  --source-dir PATH        Directory of <YYYY-MM-DD>.csv floorsheets\n"
         "  --input PATH             Input table (date-summary, summarize)\n"
         "  --output PATH            Output table (fetch, date-summary, summarize)\n"
         "  --date YYYY-MM-DD        Trading date to fetch (default: latest)\n"
         "  --max-pages N            Maximum number of pages to fetch\n"
         "  --page-size N            Rows per page of a CSV floorsheet (default: 500)\n"
         "  --retention-days N       Days of data to keep (default: 365)\n"
         "  --data-dir PATH          Directory holding every table\n"
         "  --config FILE            YAML pipeline configuration\n"
         "  --log-level LEVEL        trace, debug, info, warn, error, critical, off\n"
         "  --report FILE            Write a JSON run report\n"
         "  --help                   Show this help\n";
}

std::expected<CommandLine, UsageError> ParseCommandLine(std::span<char const *const> args) {
  CommandLine cl;
  if (args.empty()) {
    return std::unexpected(UsageError{"missing command"});
  }

  std::string_view const name = args[0];
  if (name == "--help" || name == "-h" || name == "help") {
    return cl;
  }
  auto const command = COMMANDS.find(name);
  if (command == COMMANDS.end()) {
    return std::unexpected(UsageError{std::format("unknown command '{}'", name)});
  }
  cl.command = command->second;
  auto const &allowed = COMMAND_FLAGS.at(cl.command);

  for (size_t i = 1; i < args.size(); ++i) {
    std::string_view const flag = args[i];
    if (flag == "--help" || flag == "-h") {
      cl.command = Command::Help;
      return cl;
    }
    if (!COMMON_FLAGS.contains(flag) && !allowed.contains(flag)) {
      return std::unexpected(
          UsageError{std::format("unknown option '{}' for {}", flag, name)});
    }
    if (i + 1 >= args.size()) {
      return std::unexpected(UsageError{std::format("{} requires a value", flag)});
    }
    if (auto error = ApplyFlag(cl, flag, args[++i])) {
      return std::unexpected(std::move(*error));
    }
  }
  return cl;
}

config::PipelineConfig ResolveConfig(CommandLine const &cl, EnvLoader const &env) {
  config::PipelineConfig config;
  if (cl.config_file) {
    config = config::LoadPipelineConfig(*cl.config_file, config);
  }
  config::ApplyEnvironment(config, env);

  if (cl.data_dir) {
    config.raw_table = *cl.data_dir / config.raw_table.filename();
    config.date_summary_table = *cl.data_dir / config.date_summary_table.filename();
    config.global_summary_table = *cl.data_dir / config.global_summary_table.filename();
    config.source_dir = *cl.data_dir / config.source_dir.filename();
  }
  if (cl.source_dir) config.source_dir = *cl.source_dir;
  if (cl.date) config.target_date = cl.date;
  if (cl.max_pages) config.max_pages = cl.max_pages;
  if (cl.page_size) config.page_size = *cl.page_size;
  if (cl.retention_days) config.retention_days = *cl.retention_days;
  if (cl.log_level) config.log_level = *cl.log_level;
  if (cl.report) config.report = cl.report;

  switch (cl.command) {
  case Command::Fetch:
    if (cl.output) config.raw_table = *cl.output;
    break;
  case Command::DateSummary:
    if (cl.input) config.raw_table = *cl.input;
    if (cl.output) config.date_summary_table = *cl.output;
    break;
  case Command::Summarize:
    if (cl.input) config.date_summary_table = *cl.input;
    if (cl.output) config.global_summary_table = *cl.output;
    break;
  case Command::RunAll:
  case Command::Help:
    break;
  }

  config.Validate();
  return config;
}

std::vector<pipeline::StageReport> RunPipeline(Command command,
                                               config::PipelineConfig const &config,
                                               Date const &cutoff,
                                               storage::ITableStore &store,
                                               source::ITransactionPageSource &source) {
  std::vector<pipeline::StageReport> reports;
  auto const runs = [&](Command stage) { return command == stage || command == Command::RunAll; };
  auto const failed = [&] { return !reports.empty() && !reports.back().ok(); };

  SPDLOG_INFO("Data retention policy: {} days (cutoff {})", config.retention_days,
              FormatDate(cutoff));

  if (runs(Command::Fetch)) {
    source::FloorsheetFetcher fetcher(source);
    pipeline::RawStoreStage rawStore(store, {config.raw_table, cutoff});
    reports.push_back(pipeline::RunFetchStage(
        fetcher, {config.target_date, config.max_pages, config.page_delay}, rawStore));
    Print(reports.back());
  }

  if (runs(Command::DateSummary) && !failed()) {
    pipeline::DateRollupStage stage(store,
                                    {config.raw_table, config.date_summary_table, cutoff});
    reports.push_back(stage.Run());
    Print(reports.back());
  }

  if (runs(Command::Summarize) && !failed()) {
    pipeline::GlobalRollupStage stage(
        store, {config.date_summary_table, config.global_summary_table, cutoff});
    reports.push_back(stage.Run());
    Print(reports.back());
  }
  return reports;
}

int Main(std::span<char const *const> args) {
  auto cl = ParseCommandLine(args);
  if (!cl) {
    std::cerr << "floorsheet: " << cl.error().message << "\n\n" << Usage();
    return EXIT_USAGE;
  }
  if (cl->command == Command::Help) {
    std::cout << Usage();
    return EXIT_OK;
  }

  config::PipelineConfig config;
  try {
    config = ResolveConfig(*cl, EnvLoader::instance());
    ConfigureLogging(config.log_level);
  } catch (std::exception const &exp) {
    std::cerr << "floorsheet: " << exp.what() << "\n";
    return EXIT_USAGE;
  }

  if (auto const status = storage::InitializeCompute(); !status.ok()) {
    throw std::runtime_error("Arrow compute initialization failed: " + status.ToString());
  }

  auto const cutoff = config::ComputeCutoff(config, Today());
  storage::ParquetTableStore store;
  source::CsvPageSource source({config.source_dir, config.page_size});

  auto const reports = RunPipeline(cl->command, config, cutoff, store, source);
  if (config.report) {
    pipeline::WriteRunReport(*config.report, reports);
  }

  bool const ok = std::ranges::all_of(reports, [](auto const &r) { return r.ok(); });
  return ok ? EXIT_OK : EXIT_STAGE_FAILED;
}

} // namespace floorsheet::app
