#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <utility>

#include "txengine/config/config_loader.hpp"
#include "txengine/dispatch/sharded_dispatcher.hpp"
#include "txengine/ingest/csv_reader.hpp"
#include "txengine/ledger/errors.hpp"
#include "txengine/ledger/transaction_engine.hpp"
#include "txengine/report/csv_writer.hpp"
#include "txengine/telemetry/telemetry_sink.hpp"

namespace {

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " <transactions.csv> [config_file]\n"
            << "  transactions.csv: rows of type,client,tx,amount\n"
            << "  config_file:      Path to TOML configuration file\n"
            << "                    If not specified, uses ./txengine.toml or defaults\n";
}

std::filesystem::path find_config_path(int argc, char* argv[]) {
  if (argc > 2) {
    return std::filesystem::path{argv[2]};
  }

  const char* home = std::getenv("HOME");
  std::filesystem::path default_paths[] = {
      "./txengine.toml",
      "/etc/txengine/txengine.toml",
      home ? std::filesystem::path{home} / ".config/txengine/txengine.toml" : std::filesystem::path{},
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

bool load_config(int argc, char* argv[], txengine::config::EngineConfig& cfg) {
  using txengine::config::ConfigLoader;

  const auto config_path = find_config_path(argc, argv);
  auto result = config_path.empty() ? ConfigLoader::load_from_string(ConfigLoader::generate_default())
                                    : ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Config error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return false;
  }
  cfg = std::move(result.config);
  return true;
}

void print_summary(const txengine::telemetry::TelemetrySink& telemetry, std::size_t accounts) {
  using namespace txengine::ledger;

  std::cerr << "records: " << telemetry.counter(metrics::kRecordsProcessed)
            << ", accounts: " << accounts << "\n";
  for (std::size_t i = 0; i < kOutcomeCount; ++i) {
    const auto outcome = static_cast<Outcome>(i);
    std::cerr << "  " << to_string(outcome) << ": " << telemetry.counter(metrics::outcome_counter(outcome))
              << "\n";
  }
  for (const auto& latency : telemetry.latency_summaries()) {
    if (latency.id == metrics::kApplyLatency) {
      std::cerr << "  apply latency: mean " << latency.mean_ns << "ns, p50 " << latency.p50_ns
                << "ns, p99 " << latency.p99_ns << "ns, max " << latency.max_ns << "ns\n";
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace txengine;

  if (argc < 2 || argc > 3) {
    print_usage(argv[0]);
    return 1;
  }

  config::EngineConfig cfg;
  if (!load_config(argc, argv, cfg)) {
    return 1;
  }

  telemetry::TelemetrySink telemetry;
  ledger::TransactionEngine engine{cfg.telemetry.enabled ? &telemetry : nullptr};

  try {
    ingest::CsvReader reader{std::filesystem::path{argv[1]}};

    if (cfg.engine.workers > 1) {
      dispatch::ShardedDispatcher dispatcher{engine, {.workers = cfg.engine.workers,
                                                      .queue_depth = cfg.engine.queue_depth}};
      dispatcher.run(reader.source());
    } else {
      engine.process_records(reader.source());
    }

    report::write_accounts(std::cout, engine.accounts(), {.sort_by_client = cfg.report.sort_by_client});
  } catch (const ledger::StructuralError& e) {
    std::cerr << "Invalid input: " << e.what() << "\n";
    return 1;
  } catch (const ledger::LookupError& e) {
    std::cerr << "Internal error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  if (cfg.telemetry.summary) {
    print_summary(telemetry, engine.account_count());
  }
  return 0;
}
