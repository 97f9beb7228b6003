#include "txengine/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <limits>
#include <sstream>

namespace txengine {
namespace config {

namespace {

constexpr std::size_t kMaxWorkers = 256;
constexpr std::size_t kMinQueueDepth = 2;

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

// Negative values become huge and are rejected by validate().
std::size_t to_size(std::int64_t value) {
  return value < 0 ? std::numeric_limits<std::size_t>::max() : static_cast<std::size_t>(value);
}

EngineSection parse_engine(const toml::table& root) {
  EngineSection cfg;
  if (auto* engine = root["engine"].as_table()) {
    cfg.workers = to_size(get_int_or(*engine, "workers", static_cast<std::int64_t>(cfg.workers)));
    cfg.queue_depth = to_size(get_int_or(*engine, "queue_depth", static_cast<std::int64_t>(cfg.queue_depth)));
  }
  return cfg;
}

ReportSection parse_report(const toml::table& root) {
  ReportSection cfg;
  if (auto* report = root["report"].as_table()) {
    cfg.sort_by_client = get_bool_or(*report, "sort_by_client", cfg.sort_by_client);
  }
  return cfg;
}

TelemetrySection parse_telemetry(const toml::table& root) {
  TelemetrySection cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
    cfg.summary = get_bool_or(*telemetry, "summary", cfg.summary);
  }
  return cfg;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.engine = parse_engine(root);
  cfg.report = parse_report(root);
  cfg.telemetry = parse_telemetry(root);
  return cfg;
}

LoadResult finish(toml::parse_result& parsed) {
  LoadResult result;
  if (!parsed) {
    std::ostringstream oss;
    oss << parsed.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parsed.table());
  result.errors = ConfigLoader::validate(result.config);
  result.success = result.errors.empty();
  return result;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    LoadResult result;
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parsed = toml::parse_file(path.string());
  return finish(parsed);
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  auto parsed = toml::parse(toml_content);
  return finish(parsed);
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;

  if (config.engine.workers == 0 || config.engine.workers > kMaxWorkers) {
    errors.push_back({"engine.workers", "must be between 1 and " + std::to_string(kMaxWorkers)});
  }

  const auto depth = config.engine.queue_depth;
  if (depth < kMinQueueDepth || (depth & (depth - 1)) != 0) {
    errors.push_back({"engine.queue_depth", "must be a power of two >= 2"});
  }

  if (config.telemetry.summary && !config.telemetry.enabled) {
    errors.push_back({"telemetry.summary", "requires telemetry.enabled = true"});
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# txengine configuration
# Generated default configuration

[engine]
workers = 1         # >1 shards clients across worker threads
queue_depth = 4096  # per-worker ring size, power of two

[report]
sort_by_client = true

[telemetry]
enabled = false
summary = false     # print outcome counters and apply latency to stderr
)";
}

}  // namespace config
}  // namespace txengine
