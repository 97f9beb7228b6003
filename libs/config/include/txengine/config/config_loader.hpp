#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace txengine {
namespace config {

struct EngineSection {
  std::size_t workers{1};
  std::size_t queue_depth{1 << 12};
};

struct ReportSection {
  bool sort_by_client{true};
};

struct TelemetrySection {
  bool enabled{false};
  bool summary{false};
};

struct EngineConfig {
  EngineSection engine;
  ReportSection report;
  TelemetrySection telemetry;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace txengine
