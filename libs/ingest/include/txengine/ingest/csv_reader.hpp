#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "txengine/ledger/transaction_engine.hpp"
#include "txengine/ledger/transaction_record.hpp"

namespace txengine {
namespace ingest {

// Splits one CSV line into fields. Double-quoted fields may contain commas and ""
// escapes. Unquoted fields are trimmed of surrounding spaces and tabs.
[[nodiscard]] std::vector<std::string> split_csv_line(std::string_view line);

// Reads `type,client,tx,amount` rows. The header row fixes column order; rows may
// stop before the amount column. Any malformed row throws ledger::StructuralError.
class CsvReader {
 public:
  explicit CsvReader(std::istream& input);
  explicit CsvReader(const std::filesystem::path& path);

  CsvReader(const CsvReader&) = delete;
  CsvReader& operator=(const CsvReader&) = delete;

  bool next(ledger::TransactionRecord& out);

  // Adapter for TransactionEngine::process_records and ShardedDispatcher::run.
  [[nodiscard]] ledger::TransactionEngine::RecordSource source();

  [[nodiscard]] std::uint64_t line_number() const noexcept { return line_number_; }
  [[nodiscard]] std::uint64_t records_read() const noexcept { return records_read_; }

 private:
  struct Columns {
    std::size_t type{0};
    std::size_t client{0};
    std::size_t tx{0};
    std::size_t amount{0};
    std::size_t count{0};
  };

  std::ifstream owned_;
  std::istream* input_;
  Columns columns_{};
  bool header_read_{false};
  std::uint64_t line_number_{0};
  std::uint64_t records_read_{0};

  bool read_line(std::string& line);
  void read_header();
  ledger::TransactionRecord decode(const std::vector<std::string>& fields) const;
  [[noreturn]] void fail(const std::string& message) const;
};

}  // namespace ingest
}  // namespace txengine
