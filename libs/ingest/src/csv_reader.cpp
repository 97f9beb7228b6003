#include "txengine/ingest/csv_reader.hpp"

#include <charconv>
#include <limits>
#include <optional>

#include "txengine/ledger/errors.hpp"

namespace txengine {
namespace ingest {

namespace {

constexpr std::size_t kMissingColumn = std::numeric_limits<std::size_t>::max();

std::string_view trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r')) {
    text.remove_suffix(1);
  }
  return text;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
  T value{};
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

bool is_blank(std::string_view line) {
  return trim(line).empty();
}

}  // namespace

std::vector<std::string> split_csv_line(std::string_view line) {
  std::vector<std::string> fields;
  std::string current;
  bool in_quotes = false;
  bool was_quoted = false;

  auto finish_field = [&] {
    fields.push_back(was_quoted ? current : std::string(trim(current)));
    current.clear();
    was_quoted = false;
  };

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.size() && line[i + 1] == '"') {
          current.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        current.push_back(c);
      }
      continue;
    }

    if (c == '"' && trim(current).empty()) {
      current.clear();
      in_quotes = true;
      was_quoted = true;
    } else if (c == ',') {
      finish_field();
    } else if (!was_quoted && c != '\r') {
      current.push_back(c);
    }
  }
  finish_field();
  return fields;
}

CsvReader::CsvReader(std::istream& input) : input_(&input) {}

CsvReader::CsvReader(const std::filesystem::path& path) : owned_(path), input_(&owned_) {
  if (!owned_) {
    throw std::runtime_error("unable to open transaction file: " + path.string());
  }
}

ledger::TransactionEngine::RecordSource CsvReader::source() {
  return [this](ledger::TransactionRecord& out) { return next(out); };
}

bool CsvReader::next(ledger::TransactionRecord& out) {
  if (!header_read_) {
    read_header();
  }

  std::string line;
  while (read_line(line)) {
    if (is_blank(line)) {
      continue;
    }
    out = decode(split_csv_line(line));
    ++records_read_;
    return true;
  }
  return false;
}

bool CsvReader::read_line(std::string& line) {
  if (!std::getline(*input_, line)) {
    if (input_->bad()) {
      fail("read error");
    }
    return false;
  }
  ++line_number_;
  return true;
}

void CsvReader::read_header() {
  header_read_ = true;

  std::string line;
  do {
    if (!read_line(line)) {
      // An empty input is an empty stream, not an error.
      return;
    }
  } while (is_blank(line));

  const auto names = split_csv_line(line);
  columns_ = Columns{.type = kMissingColumn,
                     .client = kMissingColumn,
                     .tx = kMissingColumn,
                     .amount = kMissingColumn,
                     .count = names.size()};
  for (std::size_t i = 0; i < names.size(); ++i) {
    std::size_t* slot = nullptr;
    if (names[i] == "type") {
      slot = &columns_.type;
    } else if (names[i] == "client") {
      slot = &columns_.client;
    } else if (names[i] == "tx") {
      slot = &columns_.tx;
    } else if (names[i] == "amount") {
      slot = &columns_.amount;
    } else {
      fail("unexpected header column '" + names[i] + "'");
    }
    if (*slot != kMissingColumn) {
      fail("duplicate header column '" + names[i] + "'");
    }
    *slot = i;
  }

  if (columns_.type == kMissingColumn || columns_.client == kMissingColumn ||
      columns_.tx == kMissingColumn) {
    fail("header must name type, client and tx columns");
  }
}

ledger::TransactionRecord CsvReader::decode(const std::vector<std::string>& fields) const {
  if (fields.size() > columns_.count) {
    fail("expected at most " + std::to_string(columns_.count) + " fields, got " +
         std::to_string(fields.size()));
  }

  auto field = [&fields](std::size_t column) -> std::string_view {
    if (column == kMissingColumn || column >= fields.size()) {
      return {};
    }
    return fields[column];
  };

  ledger::TransactionRecord record;

  const auto type_text = field(columns_.type);
  const auto type = ledger::parse_transaction_type(type_text);
  if (!type) {
    fail("unknown transaction type '" + std::string(type_text) + "'");
  }
  record.type = *type;

  const auto client_text = field(columns_.client);
  const auto client = parse_unsigned<common::ClientId>(client_text);
  if (!client) {
    fail("invalid client id '" + std::string(client_text) + "'");
  }
  record.client_id = *client;

  const auto tx_text = field(columns_.tx);
  const auto tx = parse_unsigned<common::TransactionId>(tx_text);
  if (!tx) {
    fail("invalid transaction id '" + std::string(tx_text) + "'");
  }
  record.transaction_id = *tx;

  const auto amount_text = field(columns_.amount);
  if (!amount_text.empty()) {
    const auto amount = common::Amount::parse(amount_text);
    if (!amount || amount->is_negative()) {
      fail("invalid amount '" + std::string(amount_text) + "'");
    }
    record.amount = *amount;
  }

  return record;
}

void CsvReader::fail(const std::string& message) const {
  throw ledger::StructuralError("line " + std::to_string(line_number_) + ": " + message);
}

}  // namespace ingest
}  // namespace txengine
