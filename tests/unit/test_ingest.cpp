#include "test_ingest.hpp"

#include <cassert>
#include <sstream>
#include <string>

#include "txengine/ingest/csv_reader.hpp"
#include "txengine/ledger/errors.hpp"

namespace txengine::tests {

namespace {

// Returns the error message, or an empty string if the input decoded cleanly.
std::string decode_error(const std::string& csv) {
  std::istringstream input(csv);
  ingest::CsvReader reader(input);
  ledger::TransactionRecord record;
  try {
    while (reader.next(record)) {
    }
  } catch (const ledger::StructuralError& e) {
    return e.what();
  }
  return {};
}

}  // namespace

void test_csv_split() {
  auto fields = ingest::split_csv_line("deposit, 1 ,\t2, 1.5 ");
  assert(fields.size() == 4);
  assert(fields[0] == "deposit");
  assert(fields[1] == "1");
  assert(fields[2] == "2");
  assert(fields[3] == "1.5");

  fields = ingest::split_csv_line("dispute,1,2,");
  assert(fields.size() == 4);
  assert(fields[3].empty());

  fields = ingest::split_csv_line(R"("deposit","1","2","3.0")");
  assert(fields.size() == 4);
  assert(fields[0] == "deposit");
  assert(fields[3] == "3.0");

  fields = ingest::split_csv_line(R"(a,"b,c","say ""hi""")");
  assert(fields.size() == 3);
  assert(fields[1] == "b,c");
  assert(fields[2] == "say \"hi\"");

  fields = ingest::split_csv_line("resolve,1,2\r");
  assert(fields.size() == 3);
  assert(fields[2] == "2");
}

void test_csv_reader_records() {
  std::istringstream input(
      "type, client, tx, amount\n"
      "deposit, 1, 1, 1.0\n"
      "\n"
      "withdrawal,2,2,20.5\n"
      "dispute,1,1,\n"
      "resolve,1,1\n"
      "chargeback , 65535 , 4294967295\n");
  ingest::CsvReader reader(input);

  ledger::TransactionRecord record;
  assert(reader.next(record));
  assert(record.type == ledger::TransactionType::kDeposit);
  assert(record.client_id == 1);
  assert(record.transaction_id == 1);
  assert(record.amount == common::Amount::from_whole(1));

  assert(reader.next(record));
  assert(record.type == ledger::TransactionType::kWithdraw);
  assert(record.client_id == 2);
  assert(record.amount == common::Amount::from_units(205'000));

  assert(reader.next(record));
  assert(record.type == ledger::TransactionType::kDispute);
  assert(!record.amount);

  assert(reader.next(record));
  assert(record.type == ledger::TransactionType::kResolve);
  assert(!record.amount);

  assert(reader.next(record));
  assert(record.type == ledger::TransactionType::kChargeback);
  assert(record.client_id == 65535);
  assert(record.transaction_id == 4294967295u);

  assert(!reader.next(record));
  assert(reader.records_read() == 5);
  assert(reader.line_number() == 7);
}

void test_csv_reader_column_order() {
  std::istringstream input(
      "client,tx,type,amount\n"
      "7,3,deposit,2.25\n");
  ingest::CsvReader reader(input);

  ledger::TransactionRecord record;
  assert(reader.next(record));
  assert(record.type == ledger::TransactionType::kDeposit);
  assert(record.client_id == 7);
  assert(record.transaction_id == 3);
  assert(record.amount == common::Amount::from_units(22'500));

  std::istringstream empty("");
  ingest::CsvReader empty_reader(empty);
  assert(!empty_reader.next(record));
}

void test_csv_reader_errors() {
  const std::string header = "type,client,tx,amount\n";

  assert(decode_error(header + "deposit,1,1,1.0\n").empty());
  assert(decode_error(header + "deposit,1,1,1.0\ntransfer,1,2,1.0\n").find("line 3") != std::string::npos);
  assert(decode_error(header + "transfer,1,2,1.0\n").find("unknown transaction type") != std::string::npos);
  assert(decode_error(header + "deposit,65536,1,1.0\n").find("client id") != std::string::npos);
  assert(decode_error(header + "deposit,-1,1,1.0\n").find("client id") != std::string::npos);
  assert(decode_error(header + "deposit,1,4294967296,1.0\n").find("transaction id") != std::string::npos);
  assert(decode_error(header + "deposit,1,,1.0\n").find("transaction id") != std::string::npos);
  assert(decode_error(header + "deposit,1,1,abc\n").find("amount") != std::string::npos);
  assert(decode_error(header + "deposit,1,1,-4.0\n").find("amount") != std::string::npos);
  assert(decode_error(header + "deposit,1,1,1.0,extra\n").find("at most") != std::string::npos);
  assert(decode_error("kind,client,tx,amount\n").find("unexpected header") != std::string::npos);
  assert(decode_error("client,tx,amount\n").find("header must name") != std::string::npos);

  // Missing amount is a decode success; validity is the engine's call.
  assert(decode_error(header + "deposit,1,1\n").empty());
}

}  // namespace txengine::tests
