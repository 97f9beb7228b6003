#include "txengine/report/csv_writer.hpp"

#include <algorithm>
#include <stdexcept>

namespace txengine {
namespace report {

namespace {
constexpr const char* kHeader = "client,available,held,total,locked";
}

std::string format_row(const ledger::Account& account) {
  std::string row = std::to_string(account.client_id);
  row.push_back(',');
  row += account.available.to_string();
  row.push_back(',');
  row += account.held.to_string();
  row.push_back(',');
  row += account.total().to_string();
  row.push_back(',');
  row += account.locked ? "true" : "false";
  return row;
}

std::size_t write_accounts(std::ostream& out, std::vector<ledger::Account> accounts,
                           const Options& options) {
  if (options.sort_by_client) {
    std::sort(accounts.begin(), accounts.end(), [](const ledger::Account& lhs, const ledger::Account& rhs) {
      return lhs.client_id < rhs.client_id;
    });
  }

  out << kHeader << '\n';
  for (const auto& account : accounts) {
    out << format_row(account) << '\n';
  }
  out.flush();

  if (!out) {
    throw std::runtime_error("failed to write account report");
  }
  return accounts.size();
}

}  // namespace report
}  // namespace txengine
