#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "txengine/ledger/account.hpp"

namespace txengine {
namespace report {

struct Options {
  bool sort_by_client{true};
};

// One rendered row: client,available,held,total,locked
[[nodiscard]] std::string format_row(const ledger::Account& account);

// Writes the header plus one row per account. Returns the number of rows.
std::size_t write_accounts(std::ostream& out, std::vector<ledger::Account> accounts,
                           const Options& options = {});

}  // namespace report
}  // namespace txengine
