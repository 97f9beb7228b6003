#pragma once

#include <stdexcept>
#include <string>

namespace txengine {
namespace ledger {

// A record is malformed or breaks the amount/type pairing rule. Fatal for the run.
class StructuralError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// An entry that was just checked for presence is gone. Fatal for the run.
class LookupError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

}  // namespace ledger
}  // namespace txengine
