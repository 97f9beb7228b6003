#include "txengine/ledger/account_registry.hpp"

namespace txengine {
namespace ledger {

AccountRegistry::Handle AccountRegistry::get_or_create(common::ClientId client_id) {
  {
    std::shared_lock lock(mutex_);
    if (auto it = slots_.find(client_id); it != slots_.end()) {
      return Handle{*it->second};
    }
  }

  auto fresh = std::make_unique<Slot>(client_id);

  // Another thread may have inserted between the two locks; try_emplace keeps the first.
  std::unique_lock lock(mutex_);
  insertion_order_.reserve(insertion_order_.size() + 1);
  auto [it, inserted] = slots_.try_emplace(client_id, std::move(fresh));
  if (inserted) {
    insertion_order_.push_back(it->second.get());
  }
  return Handle{*it->second};
}

std::vector<Account> AccountRegistry::snapshot_all() const {
  std::unique_lock lock(mutex_);
  std::vector<Account> accounts;
  accounts.reserve(insertion_order_.size());
  for (Slot* slot : insertion_order_) {
    std::scoped_lock account_lock(slot->mutex);
    accounts.push_back(slot->account);
  }
  return accounts;
}

std::size_t AccountRegistry::size() const {
  std::shared_lock lock(mutex_);
  return slots_.size();
}

}  // namespace ledger
}  // namespace txengine
