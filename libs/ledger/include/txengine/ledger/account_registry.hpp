#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "txengine/common/types.hpp"
#include "txengine/ledger/account.hpp"

namespace txengine {
namespace ledger {

// Client id -> account map with one mutex per account. Entries are never removed,
// so handles stay valid for the registry's lifetime.
class AccountRegistry {
 private:
  struct Slot {
    std::mutex mutex;
    Account account;

    explicit Slot(common::ClientId client_id) : account(client_id) {}
  };

 public:
  // Exclusive access to a single account, released on destruction.
  class LockedAccount {
   public:
    explicit LockedAccount(Slot& slot) : lock_(slot.mutex), account_(&slot.account) {}

    Account& operator*() const noexcept { return *account_; }
    Account* operator->() const noexcept { return account_; }

   private:
    std::unique_lock<std::mutex> lock_;
    Account* account_;
  };

  class Handle {
   public:
    explicit Handle(Slot& slot) noexcept : slot_(&slot) {}

    [[nodiscard]] LockedAccount lock() const { return LockedAccount{*slot_}; }
    [[nodiscard]] common::ClientId client_id() const noexcept { return slot_->account.client_id; }

   private:
    Slot* slot_;
  };

  AccountRegistry() = default;
  AccountRegistry(const AccountRegistry&) = delete;
  AccountRegistry& operator=(const AccountRegistry&) = delete;

  [[nodiscard]] Handle get_or_create(common::ClientId client_id);

  // Copies every account in first-seen order. Call once mutation has stopped.
  [[nodiscard]] std::vector<Account> snapshot_all() const;

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<common::ClientId, std::unique_ptr<Slot>> slots_;
  std::vector<Slot*> insertion_order_;
};

}  // namespace ledger
}  // namespace txengine
