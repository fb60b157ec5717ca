// src/game/account_lock_table.cpp
#include "account_lock_table.h"
#include <functional>

namespace FairSlot {

AccountLockTable::AccountLockTable(size_t stripe_count)
    : stripes_(stripe_count == 0 ? 1 : stripe_count) {
}

std::unique_lock<std::mutex> AccountLockTable::Lock(const std::string& account_id) {
    size_t index = std::hash<std::string>{}(account_id) % stripes_.size();
    return std::unique_lock<std::mutex>(stripes_[index]);
}

} // namespace FairSlot
