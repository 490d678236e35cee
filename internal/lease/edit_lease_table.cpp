#include "edit_lease_table.hpp"

namespace mediaforge::lease {

bool EditLeaseTable::TryAcquire(const std::string& asset_id, const std::string& task_id) {
  std::lock_guard lock(mutex_);
  return holders_.try_emplace(asset_id, task_id).second;
}

void EditLeaseTable::Release(const std::string& asset_id, const std::string& task_id) {
  std::lock_guard lock(mutex_);

  auto it = holders_.find(asset_id);
  if (it == holders_.end() || it->second != task_id) return;
  holders_.erase(it);
}

bool EditLeaseTable::IsHeld(const std::string& asset_id) const {
  std::lock_guard lock(mutex_);
  return holders_.contains(asset_id);
}

std::optional<std::string> EditLeaseTable::Holder(const std::string& asset_id) const {
  std::lock_guard lock(mutex_);

  auto it = holders_.find(asset_id);
  if (it == holders_.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------
// EditLease
// ------------------------------------------------------------

EditLease::EditLease(EditLeaseTable& table, std::string asset_id, std::string task_id)
    : table_(&table), asset_id_(std::move(asset_id)), task_id_(std::move(task_id)) {
}

EditLease::~EditLease() {
  if (table_) table_->Release(asset_id_, task_id_);
}

EditLease::EditLease(EditLease&& other) noexcept
    : table_(other.table_), asset_id_(std::move(other.asset_id_)), task_id_(std::move(other.task_id_)) {
  other.table_ = nullptr;
}

void EditLease::Release() {
  if (!table_) return;
  table_->Release(asset_id_, task_id_);
  table_ = nullptr;
}

void EditLease::Transfer(const std::string& task_id) {
  if (!table_) return;
  std::lock_guard lock(table_->mutex_);

  auto it = table_->holders_.find(asset_id_);
  if (it != table_->holders_.end() && it->second == task_id_) {
    it->second = task_id;
  }
  task_id_ = task_id;
}

} // namespace mediaforge::lease
