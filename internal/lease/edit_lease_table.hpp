#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mediaforge::lease {

class EditLease;

/*
  Per-asset exclusive edit hold.

  At most one in-flight edit task per asset. A second acquire fails
  instead of queueing; the caller reports Busy.
*/
class EditLeaseTable {
 public:
  bool TryAcquire(const std::string& asset_id, const std::string& task_id);

  // Releases only if task_id still holds the lease.
  void Release(const std::string& asset_id, const std::string& task_id);

  bool IsHeld(const std::string& asset_id) const;

  std::optional<std::string> Holder(const std::string& asset_id) const;

 private:
  friend class EditLease;

  mutable std::mutex mutex_;

  // asset id -> task id
  std::unordered_map<std::string, std::string> holders_;
};

/*
  Scoped holder; releases on destruction unless moved from.
*/
class EditLease {
 public:
  EditLease(EditLeaseTable& table, std::string asset_id, std::string task_id);
  ~EditLease();

  EditLease(EditLease&& other) noexcept;
  EditLease& operator=(EditLease&&) = delete;
  EditLease(const EditLease&)       = delete;
  EditLease& operator=(const EditLease&) = delete;

  // Rebinds the hold to the task that will own it.
  void Transfer(const std::string& task_id);

  // Early release; the destructor then does nothing.
  void Release();

 private:
  EditLeaseTable* table_;
  std::string     asset_id_;
  std::string     task_id_;
};

} // namespace mediaforge::lease
