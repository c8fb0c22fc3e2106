#include "session/registry.hpp"

#include <vector>

#include "glog/logging.h"

namespace session {

std::shared_ptr<sandbox::Box> Registry::Resolve(const std::string& user_id) {
  absl::MutexLock lck(&mutex_);
  auto it = sessions_.find(user_id);
  if (it != sessions_.end()) {
    it->second.last_active = clock_();
    LOG(INFO) << "Reusing sandbox " << it->second.box->Name() << " for user "
              << user_id;
    return it->second.box;
  }
  LOG(INFO) << "No active session for user " << user_id
            << ". Creating new sandbox.";
  std::shared_ptr<sandbox::Box> box = provisioner_->Create();
  sessions_.emplace(user_id, Session{box, clock_()});
  LOG(INFO) << "Created sandbox " << box->Name() << " for user " << user_id;
  return box;
}

size_t Registry::Reap(absl::Duration threshold, absl::Time now) {
  absl::MutexLock lck(&mutex_);
  std::vector<std::string> expired;
  for (const auto& kv : sessions_) {
    if (now - kv.second.last_active > threshold) expired.push_back(kv.first);
  }
  for (const std::string& user_id : expired) {
    auto it = sessions_.find(user_id);
    LOG(INFO) << "Session for user " << user_id << " timed out";
    provisioner_->Destroy(it->second.box->Name());
    sessions_.erase(it);
  }
  if (!expired.empty()) {
    LOG(INFO) << "Cleaned up " << expired.size() << " inactive sandbox(es)";
  }
  return expired.size();
}

size_t Registry::Clear() {
  absl::MutexLock lck(&mutex_);
  size_t count = sessions_.size();
  for (const auto& kv : sessions_) provisioner_->Destroy(kv.second.box->Name());
  sessions_.clear();
  return count;
}

size_t Registry::Size() const {
  absl::MutexLock lck(&mutex_);
  return sessions_.size();
}

absl::optional<absl::Time> Registry::LastActive(
    const std::string& user_id) const {
  absl::MutexLock lck(&mutex_);
  auto it = sessions_.find(user_id);
  if (it == sessions_.end()) return absl::nullopt;
  return it->second.last_active;
}

}  // namespace session
