#ifndef SESSION_REGISTRY_HPP
#define SESSION_REGISTRY_HPP

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "absl/types/optional.h"
#include "sandbox/box.hpp"
#include "sandbox/provisioner.hpp"

namespace session {

// Maps every user to its sandbox. A single mutex covers lookup, insertion and
// removal, and it is held while sandboxes are created and destroyed: two
// concurrent requests for a new user never provision two sandboxes, at the
// price of serializing all provisioning.
class Registry {
 public:
  using Clock = std::function<absl::Time()>;

  explicit Registry(sandbox::Provisioner* provisioner,
                    Clock clock = absl::Now)
      : provisioner_(provisioner), clock_(std::move(clock)) {}

  // Returns the sandbox of user_id, creating it if the user has none, and
  // marks the user as active. Throws sandbox::ProvisionError if a new sandbox
  // cannot be created; the registry is left untouched in that case.
  std::shared_ptr<sandbox::Box> Resolve(const std::string& user_id);

  // Destroys and forgets every session that has been idle for more than
  // threshold at time now. Returns the number of removed sessions.
  size_t Reap(absl::Duration threshold, absl::Time now);

  // Destroys every session. Returns the number of removed sessions.
  size_t Clear();

  size_t Size() const;
  absl::optional<absl::Time> LastActive(const std::string& user_id) const;

  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;
  Registry(Registry&&) = delete;
  Registry& operator=(Registry&&) = delete;
  ~Registry() = default;

 private:
  struct Session {
    std::shared_ptr<sandbox::Box> box;
    absl::Time last_active;
  };

  sandbox::Provisioner* provisioner_;
  Clock clock_;

  mutable absl::Mutex mutex_;
  std::unordered_map<std::string, Session> sessions_ GUARDED_BY(mutex_);
};

}  // namespace session

#endif
