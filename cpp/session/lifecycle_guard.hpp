#ifndef SESSION_LIFECYCLE_GUARD_HPP
#define SESSION_LIFECYCLE_GUARD_HPP

#include <atomic>
#include <string>

#include <kj/async.h>
#include <kj/memory.h>

#include "capnp/codebox.capnp.h"
#include "runtime/instance_pool.hpp"
#include "runtime/runtime.hpp"
#include "session/workspace.hpp"

namespace session {

// Owns what a session holds on the host (pool slot, instance, workspace) and
// gives it back exactly once, whichever way the session ends. If Release is
// never called or never completes, the destructor terminates the instance
// synchronously.
class LifecycleGuard {
 public:
  explicit LifecycleGuard(runtime::InstancePool& pool) : pool_(pool) {}
  ~LifecycleGuard();
  KJ_DISALLOW_COPY(LifecycleGuard);

  void AdoptSlot(runtime::InstancePool::Slot slot);
  void AdoptWorkspace(kj::Own<Workspace> workspace);
  void AdoptInstance(kj::Own<runtime::Instance> instance);

  kj::Maybe<Workspace&> GetWorkspace();
  kj::Maybe<runtime::Instance&> GetInstance();

  // Terminates the instance, then removes the workspace and frees the slot.
  // Calls after the first one resolve immediately; it never rejects.
  kj::Promise<void> Release();

  bool Released() const { return released_; }

  // Kind reported for a fault of the host, with a line for standard error.
  // Standard library exceptions reach it already converted by kj.
  static capnproto::ErrorKind Translate(const kj::Exception& exc,
                                        std::string* notice);

 private:
  void DropInstance();
  void RemoveWorkspace();

  runtime::InstancePool& pool_;
  kj::Maybe<runtime::InstancePool::Slot> slot_;
  kj::Maybe<kj::Own<Workspace>> workspace_;
  kj::Maybe<kj::Own<runtime::Instance>> instance_;
  std::atomic<bool> release_started_{false};
  bool released_ = false;
};

}  // namespace session

#endif
