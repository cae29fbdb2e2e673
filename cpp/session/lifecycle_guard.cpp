#include "session/lifecycle_guard.hpp"

#include <system_error>

#include <kj/debug.h>

namespace session {

void LifecycleGuard::AdoptSlot(runtime::InstancePool::Slot slot) {
  slot_ = kj::mv(slot);
}

void LifecycleGuard::AdoptWorkspace(kj::Own<Workspace> workspace) {
  KJ_REQUIRE(workspace_ == nullptr, "Session already has a workspace");
  workspace_ = kj::mv(workspace);
}

void LifecycleGuard::AdoptInstance(kj::Own<runtime::Instance> instance) {
  KJ_REQUIRE(instance_ == nullptr, "Session already has an instance");
  instance_ = kj::mv(instance);
  pool_.InstanceCreated();
}

kj::Maybe<Workspace&> LifecycleGuard::GetWorkspace() {
  KJ_IF_MAYBE(workspace, workspace_) { return **workspace; }
  return nullptr;
}

kj::Maybe<runtime::Instance&> LifecycleGuard::GetInstance() {
  KJ_IF_MAYBE(instance, instance_) { return **instance; }
  return nullptr;
}

void LifecycleGuard::DropInstance() {
  if (instance_ != nullptr) {
    instance_ = nullptr;
    pool_.InstanceDestroyed();
  }
  slot_ = nullptr;
}

void LifecycleGuard::RemoveWorkspace() {
  KJ_IF_MAYBE(workspace, workspace_) {
    try {
      (*workspace)->Remove();
    } catch (const std::system_error& exc) {
      KJ_LOG(ERROR, "Workspace removal failed",
             (*workspace)->SessionDir().c_str(), exc.what());
    }
    workspace_ = nullptr;
  }
}

kj::Promise<void> LifecycleGuard::Release() {
  if (release_started_.exchange(true)) return kj::READY_NOW;
  kj::Promise<void> terminated = kj::READY_NOW;
  KJ_IF_MAYBE(instance, instance_) {
    terminated = kj::evalNow([&]() { return (*instance)->Terminate(); });
  }
  return terminated.then(
      [this]() {
        DropInstance();
        RemoveWorkspace();
        released_ = true;
      },
      [this](kj::Exception&& exc) {
        KJ_LOG(ERROR, "Instance termination failed", exc);
        DropInstance();
        RemoveWorkspace();
        released_ = true;
      });
}

LifecycleGuard::~LifecycleGuard() {
  if (released_) return;
  KJ_IF_MAYBE(instance, instance_) {
    KJ_IF_MAYBE(exc, kj::runCatchingExceptions(
                         [&]() { (*instance)->TerminateNow(); })) {
      KJ_LOG(ERROR, "Instance termination failed", *exc);
    }
  }
  DropInstance();
  RemoveWorkspace();
}

capnproto::ErrorKind LifecycleGuard::Translate(const kj::Exception& exc,
                                               std::string* notice) {
  *notice = "[codebox] ";
  *notice += exc.getDescription().cStr();
  *notice += "\n";
  return capnproto::ErrorKind::RESOURCE_ERROR;
}

}  // namespace session
