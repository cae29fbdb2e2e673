#include "runtime/instance_pool.hpp"

#include <kj/debug.h>

namespace runtime {

InstancePool::Slot& InstancePool::Slot::operator=(Slot&& other) noexcept {
  if (pool_ != nullptr) pool_->Release();
  pool_ = other.pool_;
  other.pool_ = nullptr;
  return *this;
}

InstancePool::Slot::~Slot() {
  if (pool_ != nullptr) pool_->Release();
}

void InstancePool::DropCanceled() {
  while (!waiting_.empty() && !waiting_.front()->isWaiting()) waiting_.pop();
}

size_t InstancePool::Waiting() {
  DropCanceled();
  size_t count = 0;
  std::queue<kj::Own<kj::PromiseFulfiller<Slot>>> kept;
  while (!waiting_.empty()) {
    if (waiting_.front()->isWaiting()) {
      count++;
      kept.push(kj::mv(waiting_.front()));
    }
    waiting_.pop();
  }
  waiting_ = kj::mv(kept);
  return count;
}

kj::Promise<InstancePool::Slot> InstancePool::Acquire() {
  DropCanceled();
  if (in_use_ < max_instances_ && waiting_.empty()) {
    in_use_++;
    return Slot(this);
  }
  if (Waiting() >= max_waiting_) {
    return KJ_EXCEPTION(OVERLOADED, "Too many sessions waiting for an instance",
                        max_waiting_);
  }
  auto pf = kj::newPromiseAndFulfiller<Slot>();
  waiting_.push(kj::mv(pf.fulfiller));
  return kj::mv(pf.promise);
}

void InstancePool::Release() {
  // The slot goes to the first session still waiting for one.
  DropCanceled();
  if (!waiting_.empty()) {
    kj::Own<kj::PromiseFulfiller<Slot>> next = kj::mv(waiting_.front());
    waiting_.pop();
    next->fulfill(Slot(this));
    return;
  }
  KJ_ASSERT(in_use_ > 0);
  in_use_--;
}

}  // namespace runtime
