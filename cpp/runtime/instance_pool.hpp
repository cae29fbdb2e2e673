#ifndef RUNTIME_INSTANCE_POOL_HPP
#define RUNTIME_INSTANCE_POOL_HPP

#include <cstddef>
#include <queue>

#include <kj/async.h>

namespace runtime {

// Process-wide bound on live instances. Sessions acquire a slot before
// creating their instance and give it back after terminating it; waiting
// sessions are served in arrival order. The pool also counts instances
// created and destroyed through it.
class InstancePool {
 public:
  // A reserved place for one instance, given back on destruction.
  class Slot {
   public:
    Slot(Slot&& other) noexcept : pool_(other.pool_) { other.pool_ = nullptr; }
    Slot& operator=(Slot&& other) noexcept;
    ~Slot();
    KJ_DISALLOW_COPY(Slot);

   private:
    friend class InstancePool;
    explicit Slot(InstancePool* pool) : pool_(pool) {}
    InstancePool* pool_;
  };

  InstancePool(size_t max_instances, size_t max_waiting)
      : max_instances_(max_instances), max_waiting_(max_waiting) {}
  KJ_DISALLOW_COPY(InstancePool);

  // Resolves when a slot is available. Fails with an OVERLOADED exception
  // if max_waiting sessions are already waiting.
  kj::Promise<Slot> Acquire();

  void InstanceCreated() { created_++; }
  void InstanceDestroyed() { destroyed_++; }

  size_t Created() const { return created_; }
  size_t Destroyed() const { return destroyed_; }
  size_t InUse() const { return in_use_; }
  size_t Waiting();
  size_t Capacity() const { return max_instances_; }

 private:
  void Release();
  void DropCanceled();

  const size_t max_instances_;
  const size_t max_waiting_;
  size_t in_use_ = 0;
  size_t created_ = 0;
  size_t destroyed_ = 0;
  std::queue<kj::Own<kj::PromiseFulfiller<Slot>>> waiting_;
};

}  // namespace runtime

#endif
