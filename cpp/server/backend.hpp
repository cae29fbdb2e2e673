#ifndef SERVER_BACKEND_HPP
#define SERVER_BACKEND_HPP

#include <memory>

#include <kj/async-io.h>

#include "runtime/instance_pool.hpp"
#include "runtime/runtime.hpp"
#include "session/dispatcher.hpp"
#include "session/fetcher.hpp"

namespace server {

// The runtime, instance pool, fetcher and dispatcher of a process, configured
// from Flags and driven by the given event loop.
class Backend {
 public:
  Backend(kj::AsyncIoProvider& io, kj::LowLevelAsyncIoProvider& low_level);
  KJ_DISALLOW_COPY(Backend);

  session::Dispatcher& GetDispatcher() { return dispatcher_; }
  runtime::Runtime& GetRuntime() { return *runtime_; }
  runtime::InstancePool& GetPool() { return pool_; }

 private:
  std::unique_ptr<runtime::Runtime> runtime_;
  runtime::InstancePool pool_;
  session::Fetcher fetcher_;
  session::Dispatcher dispatcher_;
};

}  // namespace server
#endif
