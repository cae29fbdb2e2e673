#ifndef RUNTIME_PROCESS_RUNTIME_HPP
#define RUNTIME_PROCESS_RUNTIME_HPP

#include "runtime/runtime.hpp"
#include "sandbox/sandbox.hpp"

namespace runtime {

// Runs each phase as a host process under the Unix sandbox, inside fresh
// mount and network namespaces, with the interpreters installed on the host.
class ProcessRuntime : public Runtime {
 public:
  enum class Phase { INSTALL, RUN };

  explicit ProcessRuntime(kj::LowLevelAsyncIoProvider& io) : io_(io) {}
  static Runtime* Create(kj::LowLevelAsyncIoProvider& io) {
    return new ProcessRuntime(io);
  }
  static int Score();

  std::string Name() const override { return "process"; }
  kj::Promise<kj::Own<Instance>> Allocate(const InstanceSpec& spec) override;
  kj::Promise<HealthReport> Health() override;

  // Sandbox settings of one phase. network tells whether the instance still
  // has network access; only the install phase can use it.
  static sandbox::ExecutionOptions MakeOptions(const InstanceSpec& spec,
                                               Phase phase, bool network,
                                               const Stage& stage);

  // Niceness approximating a CPU share: 1 or more is 0, 0.05 is 19.
  static int NiceForShare(double cpu_share);

 private:
  kj::LowLevelAsyncIoProvider& io_;
};

}  // namespace runtime

#endif
