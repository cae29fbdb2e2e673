#ifndef SANDBOX_MAIN_HPP
#define SANDBOX_MAIN_HPP
#include <kj/main.h>
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Internal helper sub-command: runs a single process under the sandbox.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  bool read_binary = false;
  bool probe = false;
};
}  // namespace sandbox
#endif
