#ifndef SERVER_MAIN_HPP
#define SERVER_MAIN_HPP
#include <string>

#include <kj/main.h>

namespace server {

// `codebox server`: serves the boundary operations over RPC and HTTP.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};

// `codebox run`: executes one JSON request in-process and prints the result.
class RunMain {
 public:
  explicit RunMain(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity SetInput(kj::StringPtr input);
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string input_;
};

// `codebox health`: readiness probe of the configured runtime.
class HealthMain {
 public:
  explicit HealthMain(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};

}  // namespace server
#endif
