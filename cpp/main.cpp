#include <csignal>

#include "sandbox/main.hpp"
#include "server/main.hpp"
#include "util/version.hpp"

class CodeboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit CodeboxMain(kj::ProcessContext& context)
      : context(context),
        server_main(&context),
        run_main(&context),
        health_main(&context),
        sandbox_main(&context) {
    // Peers going away are reported as write errors.
    signal(SIGPIPE, SIG_IGN);
  }
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "codebox " CODEBOX_VERSION,
                           "Secure execution of untrusted Python and Node "
                           "code.")
        .addSubCommand("server", KJ_BIND_METHOD(server_main, getMain),
                       "serve requests over RPC and HTTP")
        .addSubCommand("run", KJ_BIND_METHOD(run_main, getMain),
                       "execute one JSON request")
        .addSubCommand("health", KJ_BIND_METHOD(health_main, getMain),
                       "check the runtime")
        .addSubCommand("sandbox", KJ_BIND_METHOD(sandbox_main, getMain),
                       "run one process under the sandbox (internal)")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main server_main;
  server::RunMain run_main;
  server::HealthMain health_main;
  sandbox::Main sandbox_main;
};

KJ_MAIN(CodeboxMain);
