#include "sandbox/main.hpp"

#include <kj/debug.h>
#include <kj/io.h>
#include "sandbox/unix.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace sandbox {
kj::MainBuilder::Validity Main::Run() {
  if (probe) {
    std::string error_msg;
    if (!Unix::CanIsolate(&error_msg)) {
      context.exitError(error_msg);
    }
    context.exit();
  }
  if (!read_binary) return "Only binary mode (--bin) is supported";
  kj::FdInputStream in(fileno(stdin));
  ExecutionOptions options("", "");
  in.read(&options, sizeof(options), sizeof(options));
  ExecutionInfo outcome;
  std::string error_msg;
  std::unique_ptr<Sandbox> sb = Sandbox::Create();
  if (!sb) error_msg = "No sandbox available";
  bool ok = sb && sb->Execute(options, &outcome, &error_msg);
  // Reply: size of the error, then either the error or the outcome.
  kj::FdOutputStream out(fileno(stdout));
  if (!ok) {
    size_t sz = error_msg.size();
    out.write(&sz, sizeof(sz));
    out.write(error_msg.c_str(), sz);
  } else {
    size_t sz = 0;
    out.write(&sz, sizeof(sz));
    out.write(&outcome, sizeof(outcome));
  }
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "codebox sandbox " CODEBOX_VERSION,
                         "Runs one process under the sandbox: reads the "
                         "execution options from stdin and writes the "
                         "outcome to stdout.")
      .addOption({'b', "bin"}, util::setBool(read_binary),
                 "Read/write options/results in binary.")
      .addOption({"probe"}, util::setBool(probe),
                 "Check whether isolation namespaces can be created.")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace sandbox
