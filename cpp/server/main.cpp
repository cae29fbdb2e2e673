#include "server/main.hpp"

#include <unistd.h>

#include <capnp/ez-rpc.h>
#include <capnp/message.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <kj/io.h>

#include "server/backend.hpp"
#include "server/http_service.hpp"
#include "server/options.hpp"
#include "server/server.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace server {

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  auto owned = kj::heap<Server>();
  Server& server = *owned;
  capnp::EzRpcServer rpc(kj::mv(owned), Flags::listen_address.c_str(),
                         Flags::port);
  auto& wait_scope = rpc.getWaitScope();
  Backend backend(rpc.getIoProvider(), rpc.getLowLevelIoProvider());
  server.Attach(backend.GetDispatcher());
  KJ_DEFER(server.Detach());

  kj::HttpHeaderTable table;
  HttpService service(backend.GetDispatcher(), table);
  kj::HttpServer http(rpc.getIoProvider().getTimer(), table, service);
  kj::Promise<void> serving = kj::NEVER_DONE;
  if (Flags::http_port != 0) {
    auto& network = rpc.getIoProvider().getNetwork();
    serving = network.parseAddress(Flags::listen_address.c_str(),
                                   Flags::http_port)
                  .then([&http](kj::Own<kj::NetworkAddress> address) {
                    auto listener = address->listen();
                    KJ_LOG(INFO, "Serving HTTP", listener->getPort());
                    return http.listenHttp(*listener).attach(
                        kj::mv(listener));
                  });
  }
  unsigned port = rpc.getPort().wait(wait_scope);
  KJ_LOG(INFO, "Serving RPC", Flags::listen_address.c_str(), port);
  serving
      .then([]() {},
            [this](kj::Exception&& exc) {
              KJ_LOG(ERROR, "HTTP server failed", exc);
              context.exitError(exc.getDescription());
            })
      .wait(wait_scope);
  return true;
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context, "codebox server " CODEBOX_VERSION,
                          "Runs untrusted Python and Node code in isolated "
                          "instances, on behalf of RPC and HTTP clients.");
  return AddSessionOptions(builder)
      .addOptionWithArg({'l', "address"},
                        util::setString(Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port), "<PORT>",
                        "Port of the RPC interface")
      .addOptionWithArg({'H', "http-port"},
                        util::setInt(Flags::http_port), "<PORT>",
                        "Port of the HTTP interface, 0 to disable it")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

kj::MainBuilder::Validity RunMain::SetInput(kj::StringPtr input) {
  input_ = input.cStr();
  return true;
}

kj::MainBuilder::Validity RunMain::Run() {
  util::LogManager log_manager(context);
  std::string json;
  if (input_ == "-") {
    kj::FdInputStream in(STDIN_FILENO);
    char buffer[4096];
    size_t read = 0;
    while ((read = in.tryRead(buffer, 1, sizeof(buffer))) > 0) {
      json.append(buffer, read);
    }
  } else {
    if (!util::File::Exists(input_)) {
      return kj::str("No such file: ", input_.c_str());
    }
    json = util::File::ReadString(input_);
  }
  auto io = kj::setupAsyncIo();
  Backend backend(*io.provider, *io.lowLevelProvider);
  kj::String result =
      backend.GetDispatcher()
          .ExecuteJson(kj::ArrayPtr<const char>(json.data(), json.size()))
          .wait(io.waitScope);
  kj::FdOutputStream out(STDOUT_FILENO);
  out.write(result.begin(), result.size());
  out.write("\n", 1);
  return true;
}

kj::MainFunc RunMain::getMain() {
  kj::MainBuilder builder(context, "codebox run " CODEBOX_VERSION,
                          "Executes the JSON request read from the given "
                          "file, or from stdin if it is -, and prints the "
                          "JSON result.");
  return AddSessionOptions(builder)
      .expectArg("<request.json>", KJ_BIND_METHOD(*this, SetInput))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

kj::MainBuilder::Validity HealthMain::Run() {
  util::LogManager log_manager(context);
  auto io = kj::setupAsyncIo();
  capnp::MallocMessageBuilder message;
  auto status = message.initRoot<capnproto::HealthStatus>();
  status.setRuntime(Flags::runtime.c_str());
  session::WireCodec codec;
  KJ_IF_MAYBE(exc, kj::runCatchingExceptions([&]() {
                Backend backend(*io.provider, *io.lowLevelProvider);
                backend.GetDispatcher().Health(status).wait(io.waitScope);
              })) {
    status.setReachable(false);
    status.setMessage(exc->getDescription());
  }
  kj::String json = codec.Encode(status.asReader());
  kj::FdOutputStream out(STDOUT_FILENO);
  out.write(json.begin(), json.size());
  out.write("\n", 1);
  if (!status.asReader().getReachable()) context.exitError("Unreachable");
  return true;
}

kj::MainFunc HealthMain::getMain() {
  kj::MainBuilder builder(context, "codebox health " CODEBOX_VERSION,
                          "Checks whether the runtime can create instances. "
                          "Exits with 0 if it can, 1 otherwise.");
  return AddSessionOptions(builder)
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

}  // namespace server
