#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include <kj/async.h>

#include "capnp/codebox.capnp.h"
#include "session/dispatcher.hpp"

namespace server {

// Cap'n Proto implementation of the CodeSandbox interface. The dispatcher is
// attached after the RPC server, which owns the event loop, is up.
class Server : public capnproto::CodeSandbox::Server {
 public:
  Server() = default;

  void Attach(session::Dispatcher& dispatcher) { dispatcher_ = dispatcher; }
  void Detach() { dispatcher_ = nullptr; }

  kj::Promise<void> execute(ExecuteContext context) override;
  kj::Promise<void> health(HealthContext context) override;

 private:
  session::Dispatcher& GetDispatcher();

  kj::Maybe<session::Dispatcher&> dispatcher_;
};

}  // namespace server
#endif
