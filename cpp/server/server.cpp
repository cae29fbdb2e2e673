#include "server/server.hpp"

#include <kj/debug.h>

namespace server {

session::Dispatcher& Server::GetDispatcher() {
  KJ_IF_MAYBE(dispatcher, dispatcher_) { return *dispatcher; }
  kj::throwFatalException(KJ_EXCEPTION(DISCONNECTED, "Server is not ready"));
}

kj::Promise<void> Server::execute(ExecuteContext context) {
  session::Dispatcher& dispatcher = GetDispatcher();
  auto result = context.getResults().initResult();
  return dispatcher.Execute(context.getParams().getRequest(), result);
}

kj::Promise<void> Server::health(HealthContext context) {
  session::Dispatcher& dispatcher = GetDispatcher();
  auto status = context.getResults().initStatus();
  return dispatcher.Health(status);
}

}  // namespace server
