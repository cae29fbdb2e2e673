#ifndef SESSION_SESSION_HPP
#define SESSION_SESSION_HPP

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <kj/async.h>
#include <kj/timer.h>

#include "capnp/codebox.capnp.h"
#include "runtime/instance_pool.hpp"
#include "runtime/runtime.hpp"
#include "session/capturer.hpp"
#include "session/fetcher.hpp"
#include "session/launcher.hpp"
#include "session/lifecycle_guard.hpp"
#include "session/request.hpp"
#include "session/settings.hpp"
#include "session/wire.hpp"

namespace session {

// States of a session, in the only order they can be entered. The last three
// are terminal.
enum class State {
  PROVISIONING,
  INSTALLING,
  RUNNING,
  CAPTURING,
  COMPLETED,
  FAILED,
  TIMED_OUT
};

const char* StateName(State state);
bool IsTerminal(State state);

// What the sessions of a dispatcher share.
struct Services {
  runtime::Runtime& runtime;
  runtime::InstancePool& pool;
  kj::Timer& timer;
  Fetcher& fetcher;
  const WireCodec& codec;
  const Settings& settings;
};

// One admitted request, from the creation of its workspace to the removal of
// everything it allocated.
class Session {
 public:
  Session(std::string id, Request request, Services services);
  KJ_DISALLOW_COPY(Session);

  // Drives the session to a terminal state and fills result, which must stay
  // valid until the promise resolves. Never rejects. The instance and the
  // workspace are gone when it resolves.
  kj::Promise<void> Run(capnproto::ExecutionResult::Builder result);

  const std::string& Id() const { return id_; }
  State GetState() const { return state_; }
  // Every state entered so far, in order.
  const std::vector<State>& History() const { return history_; }

 private:
  void Advance(State next);
  kj::Promise<void> Provision();
  kj::Promise<void> Allocate();
  kj::Promise<void> InstallRequirements();
  kj::Promise<RunReport> Execute();
  void Capture(const RunReport& report);
  void Fail(const kj::Exception& exc);
  void Fill(capnproto::ExecutionResult::Builder result) const;
  std::string Descriptor() const;
  Workspace& GetWorkspace();
  runtime::Instance& GetInstance();

  std::string id_;
  Request request_;
  Services services_;
  LifecycleGuard guard_;

  State state_ = State::PROVISIONING;
  State terminal_ = State::FAILED;
  std::vector<State> history_;
  bool network_granted_ = false;
  std::set<std::string> images_before_;

  capnproto::ErrorKind kind_ = capnproto::ErrorKind::NONE;
  int32_t exit_code_ = 0;
  std::vector<std::string> fetch_notices_;
  bool install_failed_ = false;
  std::string install_notice_;
  CapturedStream stdout_;
  CapturedStream stderr_;
  CapturedImages images_;
  std::string fault_notice_;
};

}  // namespace session

#endif
