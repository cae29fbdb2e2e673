#include "session/session.hpp"

#include <capnp/message.h>
#include <kj/debug.h>

#include "session/installer.hpp"

namespace session {
namespace {

kj::StringPtr Text(const std::string& s) {
  return kj::StringPtr(s.c_str(), s.size());
}

const char* KindName(capnproto::ErrorKind kind) {
  switch (kind) {
    case capnproto::ErrorKind::NONE:
      return "none";
    case capnproto::ErrorKind::VALIDATION_ERROR:
      return "ValidationError";
    case capnproto::ErrorKind::RESOURCE_ERROR:
      return "ResourceError";
    case capnproto::ErrorKind::RUNTIME_FAILURE:
      return "RuntimeFailure";
    case capnproto::ErrorKind::RESOURCE_EXCEEDED:
      return "ResourceExceeded";
    case capnproto::ErrorKind::TIMED_OUT:
      return "TimedOut";
  }
  return "unknown";
}

void AppendLine(std::string* text, const std::string& line) {
  if (!text->empty() && text->back() != '\n') *text += "\n";
  *text += line;
  if (text->empty() || text->back() != '\n') *text += "\n";
}

}  // namespace

const char* StateName(State state) {
  switch (state) {
    case State::PROVISIONING:
      return "provisioning";
    case State::INSTALLING:
      return "installing";
    case State::RUNNING:
      return "running";
    case State::CAPTURING:
      return "capturing";
    case State::COMPLETED:
      return "completed";
    case State::FAILED:
      return "failed";
    case State::TIMED_OUT:
      return "timed out";
  }
  KJ_UNREACHABLE;
}

bool IsTerminal(State state) {
  return state == State::COMPLETED || state == State::FAILED ||
         state == State::TIMED_OUT;
}

Session::Session(std::string id, Request request, Services services)
    : id_(std::move(id)),
      request_(std::move(request)),
      services_(services),
      guard_(services.pool) {
  history_.push_back(state_);
}

void Session::Advance(State next) {
  KJ_REQUIRE(static_cast<int>(next) > static_cast<int>(state_),
             "Invalid session transition", StateName(state_),
             StateName(next));
  KJ_REQUIRE(!IsTerminal(state_), "Session already ended", StateName(state_));
  KJ_LOG(INFO, "Session", id_.c_str(), StateName(next));
  state_ = next;
  history_.push_back(next);
}

Workspace& Session::GetWorkspace() {
  KJ_IF_MAYBE(workspace, guard_.GetWorkspace()) { return *workspace; }
  KJ_FAIL_REQUIRE("Session has no workspace", id_.c_str());
}

runtime::Instance& Session::GetInstance() {
  KJ_IF_MAYBE(instance, guard_.GetInstance()) { return *instance; }
  KJ_FAIL_REQUIRE("Session has no instance", id_.c_str());
}

std::string Session::Descriptor() const {
  capnp::MallocMessageBuilder message;
  auto request = message.initRoot<capnproto::ExecutionRequest>();
  request.setCode(Text(request_.code));
  request.setLanguage(Text(request_.language.name));
  auto requirements = request.initRequirements(request_.requirements.size());
  for (size_t i = 0; i < request_.requirements.size(); i++) {
    requirements.set(i, Text(request_.requirements[i]));
  }
  auto urls = request.initFileUrls(request_.files.size());
  for (size_t i = 0; i < request_.files.size(); i++) {
    urls.set(i, Text(request_.files[i].url));
  }
  return services_.codec.Encode(request.asReader()).cStr();
}

kj::Promise<void> Session::Run(capnproto::ExecutionResult::Builder result) {
  KJ_LOG(INFO, "Session admitted", id_.c_str(),
         request_.language.name.c_str(), request_.requirements.size(),
         request_.files.size());
  return services_.pool.Acquire()
      .then([this](runtime::InstancePool::Slot slot) {
        guard_.AdoptSlot(kj::mv(slot));
        return Provision();
      })
      .then([this]() { return Allocate(); })
      .then([this]() { return InstallRequirements(); })
      .then([this]() { return Execute(); })
      .then([this](RunReport report) { Capture(report); })
      .then([]() {}, [this](kj::Exception&& exc) { Fail(exc); })
      .then([this]() { return guard_.Release(); })
      .then([this, result]() mutable {
        Advance(terminal_);
        Fill(result);
        KJ_LOG(INFO, "Session finished", id_.c_str(), KindName(kind_));
      });
}

kj::Promise<void> Session::Provision() {
  const Settings& settings = services_.settings;
  auto workspace = kj::heap<Workspace>(settings.workspace_root, id_,
                                       settings.keep_workspaces);
  Workspace& ws = *workspace;
  guard_.AdoptWorkspace(kj::mv(workspace));
  ws.Populate(request_, Descriptor());
  if (request_.files.empty()) return kj::READY_NOW;
  return services_.fetcher.FetchAll(request_.files, ws.Box())
      .then([this](std::vector<std::string> notices) {
        fetch_notices_ = std::move(notices);
      });
}

kj::Promise<void> Session::Allocate() {
  const Settings& settings = services_.settings;
  Workspace& ws = GetWorkspace();
  runtime::InstanceSpec spec;
  spec.id = id_;
  spec.language = request_.language;
  spec.session_dir = ws.SessionDir();
  spec.workspace = ws.Box();
  spec.network = settings.install_network && !request_.requirements.empty();
  spec.memory_limit_kb = settings.memory_limit_kb;
  spec.cpu_share = settings.cpu_share;
  network_granted_ = spec.network;
  return services_.runtime.Allocate(spec).then(
      [this](kj::Own<runtime::Instance> instance) {
        guard_.AdoptInstance(kj::mv(instance));
        Advance(State::INSTALLING);
      });
}

kj::Promise<void> Session::InstallRequirements() {
  if (request_.requirements.empty()) return kj::READY_NOW;
  return Install(GetInstance(), request_, GetWorkspace(),
                 services_.settings.install_timeout_millis)
      .then([this](InstallReport report) {
        install_failed_ = report.failed;
        install_notice_ = std::move(report.notice);
      });
}

kj::Promise<RunReport> Session::Execute() {
  kj::Promise<void> revoked = kj::READY_NOW;
  if (network_granted_) {
    revoked = GetInstance().RevokeNetwork().then([this]() {
      network_granted_ = false;
      KJ_LOG(INFO, "Network revoked", id_.c_str());
    });
  }
  return revoked.then([this]() {
    images_before_ = TopLevelImages(GetWorkspace().Box());
    Advance(State::RUNNING);
    return Launch(services_.timer, GetInstance(), request_, GetWorkspace(),
                  services_.settings);
  });
}

void Session::Capture(const RunReport& report) {
  Advance(State::CAPTURING);
  const Settings& settings = services_.settings;
  Workspace& ws = GetWorkspace();
  stdout_ = CaptureStream(ws.StdoutFile(), settings.output_limit_bytes,
                          report.stdout_bound);
  stderr_ = CaptureStream(ws.StderrFile(), settings.output_limit_bytes,
                          report.stderr_bound);
  images_ = CaptureImages(ws.Box(), images_before_, settings.max_images,
                          settings.image_limit_bytes);
  kind_ = report.kind;
  const runtime::StageOutcome& outcome = report.outcome;
  if (kind_ != capnproto::ErrorKind::NONE &&
      kind_ != capnproto::ErrorKind::TIMED_OUT && outcome.signal == 0) {
    exit_code_ = outcome.exit_code;
  }
  if (kind_ == capnproto::ErrorKind::NONE) {
    terminal_ = State::COMPLETED;
  } else if (kind_ == capnproto::ErrorKind::TIMED_OUT) {
    terminal_ = State::TIMED_OUT;
  } else {
    terminal_ = State::FAILED;
  }
  KJ_LOG(INFO, "Run finished", id_.c_str(), KindName(kind_),
         outcome.exit_code, outcome.signal, outcome.wall_time_millis,
         outcome.memory_usage_kb);
}

void Session::Fail(const kj::Exception& exc) {
  KJ_LOG(WARNING, "Session failed", id_.c_str(), StateName(state_),
         exc.getDescription());
  kind_ = LifecycleGuard::Translate(exc, &fault_notice_);
  terminal_ = State::FAILED;
}

void Session::Fill(capnproto::ExecutionResult::Builder result) const {
  result.setSessionId(Text(id_));
  result.setStdout(Text(SanitizeUtf8(stdout_.text)));

  std::string err;
  for (const std::string& notice : fetch_notices_) AppendLine(&err, notice);
  if (!install_notice_.empty()) AppendLine(&err, install_notice_);
  err += stderr_.text;
  for (const std::string& notice : images_.notices) AppendLine(&err, notice);
  if (!fault_notice_.empty()) AppendLine(&err, fault_notice_);
  result.setStderr(Text(SanitizeUtf8(err)));

  if (!images_.payloads.empty()) {
    auto images = result.initImages(images_.payloads.size());
    for (size_t i = 0; i < images_.payloads.size(); i++) {
      images.set(i, Text(images_.payloads[i]));
    }
  }
  result.setErrorKind(kind_);
  result.setExitCode(exit_code_);
  result.setStdoutTruncated(stdout_.truncated);
  result.setStderrTruncated(stderr_.truncated);
  result.setInstallFailed(install_failed_);
}

}  // namespace session
