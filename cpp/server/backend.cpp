#include "server/backend.hpp"

#include <kj/debug.h>

#include "server/options.hpp"
#include "session/settings.hpp"
#include "util/flags.hpp"

namespace server {

Backend::Backend(kj::AsyncIoProvider& io,
                 kj::LowLevelAsyncIoProvider& low_level)
    : runtime_(runtime::Runtime::Create(Flags::runtime, low_level)),
      pool_(MaxConcurrency(), Flags::max_queued),
      fetcher_(io.getTimer(), io.getNetwork(),
               session::Fetcher::LimitsFromFlags()),
      dispatcher_(*runtime_, pool_, io.getTimer(), fetcher_,
                  session::Settings::FromFlags()) {
  KJ_LOG(INFO, "Sessions", pool_.Capacity(), "concurrent",
         Flags::max_queued, "queued");
}

}  // namespace server
