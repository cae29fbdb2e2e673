#ifndef SERVER_OPTIONS_HPP
#define SERVER_OPTIONS_HPP
#include <kj/main.h>

namespace server {

// Adds the options shared by every sub-command that runs sessions: logging,
// runtime selection, per-instance ceilings, capture and fetch bounds.
kj::MainBuilder& AddSessionOptions(kj::MainBuilder& builder);

// Resolves the admission bound: 0 means one instance per hardware thread.
size_t MaxConcurrency();

}  // namespace server
#endif
