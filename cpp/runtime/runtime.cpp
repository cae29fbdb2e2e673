#include "runtime/runtime.hpp"

#include <kj/debug.h>

namespace runtime {

std::vector<Runtime::Entry>* Runtime::Runtimes_() {
  static std::vector<Entry>* runtimes = new std::vector<Entry>;
  return runtimes;
}

void Runtime::Register_(const char* name, create_t create, score_t score) {
  Runtimes_()->push_back(Entry{name, std::move(create), std::move(score)});
}

std::unique_ptr<Runtime> Runtime::Create(const std::string& name,
                                 kj::LowLevelAsyncIoProvider& io) {
  const Entry* chosen = nullptr;
  if (name == "auto") {
    int best_score = 0;
    for (const Entry& entry : *Runtimes_()) {
      int score = entry.score();
      if (score > best_score) {
        best_score = score;
        chosen = &entry;
      }
    }
    KJ_REQUIRE(chosen != nullptr, "No runtime could be found");
  } else {
    for (const Entry& entry : *Runtimes_()) {
      if (entry.name == name) chosen = &entry;
    }
    KJ_REQUIRE(chosen != nullptr, "Unknown runtime", name.c_str());
  }
  KJ_LOG(INFO, "Using runtime", chosen->name.c_str());
  return std::unique_ptr<Runtime>(chosen->create(io));
}

}  // namespace runtime
