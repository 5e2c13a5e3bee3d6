#include "stevedore/fleet/WorkerLauncher.h"

namespace stevedore::fleet {

std::string_view toString(WorkerKind kind) {
  switch (kind) {
    case WorkerKind::Extractor: return "extractor";
    case WorkerKind::Storage:   return "storage";
    case WorkerKind::Transport: return "transport";
  }
  return "unknown";
}

} // namespace stevedore::fleet
