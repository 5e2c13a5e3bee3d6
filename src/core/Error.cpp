#include "stevedore/core/Error.h"

namespace stevedore::core {

std::string_view toString(CoordError err) {
  switch (err) {
    case CoordError::None:                return "None";
    case CoordError::InvalidArgument:     return "InvalidArgument";
    case CoordError::InsufficientSpace:   return "InsufficientSpace";
    case CoordError::InsufficientCargo:   return "InsufficientCargo";
    case CoordError::AlreadyRegistered:   return "AlreadyRegistered";
    case CoordError::ResourceGone:        return "ResourceGone";
    case CoordError::WaitCancelled:       return "WaitCancelled";
    case CoordError::OperationNotFound:   return "OperationNotFound";
    case CoordError::NoFeasibleCandidate: return "NoFeasibleCandidate";
    case CoordError::UnknownWorker:       return "UnknownWorker";
    case CoordError::ShutDown:            return "ShutDown";
    case CoordError::InvalidTransition:   return "InvalidTransition";
    case CoordError::LaunchFailed:        return "LaunchFailed";
  }
  return "Unknown";
}

bool isTerminal(CoordError err) {
  return err == CoordError::ResourceGone ||
         err == CoordError::WaitCancelled ||
         err == CoordError::ShutDown;
}

CoordError fail(CoordError err, std::string* outError, std::string detail) {
  if (outError) *outError = std::move(detail);
  return err;
}

} // namespace stevedore::core
