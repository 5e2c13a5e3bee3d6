#pragma once

#include <string>
#include <string_view>

namespace stevedore::core {

// Outcome of every fallible coordination call. `None` means success.
//
// Recoverable: InsufficientSpace, InsufficientCargo (retry, wait or shrink).
// Terminal:    ResourceGone, WaitCancelled, ShutDown (a waiter's slot is closed).
// Programming: InvalidArgument (bad units / empty symbols), reported immediately.
enum class CoordError {
  None = 0,
  InvalidArgument,
  InsufficientSpace,
  InsufficientCargo,
  AlreadyRegistered,
  ResourceGone,
  WaitCancelled,
  OperationNotFound,
  NoFeasibleCandidate,
  UnknownWorker,
  ShutDown,
  InvalidTransition,
  LaunchFailed,
};

std::string_view toString(CoordError err);

bool isTerminal(CoordError err);

// Fills *outError (when non-null) and passes `err` through, so call sites can
// `return fail(CoordError::X, outError, "detail");`.
CoordError fail(CoordError err, std::string* outError, std::string detail);

} // namespace stevedore::core
