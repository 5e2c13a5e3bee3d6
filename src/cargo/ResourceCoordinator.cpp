#include "stevedore/cargo/ResourceCoordinator.h"

#include "stevedore/core/Log.h"

#include <algorithm>
#include <condition_variable>

namespace stevedore::cargo {

using core::CoordError;
using core::fail;

struct ResourceCoordinator::Waiter {
  std::string operationId;
  std::string good;
  int minUnits{0};

  // Result slot, written once under the registry lock.
  bool done{false};
  CoordError error{CoordError::None};
  std::string detail;
  CargoReservation result;

  std::condition_variable_any cv;
};

namespace {

std::string keyText(const std::string& operationId, const std::string& good) {
  return operationId + "/" + good;
}

} // namespace

ResourceCoordinator::ResourceCoordinator(CoordinatorConfig cfg) : m_cfg(cfg) {}

ResourceCoordinator::~ResourceCoordinator() {
  shutdown();
}

void ResourceCoordinator::setObserver(std::shared_ptr<CoordinatorObserver> observer) {
  std::unique_lock<std::shared_mutex> lock(m_mutex);
  m_observer = std::move(observer);
}

std::shared_ptr<ResourceLedger> ResourceCoordinator::findLocked(std::string_view symbol) const {
  const auto it = m_ledgers.find(std::string(symbol));
  return it == m_ledgers.end() ? nullptr : it->second;
}

CoordError ResourceCoordinator::registerResource(std::unique_ptr<ResourceLedger> ledger, std::string* outError) {
  if (!ledger) {
    return fail(CoordError::InvalidArgument, outError, "ledger cannot be null");
  }

  std::unique_lock<std::shared_mutex> lock(m_mutex);

  const std::string symbol = ledger->symbol();
  if (m_ledgers.count(symbol) != 0) {
    return fail(CoordError::AlreadyRegistered, outError, "resource " + symbol + " is already registered");
  }

  std::shared_ptr<ResourceLedger> shared(std::move(ledger));
  const std::string opId = shared->operationId();
  m_ledgers.emplace(symbol, shared);
  m_byOperation[opId].push_back(symbol);

  if (m_observer) m_observer->onResourceRegistered(*shared);
  STEVEDORE_LOG_INFO("Registered " + shared->describe());

  // A consumer may already be queued when a restarted process re-registers
  // the buffers it is waiting on.
  for (const auto& good : shared->goods()) {
    processWaiterQueueLocked(WaiterKey{opId, good});
  }

  return CoordError::None;
}

CoordError ResourceCoordinator::unregisterResource(std::string_view symbol, std::string* outError) {
  std::unique_lock<std::shared_mutex> lock(m_mutex);

  const auto it = m_ledgers.find(std::string(symbol));
  if (it == m_ledgers.end()) {
    return fail(CoordError::ResourceGone, outError, "resource " + std::string(symbol) + " is not registered");
  }

  const std::string sym = it->first;
  const std::string opId = it->second->operationId();
  m_ledgers.erase(it);

  if (auto opIt = m_byOperation.find(opId); opIt != m_byOperation.end()) {
    auto& symbols = opIt->second;
    symbols.erase(std::remove(symbols.begin(), symbols.end(), sym), symbols.end());
    if (symbols.empty()) m_byOperation.erase(opIt);
  }

  // Remaining capacity changed under every waiter of the operation: fail
  // them all and let the workers decide whether to wait again.
  std::size_t failed = 0;
  for (auto qIt = m_waiters.begin(); qIt != m_waiters.end();) {
    if (qIt->first.first != opId) {
      ++qIt;
      continue;
    }
    for (const auto& waiter : qIt->second) {
      waiter->error = CoordError::ResourceGone;
      waiter->detail = "resource " + sym + " was unregistered";
      waiter->done = true;
      waiter->cv.notify_one();
      ++failed;
    }
    qIt = m_waiters.erase(qIt);
  }

  if (auto subIt = m_subscribers.find(sym); subIt != m_subscribers.end()) {
    for (const auto& weak : subIt->second) {
      if (auto channel = weak.lock()) channel->close();
    }
    m_subscribers.erase(subIt);
  }

  if (m_observer) m_observer->onResourceUnregistered(sym, opId, failed);
  STEVEDORE_LOG_INFO("Unregistered resource " + sym + " (op=" + opId + ", waiters failed=" +
                     std::to_string(failed) + ")");
  return CoordError::None;
}

CoordError ResourceCoordinator::waitForCargo(std::string_view operationId,
                                             std::string_view good,
                                             int minUnits,
                                             CargoReservation& out,
                                             std::stop_token stop,
                                             std::string* outError) {
  return waitImpl(operationId, good, minUnits, std::nullopt, out, std::move(stop), outError);
}

CoordError ResourceCoordinator::waitForCargoFor(std::string_view operationId,
                                                std::string_view good,
                                                int minUnits,
                                                std::chrono::milliseconds timeout,
                                                CargoReservation& out,
                                                std::stop_token stop,
                                                std::string* outError) {
  return waitImpl(operationId, good, minUnits, Clock::now() + timeout, out, std::move(stop), outError);
}

CoordError ResourceCoordinator::waitImpl(std::string_view operationId,
                                         std::string_view good,
                                         int minUnits,
                                         std::optional<Clock::time_point> deadline,
                                         CargoReservation& out,
                                         std::stop_token stop,
                                         std::string* outError) {
  out = CargoReservation{};
  if (minUnits <= 0) {
    return fail(CoordError::InvalidArgument, outError, "minUnits must be positive");
  }
  if (good.empty()) {
    return fail(CoordError::InvalidArgument, outError, "good symbol cannot be empty");
  }

  const WaiterKey key{std::string(operationId), std::string(good)};

  std::unique_lock<std::shared_mutex> lock(m_mutex);

  if (m_shutdown) {
    return fail(CoordError::ShutDown, outError, "coordinator is shut down");
  }

  const auto opIt = m_byOperation.find(key.first);
  if (opIt == m_byOperation.end() || opIt->second.empty()) {
    return fail(CoordError::OperationNotFound, outError,
                "no resources registered for operation " + key.first);
  }

  // Never reserve past consumers that are already queued for this good.
  const auto qIt = m_waiters.find(key);
  const bool queueEmpty = qIt == m_waiters.end() || qIt->second.empty();
  if (queueEmpty && tryReserveLocked(key.first, key.second, minUnits, out)) {
    STEVEDORE_LOG_DEBUG("Immediate reservation " + keyText(key.first, key.second) + ": " +
                        std::to_string(out.units) + " from " + out.ledger->symbol());
    return CoordError::None;
  }

  auto waiter = std::make_shared<Waiter>();
  waiter->operationId = key.first;
  waiter->good = key.second;
  waiter->minUnits = minUnits;

  auto& queue = m_waiters[key];
  queue.push_back(waiter);
  if (m_observer) m_observer->onWaiterQueued(key.first, key.second, queue.size());
  STEVEDORE_LOG_DEBUG("Waiter queued on " + keyText(key.first, key.second) + " (min=" +
                      std::to_string(minUnits) + ", depth=" + std::to_string(queue.size()) + ")");

  const auto delivered = [&waiter] { return waiter->done; };
  const bool done = deadline ? waiter->cv.wait_until(lock, stop, *deadline, delivered)
                             : waiter->cv.wait(lock, stop, delivered);

  if (!done) {
    // Still queued, so nothing was reserved on its behalf.
    removeWaiterLocked(key, waiter);
    if (m_observer) m_observer->onWaiterCancelled(key.first, key.second);
    return fail(CoordError::WaitCancelled, outError,
                "wait for " + keyText(key.first, key.second) +
                (stop.stop_requested() ? " was cancelled" : " timed out"));
  }

  if (waiter->error != CoordError::None) {
    return fail(waiter->error, outError, waiter->detail);
  }

  out = std::move(waiter->result);
  return CoordError::None;
}

bool ResourceCoordinator::tryReserveLocked(const std::string& operationId,
                                           const std::string& good,
                                           int minUnits,
                                           CargoReservation& out) {
  const auto opIt = m_byOperation.find(operationId);
  if (opIt == m_byOperation.end()) return false;

  for (const auto& symbol : opIt->second) {
    const auto ledger = findLocked(symbol);
    if (!ledger) continue;

    int reserved = 0;
    if (ledger->tryReserveCargo(good, minUnits, reserved) != CoordError::None) continue;
    if (reserved > 0) {
      out.ledger = ledger;
      out.units = reserved;
      return true;
    }
  }
  return false;
}

void ResourceCoordinator::processWaiterQueueLocked(const WaiterKey& key) {
  const auto it = m_waiters.find(key);
  if (it == m_waiters.end()) return;

  auto& queue = it->second;
  std::size_t served = 0;
  for (; served < queue.size(); ++served) {
    const auto& waiter = queue[served];

    CargoReservation reservation;
    if (!tryReserveLocked(key.first, key.second, waiter->minUnits, reservation)) {
      // Head-of-line blocking is deliberate: later (smaller) requests wait too.
      break;
    }

    if (m_observer) {
      m_observer->onWaiterSatisfied(key.first, key.second, reservation.ledger->symbol(), reservation.units);
    }
    STEVEDORE_LOG_DEBUG("Waiter on " + keyText(key.first, key.second) + " satisfied: " +
                        std::to_string(reservation.units) + " from " + reservation.ledger->symbol());

    waiter->result = std::move(reservation);
    waiter->done = true;
    waiter->cv.notify_one();
  }

  queue.erase(queue.begin(), queue.begin() + (std::ptrdiff_t)served);
  if (queue.empty()) m_waiters.erase(it);
}

void ResourceCoordinator::removeWaiterLocked(const WaiterKey& key, const std::shared_ptr<Waiter>& waiter) {
  const auto it = m_waiters.find(key);
  if (it == m_waiters.end()) return;

  auto& queue = it->second;
  queue.erase(std::remove(queue.begin(), queue.end(), waiter), queue.end());
  if (queue.empty()) {
    m_waiters.erase(it);
  } else {
    // The departing waiter may have been the head blocking the others.
    processWaiterQueueLocked(key);
  }
}

void ResourceCoordinator::publishDepositLocked(const std::string& resourceSymbol,
                                               const std::string& good,
                                               int units) {
  const auto it = m_subscribers.find(resourceSymbol);
  if (it == m_subscribers.end()) return;

  auto& subs = it->second;
  pruneSubscribers(subs);
  for (const auto& weak : subs) {
    const auto channel = weak.lock();
    if (channel && !channel->trySend(DepositNotification{good, units})) {
      if (m_observer) m_observer->onNotificationDropped(resourceSymbol, good);
      STEVEDORE_LOG_TRACE("Deposit notification dropped for a slow subscriber of " + resourceSymbol);
    }
  }
  if (subs.empty()) m_subscribers.erase(it);
}

void ResourceCoordinator::pruneSubscribers(std::vector<std::weak_ptr<DepositChannel>>& subs) {
  subs.erase(std::remove_if(subs.begin(),
                            subs.end(),
                            [](const std::weak_ptr<DepositChannel>& weak) {
                              const auto channel = weak.lock();
                              return !channel || channel->closed();
                            }),
             subs.end());
}

CoordError ResourceCoordinator::notifyDeposit(std::string_view resourceSymbol,
                                              std::string_view good,
                                              int units,
                                              std::string* outError) {
  std::unique_lock<std::shared_mutex> lock(m_mutex);

  const auto ledger = findLocked(resourceSymbol);
  if (!ledger) {
    return fail(CoordError::ResourceGone, outError,
                "deposit to unknown resource " + std::string(resourceSymbol));
  }

  std::string detail;
  if (const auto err = ledger->depositCargo(good, units, &detail); err != CoordError::None) {
    STEVEDORE_LOG_WARN("Deposit rejected: " + detail);
    return fail(err, outError, detail);
  }

  const std::string goodKey(good);
  if (m_observer) m_observer->onDeposit(ledger->symbol(), goodKey, units);
  publishDepositLocked(ledger->symbol(), goodKey, units);
  processWaiterQueueLocked(WaiterKey{ledger->operationId(), goodKey});
  return CoordError::None;
}

CoordError ResourceCoordinator::confirmDeposit(std::string_view resourceSymbol,
                                               std::string_view good,
                                               int units,
                                               std::string* outError) {
  std::unique_lock<std::shared_mutex> lock(m_mutex);

  const auto ledger = findLocked(resourceSymbol);
  if (!ledger) {
    return fail(CoordError::ResourceGone, outError,
                "deposit confirmation for unknown resource " + std::string(resourceSymbol));
  }

  std::string detail;
  if (const auto err = ledger->confirmDeposit(good, units, &detail); err != CoordError::None) {
    STEVEDORE_LOG_WARN("Deposit confirmation rejected: " + detail);
    return fail(err, outError, detail);
  }

  const std::string goodKey(good);
  if (m_observer) m_observer->onDeposit(ledger->symbol(), goodKey, units);
  publishDepositLocked(ledger->symbol(), goodKey, units);
  processWaiterQueueLocked(WaiterKey{ledger->operationId(), goodKey});
  return CoordError::None;
}

CoordError ResourceCoordinator::reserveSpaceForDeposit(std::string_view operationId,
                                                       int units,
                                                       SpaceGrant& out,
                                                       std::string* outError) {
  out = SpaceGrant{};
  if (units <= 0) {
    return fail(CoordError::InvalidArgument, outError, "reserve units must be positive");
  }

  // Exclusive: find-then-reserve must not interleave with another producer.
  std::unique_lock<std::shared_mutex> lock(m_mutex);

  const auto opIt = m_byOperation.find(std::string(operationId));
  if (opIt == m_byOperation.end() || opIt->second.empty()) {
    return fail(CoordError::OperationNotFound, outError,
                "no resources registered for operation " + std::string(operationId));
  }

  for (const auto& symbol : opIt->second) {
    const auto ledger = findLocked(symbol);
    if (!ledger) continue;

    const int available = ledger->availableSpace();
    if (available <= 0) continue;

    const int grant = std::min(units, available);
    if (ledger->reserveSpace(grant) == CoordError::None) {
      out.ledger = ledger;
      out.units = grant;
      return CoordError::None;
    }
  }

  return fail(CoordError::InsufficientSpace, outError,
              "no free space in operation " + std::string(operationId));
}

CoordError ResourceCoordinator::releaseReservedSpace(std::string_view resourceSymbol, int units,
                                                     std::string* outError) {
  std::shared_lock<std::shared_mutex> lock(m_mutex);

  const auto ledger = findLocked(resourceSymbol);
  if (!ledger) {
    return fail(CoordError::ResourceGone, outError, "unknown resource " + std::string(resourceSymbol));
  }
  ledger->releaseReservedSpace(units);
  return CoordError::None;
}

CoordError ResourceCoordinator::confirmWithdrawal(std::string_view resourceSymbol,
                                                  std::string_view good,
                                                  int units,
                                                  std::string* outError) {
  std::shared_lock<std::shared_mutex> lock(m_mutex);

  const auto ledger = findLocked(resourceSymbol);
  if (!ledger) {
    return fail(CoordError::ResourceGone, outError, "unknown resource " + std::string(resourceSymbol));
  }
  return ledger->confirmWithdrawal(good, units, outError);
}

CoordError ResourceCoordinator::cancelReservation(std::string_view resourceSymbol,
                                                  std::string_view good,
                                                  int units,
                                                  std::string* outError) {
  std::unique_lock<std::shared_mutex> lock(m_mutex);

  const auto ledger = findLocked(resourceSymbol);
  if (!ledger) {
    return fail(CoordError::ResourceGone, outError, "unknown resource " + std::string(resourceSymbol));
  }
  if (const auto err = ledger->cancelReservation(good, units, outError); err != CoordError::None) {
    return err;
  }

  processWaiterQueueLocked(WaiterKey{ledger->operationId(), std::string(good)});
  return CoordError::None;
}

CoordError ResourceCoordinator::notifyJettison(std::string_view resourceSymbol,
                                               std::string_view good,
                                               int units,
                                               std::string* outError) {
  std::shared_lock<std::shared_mutex> lock(m_mutex);

  const auto ledger = findLocked(resourceSymbol);
  if (!ledger) {
    return fail(CoordError::ResourceGone, outError, "unknown resource " + std::string(resourceSymbol));
  }

  std::string detail;
  if (const auto err = ledger->jettisonCargo(good, units, &detail); err != CoordError::None) {
    STEVEDORE_LOG_WARN("Jettison rejected: " + detail);
    return fail(err, outError, detail);
  }
  return CoordError::None;
}

int ResourceCoordinator::totalAvailableCargo(std::string_view operationId, std::string_view good) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);

  const auto opIt = m_byOperation.find(std::string(operationId));
  if (opIt == m_byOperation.end()) return 0;

  int total = 0;
  for (const auto& symbol : opIt->second) {
    if (const auto ledger = findLocked(symbol)) total += ledger->availableCargo(good);
  }
  return total;
}

std::shared_ptr<const ResourceLedger> ResourceCoordinator::findResourceWithSpace(std::string_view operationId,
                                                                                int minSpace) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);

  const auto opIt = m_byOperation.find(std::string(operationId));
  if (opIt == m_byOperation.end()) return nullptr;

  for (const auto& symbol : opIt->second) {
    const auto ledger = findLocked(symbol);
    if (ledger && ledger->availableSpace() >= minSpace) return ledger;
  }
  return nullptr;
}

std::shared_ptr<const ResourceLedger> ResourceCoordinator::resource(std::string_view symbol) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  return findLocked(symbol);
}

std::vector<std::shared_ptr<const ResourceLedger>>
ResourceCoordinator::resourcesForOperation(std::string_view operationId) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);

  std::vector<std::shared_ptr<const ResourceLedger>> out;
  const auto opIt = m_byOperation.find(std::string(operationId));
  if (opIt == m_byOperation.end()) return out;

  out.reserve(opIt->second.size());
  for (const auto& symbol : opIt->second) {
    if (auto ledger = findLocked(symbol)) out.push_back(std::move(ledger));
  }
  return out;
}

std::size_t ResourceCoordinator::waiterCount(std::string_view operationId, std::string_view good) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);
  const auto it = m_waiters.find(WaiterKey{std::string(operationId), std::string(good)});
  return it == m_waiters.end() ? 0 : it->second.size();
}

DepositSubscription ResourceCoordinator::subscribeToDeposits(std::string_view resourceSymbol) {
  auto channel = std::make_shared<DepositChannel>(m_cfg.depositBufferSize);

  std::unique_lock<std::shared_mutex> lock(m_mutex);
  if (m_shutdown || !findLocked(resourceSymbol)) {
    // Nothing will ever be deposited here: hand back a finished stream.
    STEVEDORE_LOG_DEBUG("Deposit subscription to unknown resource " + std::string(resourceSymbol) + " closed");
    channel->close();
    return DepositSubscription(std::string(resourceSymbol), std::move(channel));
  }

  auto& subs = m_subscribers[std::string(resourceSymbol)];
  pruneSubscribers(subs);
  subs.push_back(channel);
  return DepositSubscription(std::string(resourceSymbol), std::move(channel));
}

std::size_t ResourceCoordinator::subscriberCount(std::string_view resourceSymbol) const {
  std::shared_lock<std::shared_mutex> lock(m_mutex);

  const auto it = m_subscribers.find(std::string(resourceSymbol));
  if (it == m_subscribers.end()) return 0;

  return it->second.size();
}

void ResourceCoordinator::shutdown() {
  std::unique_lock<std::shared_mutex> lock(m_mutex);
  if (m_shutdown) return;
  m_shutdown = true;

  std::size_t failed = 0;
  for (auto& [key, queue] : m_waiters) {
    for (const auto& waiter : queue) {
      waiter->error = CoordError::ShutDown;
      waiter->detail = "coordinator shut down";
      waiter->done = true;
      waiter->cv.notify_one();
      ++failed;
    }
  }
  m_waiters.clear();

  for (auto& [symbol, subs] : m_subscribers) {
    for (const auto& weak : subs) {
      if (auto channel = weak.lock()) channel->close();
    }
  }
  m_subscribers.clear();

  if (failed > 0) {
    STEVEDORE_LOG_INFO("Coordinator shut down with " + std::to_string(failed) + " waiters pending");
  }
}

} // namespace stevedore::cargo
