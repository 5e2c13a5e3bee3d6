#pragma once

#include "stevedore/cargo/CoordinatorObserver.h"
#include "stevedore/cargo/ResourceLedger.h"
#include "stevedore/core/Channel.h"
#include "stevedore/core/Error.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stevedore::cargo {

struct CoordinatorConfig {
  // Per-subscriber notification buffer. A subscriber that falls this far
  // behind starts missing deposits instead of stalling the depositors.
  std::size_t depositBufferSize{10};
};

// Cargo promised to one caller by waitForCargo().
struct CargoReservation {
  std::shared_ptr<const ResourceLedger> ledger;
  int units{0};
};

// Free space promised to one depositor by reserveSpaceForDeposit().
struct SpaceGrant {
  std::shared_ptr<const ResourceLedger> ledger;
  int units{0};
};

struct DepositNotification {
  GoodSymbol good;
  int units{0};
};

using DepositChannel = core::Channel<DepositNotification>;

// Receiving end of subscribeToDeposits(). Movable RAII handle: dropping it
// (or calling unsubscribe()) closes the stream and detaches it from the
// coordinator on the next subscribe or deposit.
class DepositSubscription {
public:
  DepositSubscription() = default;
  DepositSubscription(std::string resourceSymbol, std::shared_ptr<DepositChannel> channel)
      : m_symbol(std::move(resourceSymbol)), m_channel(std::move(channel)) {}

  DepositSubscription(DepositSubscription&&) noexcept = default;
  DepositSubscription& operator=(DepositSubscription&& other) noexcept {
    if (this != &other) {
      unsubscribe();
      m_symbol = std::move(other.m_symbol);
      m_channel = std::move(other.m_channel);
    }
    return *this;
  }
  DepositSubscription(const DepositSubscription&) = delete;
  DepositSubscription& operator=(const DepositSubscription&) = delete;

  ~DepositSubscription() { unsubscribe(); }

  // Blocks until a notification arrives, the stream is closed, or `stop` fires.
  std::optional<DepositNotification> next(std::stop_token stop = {}) {
    if (!m_channel) return std::nullopt;
    return m_channel->receive(stop);
  }

  std::optional<DepositNotification> tryNext() {
    if (!m_channel) return std::nullopt;
    return m_channel->tryReceive();
  }

  void unsubscribe() {
    if (m_channel) {
      m_channel->close();
      m_channel.reset();
    }
  }

  bool active() const { return m_channel && !m_channel->closed(); }
  const std::string& resourceSymbol() const { return m_symbol; }

private:
  std::string m_symbol;
  std::shared_ptr<DepositChannel> m_channel;
};

// Process-wide meeting point for every worker of every fleet operation.
//
// Locking is two-level: m_mutex (the registry lock) guards the ledger maps,
// the waiter queues and the subscriber lists; each ResourceLedger guards its
// own counts. Registry-lock holders may take ledger locks, never the reverse.
//
// Waiters for the same (operation, good) are served strictly in arrival
// order: a queue whose head cannot be satisfied does not serve anyone behind
// it, and a newcomer never reserves past a non-empty queue.
//
// Threads blocked in waitForCargo() must be woken (stop token, shutdown())
// and joined before the coordinator is destroyed.
class ResourceCoordinator {
public:
  explicit ResourceCoordinator(CoordinatorConfig cfg = {});
  ~ResourceCoordinator();

  ResourceCoordinator(const ResourceCoordinator&) = delete;
  ResourceCoordinator& operator=(const ResourceCoordinator&) = delete;

  void setObserver(std::shared_ptr<CoordinatorObserver> observer);

  // Takes ownership. Queued waiters for goods already in the ledger's
  // inventory are served immediately (restart recovery).
  core::CoordError registerResource(std::unique_ptr<ResourceLedger> ledger,
                                    std::string* outError = nullptr);

  // Every waiter of the resource's operation fails with ResourceGone and the
  // operation's queues are cleared; deposit streams for the resource close.
  core::CoordError unregisterResource(std::string_view symbol, std::string* outError = nullptr);

  // Reserves at least `minUnits` of `good` from one of the operation's
  // resources, suspending in FIFO order until it can. Returns None (with
  // `out` filled), WaitCancelled, ResourceGone, ShutDown, OperationNotFound
  // or InvalidArgument. A cancelled wait leaves no reservation behind.
  core::CoordError waitForCargo(std::string_view operationId,
                                std::string_view good,
                                int minUnits,
                                CargoReservation& out,
                                std::stop_token stop = {},
                                std::string* outError = nullptr);

  // As waitForCargo(); WaitCancelled once `timeout` elapses.
  core::CoordError waitForCargoFor(std::string_view operationId,
                                   std::string_view good,
                                   int minUnits,
                                   std::chrono::milliseconds timeout,
                                   CargoReservation& out,
                                   std::stop_token stop = {},
                                   std::string* outError = nullptr);

  // Unreserved deposit, after the physical transfer succeeded.
  core::CoordError notifyDeposit(std::string_view resourceSymbol,
                                 std::string_view good,
                                 int units,
                                 std::string* outError = nullptr);

  // Reserve-then-confirm deposit, after the physical transfer succeeded.
  core::CoordError confirmDeposit(std::string_view resourceSymbol,
                                  std::string_view good,
                                  int units,
                                  std::string* outError = nullptr);

  // Finds free space and reserves up to `units` of it in one step, so two
  // producers never aim at the same free space. The grant may be smaller
  // than requested.
  core::CoordError reserveSpaceForDeposit(std::string_view operationId,
                                          int units,
                                          SpaceGrant& out,
                                          std::string* outError = nullptr);

  core::CoordError releaseReservedSpace(std::string_view resourceSymbol, int units,
                                        std::string* outError = nullptr);

  core::CoordError confirmWithdrawal(std::string_view resourceSymbol,
                                     std::string_view good,
                                     int units,
                                     std::string* outError = nullptr);

  // Gives reserved cargo back (aborted transfer) and re-serves the queue.
  core::CoordError cancelReservation(std::string_view resourceSymbol,
                                     std::string_view good,
                                     int units,
                                     std::string* outError = nullptr);

  // Records cargo that was jettisoned out of a resource.
  core::CoordError notifyJettison(std::string_view resourceSymbol,
                                  std::string_view good,
                                  int units,
                                  std::string* outError = nullptr);

  int totalAvailableCargo(std::string_view operationId, std::string_view good) const;
  std::shared_ptr<const ResourceLedger> findResourceWithSpace(std::string_view operationId, int minSpace) const;
  std::shared_ptr<const ResourceLedger> resource(std::string_view symbol) const;
  std::vector<std::shared_ptr<const ResourceLedger>> resourcesForOperation(std::string_view operationId) const;
  std::size_t waiterCount(std::string_view operationId, std::string_view good) const;

  // The stream is already closed when the resource is not registered.
  DepositSubscription subscribeToDeposits(std::string_view resourceSymbol);
  // Tracked streams; closed ones stay until the next subscribe or deposit.
  std::size_t subscriberCount(std::string_view resourceSymbol) const;

  // Fails every waiter with ShutDown and rejects new waits.
  void shutdown();

private:
  struct Waiter;
  using WaiterKey = std::pair<std::string, std::string>; // (operationId, good)
  using WaiterQueue = std::vector<std::shared_ptr<Waiter>>;
  using Clock = std::chrono::steady_clock;

  core::CoordError waitImpl(std::string_view operationId,
                            std::string_view good,
                            int minUnits,
                            std::optional<Clock::time_point> deadline,
                            CargoReservation& out,
                            std::stop_token stop,
                            std::string* outError);

  std::shared_ptr<ResourceLedger> findLocked(std::string_view symbol) const;
  bool tryReserveLocked(const std::string& operationId, const std::string& good, int minUnits,
                        CargoReservation& out);
  void processWaiterQueueLocked(const WaiterKey& key);
  void removeWaiterLocked(const WaiterKey& key, const std::shared_ptr<Waiter>& waiter);
  void publishDepositLocked(const std::string& resourceSymbol, const std::string& good, int units);
  static void pruneSubscribers(std::vector<std::weak_ptr<DepositChannel>>& subs);

  CoordinatorConfig m_cfg{};

  mutable std::shared_mutex m_mutex;
  std::unordered_map<std::string, std::shared_ptr<ResourceLedger>> m_ledgers;
  std::unordered_map<std::string, std::vector<std::string>> m_byOperation; // registration order
  std::map<WaiterKey, WaiterQueue> m_waiters;
  std::unordered_map<std::string, std::vector<std::weak_ptr<DepositChannel>>> m_subscribers;
  std::shared_ptr<CoordinatorObserver> m_observer;
  bool m_shutdown{false};
};

} // namespace stevedore::cargo
