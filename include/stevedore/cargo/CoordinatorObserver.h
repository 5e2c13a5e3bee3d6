#pragma once

#include <cstddef>
#include <string>

namespace stevedore::cargo {

class ResourceLedger;

// Hook for metrics / tracing. Injected into a ResourceCoordinator instead of
// reaching for a process-wide collector.
//
// Callbacks run while the coordinator holds its registry lock: keep them
// short and never call back into the coordinator from one.
class CoordinatorObserver {
public:
  virtual ~CoordinatorObserver() = default;

  virtual void onResourceRegistered(const ResourceLedger& /*ledger*/) {}
  virtual void onResourceUnregistered(const std::string& /*symbol*/,
                                      const std::string& /*operationId*/,
                                      std::size_t /*waitersFailed*/) {}

  virtual void onWaiterQueued(const std::string& /*operationId*/,
                              const std::string& /*good*/,
                              std::size_t /*queueDepth*/) {}
  virtual void onWaiterSatisfied(const std::string& /*operationId*/,
                                 const std::string& /*good*/,
                                 const std::string& /*resourceSymbol*/,
                                 int /*units*/) {}
  virtual void onWaiterCancelled(const std::string& /*operationId*/,
                                 const std::string& /*good*/) {}

  virtual void onDeposit(const std::string& /*resourceSymbol*/,
                         const std::string& /*good*/,
                         int /*units*/) {}
  virtual void onNotificationDropped(const std::string& /*resourceSymbol*/,
                                     const std::string& /*good*/) {}
};

} // namespace stevedore::cargo
