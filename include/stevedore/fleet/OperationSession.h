#pragma once

#include "stevedore/cargo/ResourceCoordinator.h"
#include "stevedore/cargo/ResourceLedger.h"
#include "stevedore/fleet/ChannelAssignmentHub.h"
#include "stevedore/fleet/Operation.h"
#include "stevedore/fleet/WorkAssignmentLoop.h"
#include "stevedore/fleet/WorkerLauncher.h"
#include "stevedore/nav/CandidateSearch.h"

#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace stevedore::fleet {

// A storage hull's ledger as it should be registered at start.
struct BufferSpec {
  std::string symbol;
  int capacity{0};
  cargo::Inventory initialCargo; // observed state after a restart
};

struct SessionConfig {
  std::string siteTrait;         // searched when the operation has no site yet
  nav::SearchParams search{};
  std::size_t eventBuffer{64};   // assignment loop inbox
};

// Runs one operation: picks where it works, registers its buffers, owns the
// assignment loop thread, launches the workers, and undoes all of that on
// stop/complete (or when start fails halfway).
//
// Driven from a single controlling thread. Workers only ever see the
// coordinator and assignments().
class OperationSession {
public:
  OperationSession(std::unique_ptr<Operation> operation,
                   cargo::ResourceCoordinator& coordinator,
                   nav::RoutingOracle& oracle,
                   WorkerLauncher& launcher,
                   SessionConfig cfg = {});
  ~OperationSession();

  OperationSession(const OperationSession&) = delete;
  OperationSession& operator=(const OperationSession&) = delete;

  // PENDING -> RUNNING. A preassigned site skips the search and takes the
  // nearest destination selling fuel. On failure everything started so far
  // is undone and the operation is FAILED with the reason.
  core::CoordError start(const nav::ShipProfile& hauler,
                         std::span<const nav::Location> locations,
                         const std::vector<BufferSpec>& buffers,
                         std::stop_token stop = {},
                         std::string* outError = nullptr);

  core::CoordError stop(std::string* outError = nullptr);
  core::CoordError complete(std::string* outError = nullptr);

  const Operation& operation() const { return *m_operation; }
  const nav::Candidate& target() const { return m_target; }
  const nav::SearchStats& searchStats() const { return m_searchStats; }
  const std::vector<std::string>& launchedWorkers() const { return m_launched; }

  // nullptr unless started with at least one transport. After stop() the
  // hub answers every call with ShutDown.
  AssignmentChannel* assignments() { return m_hub.get(); }
  std::optional<AssignmentStats> assignmentStats() const;

private:
  core::CoordError selectTarget(const nav::ShipProfile& hauler,
                                std::span<const nav::Location> locations,
                                std::stop_token stop,
                                std::string* outError);
  core::CoordError registerBuffers(const std::vector<BufferSpec>& buffers, std::string* outError);
  core::CoordError launchWorkers(std::string* outError);
  core::CoordError rollback(core::CoordError err, const std::string& reason, std::string* outError);
  void teardown();

  std::unique_ptr<Operation> m_operation;
  cargo::ResourceCoordinator& m_coordinator;
  nav::RoutingOracle& m_oracle;
  WorkerLauncher& m_launcher;
  SessionConfig m_cfg;

  nav::Candidate m_target;
  nav::SearchStats m_searchStats;
  std::vector<std::string> m_registered;
  std::vector<std::string> m_launched;

  std::unique_ptr<ChannelAssignmentHub> m_hub;
  std::unique_ptr<WorkAssignmentLoop> m_loop;
  std::jthread m_loopThread;
};

} // namespace stevedore::fleet
