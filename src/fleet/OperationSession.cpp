#include "stevedore/fleet/OperationSession.h"

#include "stevedore/core/Log.h"

#include <utility>

namespace stevedore::fleet {

using core::CoordError;

OperationSession::OperationSession(std::unique_ptr<Operation> operation,
                                   cargo::ResourceCoordinator& coordinator,
                                   nav::RoutingOracle& oracle,
                                   WorkerLauncher& launcher,
                                   SessionConfig cfg)
    : m_operation(std::move(operation))
    , m_coordinator(coordinator)
    , m_oracle(oracle)
    , m_launcher(launcher)
    , m_cfg(std::move(cfg)) {}

OperationSession::~OperationSession() {
  teardown();
  if (m_operation && m_operation->isRunning()) {
    std::string err;
    if (m_operation->stop(&err) != CoordError::None) STEVEDORE_LOG_WARN(err);
  }
}

CoordError OperationSession::start(const nav::ShipProfile& hauler,
                                   std::span<const nav::Location> locations,
                                   const std::vector<BufferSpec>& buffers,
                                   std::stop_token stop,
                                   std::string* outError) {
  if (!m_operation->isPending()) {
    return core::fail(CoordError::InvalidTransition, outError,
                      "cannot start operation " + m_operation->id() + " in " +
                      std::string(toString(m_operation->status())) + " state");
  }

  std::string err;
  if (const auto e = selectTarget(hauler, locations, stop, &err); e != CoordError::None) {
    return rollback(e, err, outError);
  }
  if (const auto e = registerBuffers(buffers, &err); e != CoordError::None) {
    return rollback(e, err, outError);
  }

  if (!m_operation->transports().empty()) {
    m_hub = std::make_unique<ChannelAssignmentHub>(m_operation->extractors(), m_operation->transports(),
                                                   m_cfg.eventBuffer);
    m_loop = std::make_unique<WorkAssignmentLoop>(*m_hub, m_operation->id());
    m_loopThread = std::jthread([loop = m_loop.get()](std::stop_token st) { loop->run(st); });
  }

  if (const auto e = launchWorkers(&err); e != CoordError::None) {
    return rollback(e, err, outError);
  }

  if (const auto e = m_operation->start(&err); e != CoordError::None) {
    return rollback(e, err, outError);
  }

  STEVEDORE_LOG_INFO("Started " + m_operation->describe() + " -> " + m_target.destination);
  return CoordError::None;
}

CoordError OperationSession::selectTarget(const nav::ShipProfile& hauler,
                                          std::span<const nav::Location> locations,
                                          std::stop_token stop,
                                          std::string* outError) {
  const std::string& destTrait = m_cfg.search.destinationTrait;

  if (!m_operation->siteSymbol().empty()) {
    const std::string& site = m_operation->siteSymbol();
    const nav::Location* from = nav::findLocation(locations, site);
    const nav::Location* dest = nav::closestDestinationWithFuel(site, locations, destTrait, outError);
    if (!from || !dest) return CoordError::NoFeasibleCandidate;

    m_target = nav::Candidate{};
    m_target.site = site;
    m_target.destination = dest->symbol;
    m_target.distance = math::distance(from->pos, dest->pos);
    m_target.feasible = true;
    STEVEDORE_LOG_WARN("Site " + site + " chosen by hand; round trip to " + dest->symbol + " not checked");
    return CoordError::None;
  }

  if (m_cfg.siteTrait.empty()) {
    return core::fail(CoordError::InvalidArgument, outError, "no site assigned and no site trait to search for");
  }

  nav::CandidateSearchPool pool(m_oracle, m_cfg.search);
  nav::CandidateSelection selection;
  if (const auto e = pool.selectBestCandidate(m_cfg.siteTrait, hauler, locations, selection, stop, outError);
      e != CoordError::None) {
    m_searchStats = selection.stats;
    return e;
  }

  m_target = selection.best;
  m_searchStats = selection.stats;
  return m_operation->assignSite(m_target.site, outError);
}

CoordError OperationSession::registerBuffers(const std::vector<BufferSpec>& buffers, std::string* outError) {
  for (const auto& b : buffers) {
    auto ledger = cargo::ResourceLedger::create(b.symbol, m_target.site, m_operation->id(), b.capacity,
                                                b.initialCargo, outError);
    if (!ledger) return CoordError::InvalidArgument;

    if (const auto e = m_coordinator.registerResource(std::move(ledger), outError); e != CoordError::None) {
      return e;
    }
    m_registered.push_back(b.symbol);
  }
  return CoordError::None;
}

CoordError OperationSession::launchWorkers(std::string* outError) {
  // Buffers first: extractors start depositing as soon as they arrive.
  const std::pair<WorkerKind, const std::vector<std::string>*> groups[] = {
    {WorkerKind::Storage, &m_operation->storage()},
    {WorkerKind::Transport, &m_operation->transports()},
    {WorkerKind::Extractor, &m_operation->extractors()},
  };

  for (const auto& [kind, ships] : groups) {
    for (const auto& ship : *ships) {
      WorkerCommand cmd;
      cmd.kind = kind;
      cmd.shipSymbol = ship;
      cmd.operationId = m_operation->id();
      cmd.siteSymbol = m_target.site;
      cmd.destinationSymbol = m_target.destination;

      std::string err;
      auto id = m_launcher.startWorker(cmd, &err);
      if (!id) {
        return core::fail(CoordError::LaunchFailed, outError,
                          "failed to launch " + std::string(toString(kind)) + " " + ship + ": " + err);
      }
      STEVEDORE_LOG_DEBUG("Launched " + std::string(toString(kind)) + " worker " + *id + " for " + ship);
      m_launched.push_back(std::move(*id));
    }
  }
  return CoordError::None;
}

CoordError OperationSession::rollback(CoordError err, const std::string& reason, std::string* outError) {
  STEVEDORE_LOG_ERROR("Operation " + m_operation->id() + " failed to start: " + reason);
  teardown();

  std::string transitionErr;
  if (m_operation->fail(reason, &transitionErr) != CoordError::None) {
    STEVEDORE_LOG_WARN(transitionErr);
  }
  return core::fail(err, outError, reason);
}

void OperationSession::teardown() {
  // Loop first: blocked pairings end with ShutDown before workers go away.
  if (m_loopThread.joinable()) {
    m_loopThread.request_stop();
    m_loopThread.join();
  }
  if (m_hub) m_hub->shutdown();

  for (auto it = m_launched.rbegin(); it != m_launched.rend(); ++it) {
    std::string err;
    if (!m_launcher.stopWorker(*it, &err)) {
      STEVEDORE_LOG_WARN("Failed to stop worker " + *it + ": " + err);
    }
  }
  m_launched.clear();

  for (const auto& symbol : m_registered) {
    std::string err;
    if (m_coordinator.unregisterResource(symbol, &err) != CoordError::None) {
      STEVEDORE_LOG_WARN("Failed to unregister " + symbol + ": " + err);
    }
  }
  m_registered.clear();
}

CoordError OperationSession::stop(std::string* outError) {
  teardown();
  if (const auto e = m_operation->stop(outError); e != CoordError::None) return e;
  STEVEDORE_LOG_INFO("Stopped " + m_operation->describe());
  return CoordError::None;
}

CoordError OperationSession::complete(std::string* outError) {
  if (!m_operation->isRunning()) return m_operation->complete(outError);

  teardown();
  if (const auto e = m_operation->complete(outError); e != CoordError::None) return e;
  STEVEDORE_LOG_INFO("Completed " + m_operation->describe());
  return CoordError::None;
}

std::optional<AssignmentStats> OperationSession::assignmentStats() const {
  if (!m_loop) return std::nullopt;
  return m_loop->stats();
}

} // namespace stevedore::fleet
