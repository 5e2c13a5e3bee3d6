#include "stevedore/fleet/WorkAssignmentLoop.h"

#include "stevedore/core/Log.h"
#include "stevedore/fleet/ChannelAssignmentHub.h"

#include <algorithm>
#include <utility>

namespace stevedore::fleet {

WorkAssignmentLoop::WorkAssignmentLoop(ChannelAssignmentHub& hub, std::string operationId)
    : m_hub(hub), m_operationId(std::move(operationId)) {}

void WorkAssignmentLoop::run(std::stop_token stop) {
  STEVEDORE_LOG_INFO("Assignment loop started for " + m_operationId);

  while (auto event = m_hub.nextEvent(stop)) {
    dispatch(*event);
  }

  // Whatever is still in flight is abandoned, not delivered.
  m_hub.shutdown();

  const auto s = stats();
  STEVEDORE_LOG_INFO("Assignment loop for " + m_operationId + " stopped: " + std::to_string(s.pairings) +
                     " pairings, " + std::to_string(s.transfers) + " transfers");
}

void WorkAssignmentLoop::dispatch(const AssignmentEvent& event) {
  std::optional<Pairing> paired;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    paired = std::visit([this](const auto& e) { return handle(e); }, event);
  }
  if (paired && m_hook) m_hook(paired->consumerId, paired->producerId);
}

std::optional<WorkAssignmentLoop::Pairing> WorkAssignmentLoop::handle(const ProducerRequest& e) {
  if (m_servedAhead.erase(e.consumerId) > 0) {
    STEVEDORE_LOG_DEBUG(e.consumerId + " already holds a producer; request dropped");
    return std::nullopt;
  }

  if (m_idle.empty()) {
    if (std::find(m_waiting.begin(), m_waiting.end(), e.consumerId) == m_waiting.end()) {
      m_waiting.push_back(e.consumerId);
    }
    STEVEDORE_LOG_DEBUG(e.consumerId + " queued for a producer (" + std::to_string(m_waiting.size()) + " waiting)");
    return std::nullopt;
  }

  // Fullest producer first so it can leave sooner.
  auto best = m_idle.begin();
  for (auto it = std::next(m_idle.begin()); it != m_idle.end(); ++it) {
    if (m_supply[*it] > m_supply[*best]) best = it;
  }
  const std::string producerId = *best;
  m_idle.erase(best);
  return pairLocked(e.consumerId, producerId);
}

std::optional<WorkAssignmentLoop::Pairing> WorkAssignmentLoop::handle(const ProducerAvailable& e) {
  m_supply[e.producerId] = e.supplyLevel;

  if (!m_waiting.empty()) {
    const std::string consumerId = m_waiting.front();
    m_waiting.pop_front();
    // A producer announcing itself again is no longer idle.
    m_idle.erase(std::remove(m_idle.begin(), m_idle.end(), e.producerId), m_idle.end());
    return pairLocked(consumerId, e.producerId);
  }

  parkLocked(e.producerId);
  STEVEDORE_LOG_DEBUG(e.producerId + " idle with " + std::to_string(e.supplyLevel) + " units (" +
                      std::to_string(m_idle.size()) + " idle)");
  return std::nullopt;
}

std::optional<WorkAssignmentLoop::Pairing> WorkAssignmentLoop::handle(const TransferCompleted& e) {
  if (!m_hub.deliverCargoReceived(e.producerId, e.consumerId) && !m_hub.isShutDown()) {
    STEVEDORE_LOG_WARN("Cargo-received notice for " + e.producerId + " not delivered (already pending)");
  }
  ++m_transfers;
  STEVEDORE_LOG_DEBUG(e.consumerId + " -> " + e.producerId + " transfer complete (" +
                      std::to_string(m_transfers) + " total)");
  return std::nullopt;
}

std::optional<WorkAssignmentLoop::Pairing> WorkAssignmentLoop::handle(const RequestWithdrawn& e) {
  const auto queued = std::find(m_waiting.begin(), m_waiting.end(), e.consumerId);
  if (queued != m_waiting.end()) {
    m_waiting.erase(queued);
    STEVEDORE_LOG_DEBUG(e.consumerId + " withdrew its producer request");
    return std::nullopt;
  }

  // Events are FIFO, so the withdrawn request was already paired.
  if (auto producer = m_hub.reclaimAssignment(e.consumerId)) {
    STEVEDORE_LOG_DEBUG("Assignment " + *producer + " -> " + e.consumerId + " withdrawn; producer returned to pool");
    parkLocked(*producer);
    return std::nullopt;
  }

  // The consumer's next request picked the assignment up first.
  m_servedAhead.insert(e.consumerId);
  return std::nullopt;
}

std::optional<WorkAssignmentLoop::Pairing> WorkAssignmentLoop::pairLocked(const std::string& consumerId,
                                                                          const std::string& producerId) {
  if (!m_hub.deliverAssignment(consumerId, producerId)) {
    if (!m_hub.isShutDown()) {
      STEVEDORE_LOG_WARN("Assignment " + producerId + " -> " + consumerId +
                         " not delivered (stale request); producer returned to pool");
    }
    parkLocked(producerId);
    return std::nullopt;
  }

  ++m_pairings;
  STEVEDORE_LOG_DEBUG("Paired " + consumerId + " with " + producerId + " (supply " +
                      std::to_string(m_supply[producerId]) + ")");
  return Pairing{consumerId, producerId};
}

void WorkAssignmentLoop::parkLocked(const std::string& producerId) {
  if (std::find(m_idle.begin(), m_idle.end(), producerId) == m_idle.end()) {
    m_idle.push_back(producerId);
  }
}

AssignmentStats WorkAssignmentLoop::stats() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  AssignmentStats s;
  s.pairings = m_pairings;
  s.transfers = m_transfers;
  s.queuedConsumers = m_waiting.size();
  s.idleProducers = m_idle.size();
  return s;
}

} // namespace stevedore::fleet
