#pragma once

#include "stevedore/core/Types.h"
#include "stevedore/fleet/AssignmentChannel.h"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace stevedore::fleet {

class ChannelAssignmentHub;

struct AssignmentStats {
  core::u64 pairings{0};
  core::u64 transfers{0};
  std::size_t queuedConsumers{0};
  std::size_t idleProducers{0};
};

// The single arbiter of one operation's producer/consumer pairing.
//
//  request:      pair with the idle producer carrying the most (first in pool
//                order on ties), else queue the consumer (FIFO)
//  availability: refresh the cached supply level; serve the oldest queued
//                consumer, else park the producer in the pool
//  completion:   tell the producer its cargo arrived, count the transfer
//  withdrawal:   unqueue the consumer, or return an assignment it never
//                picked up to the pool
//
// Consumes one event at a time on the thread that calls run().
class WorkAssignmentLoop {
public:
  using PairingHook = std::function<void(const std::string& consumerId, const std::string& producerId)>;

  WorkAssignmentLoop(ChannelAssignmentHub& hub, std::string operationId);

  WorkAssignmentLoop(const WorkAssignmentLoop&) = delete;
  WorkAssignmentLoop& operator=(const WorkAssignmentLoop&) = delete;

  // Called on the loop thread after each delivered pairing. Set before run().
  void setPairingHook(PairingHook hook) { m_hook = std::move(hook); }

  // Returns when `stop` fires or the hub shuts down; shuts the hub down on
  // the way out so blocked workers see ShutDown.
  void run(std::stop_token stop);

  AssignmentStats stats() const;
  const std::string& operationId() const { return m_operationId; }

private:
  struct Pairing {
    std::string consumerId;
    std::string producerId;
  };

  void dispatch(const AssignmentEvent& event);

  std::optional<Pairing> handle(const ProducerRequest& e);
  std::optional<Pairing> handle(const ProducerAvailable& e);
  std::optional<Pairing> handle(const TransferCompleted& e);
  std::optional<Pairing> handle(const RequestWithdrawn& e);

  std::optional<Pairing> pairLocked(const std::string& consumerId, const std::string& producerId);
  void parkLocked(const std::string& producerId);

  ChannelAssignmentHub& m_hub;
  const std::string m_operationId;
  PairingHook m_hook;

  // Written by the loop thread, read by stats().
  mutable std::mutex m_mutex;
  std::vector<std::string> m_idle;               // pool order = arrival order
  std::unordered_map<std::string, int> m_supply; // last announced level
  std::deque<std::string> m_waiting;
  // Consumers whose withdrawn assignment was taken by their next request;
  // that request's own event is already served.
  std::unordered_set<std::string> m_servedAhead;
  core::u64 m_pairings{0};
  core::u64 m_transfers{0};
};

} // namespace stevedore::fleet
