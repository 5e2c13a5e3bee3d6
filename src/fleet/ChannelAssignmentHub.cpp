#include "stevedore/fleet/ChannelAssignmentHub.h"

#include "stevedore/core/Log.h"

#include <utility>

namespace stevedore::fleet {

using core::CoordError;
using core::fail;

ChannelAssignmentHub::ChannelAssignmentHub(const std::vector<std::string>& consumerIds,
                                           const std::vector<std::string>& producerIds,
                                           std::size_t eventBuffer)
    : m_events(eventBuffer) {
  for (const auto& id : consumerIds) m_assignments.try_emplace(id, std::make_unique<Mailbox>(1));
  for (const auto& id : producerIds) m_cargoReceived.try_emplace(id, std::make_unique<Mailbox>(1));
}

ChannelAssignmentHub::~ChannelAssignmentHub() {
  shutdown();
}

ChannelAssignmentHub::Mailbox* ChannelAssignmentHub::find(const MailboxMap& map, std::string_view id) {
  const auto it = map.find(std::string(id));
  return it == map.end() ? nullptr : it->second.get();
}

bool ChannelAssignmentHub::isConsumer(std::string_view id) const {
  return find(m_assignments, id) != nullptr;
}

bool ChannelAssignmentHub::isProducer(std::string_view id) const {
  return find(m_cargoReceived, id) != nullptr;
}

CoordError ChannelAssignmentHub::interrupted(const std::stop_token& stop,
                                             std::string* outError,
                                             std::string_view what) const {
  if (m_shutdown.load()) {
    return fail(CoordError::ShutDown, outError, std::string(what) + ": assignment hub shut down");
  }
  if (stop.stop_requested()) {
    return fail(CoordError::WaitCancelled, outError, std::string(what) + ": cancelled");
  }
  // A mailbox only closes on shutdown.
  return fail(CoordError::ShutDown, outError, std::string(what) + ": channel closed");
}

CoordError ChannelAssignmentHub::post(AssignmentEvent event, std::stop_token stop, std::string* outError) {
  if (m_shutdown.load()) {
    return fail(CoordError::ShutDown, outError, "assignment hub shut down");
  }
  if (!m_events.send(std::move(event), stop)) {
    return interrupted(stop, outError, "posting assignment event");
  }
  return CoordError::None;
}

CoordError ChannelAssignmentHub::requestProducer(std::string_view consumerId,
                                                 std::string& outProducerId,
                                                 std::stop_token stop,
                                                 std::string* outError) {
  outProducerId.clear();

  Mailbox* box = find(m_assignments, consumerId);
  if (!box) {
    return fail(CoordError::UnknownWorker, outError, "unknown consumer " + std::string(consumerId));
  }

  if (const auto err = post(ProducerRequest{std::string(consumerId)}, stop, outError); err != CoordError::None) {
    return err;
  }

  auto producer = box->receive(stop);
  if (!producer) {
    const auto err = interrupted(stop, outError, std::string(consumerId) + " waiting for a producer");
    // The request is already queued; without this the loop would later pair
    // a producer with a consumer that left.
    if (err == CoordError::WaitCancelled && !m_events.trySend(RequestWithdrawn{std::string(consumerId)}) &&
        !m_shutdown.load()) {
      STEVEDORE_LOG_WARN("Could not withdraw the producer request of " + std::string(consumerId) +
                         " (event queue full)");
    }
    return err;
  }
  outProducerId = std::move(*producer);
  return CoordError::None;
}

CoordError ChannelAssignmentHub::signalAvailability(std::string_view producerId,
                                                    int supplyLevel,
                                                    std::stop_token stop,
                                                    std::string* outError) {
  Mailbox* box = find(m_cargoReceived, producerId);
  if (!box) {
    return fail(CoordError::UnknownWorker, outError, "unknown producer " + std::string(producerId));
  }
  if (supplyLevel < 0) {
    return fail(CoordError::InvalidArgument, outError, "supply level cannot be negative");
  }

  if (const auto err = post(ProducerAvailable{std::string(producerId), supplyLevel}, stop, outError);
      err != CoordError::None) {
    return err;
  }

  const auto from = box->receive(stop);
  if (!from) {
    return interrupted(stop, outError, std::string(producerId) + " waiting for cargo");
  }
  STEVEDORE_LOG_DEBUG(std::string(producerId) + " received cargo from " + *from);
  return CoordError::None;
}

CoordError ChannelAssignmentHub::notifyTransferComplete(std::string_view consumerId,
                                                        std::string_view producerId,
                                                        std::stop_token stop,
                                                        std::string* outError) {
  if (!isConsumer(consumerId)) {
    return fail(CoordError::UnknownWorker, outError, "unknown consumer " + std::string(consumerId));
  }
  if (!isProducer(producerId)) {
    return fail(CoordError::UnknownWorker, outError, "unknown producer " + std::string(producerId));
  }
  return post(TransferCompleted{std::string(consumerId), std::string(producerId)}, stop, outError);
}

void ChannelAssignmentHub::shutdown() {
  if (m_shutdown.exchange(true)) return;

  m_events.close();
  for (auto& [id, box] : m_assignments) box->close();
  for (auto& [id, box] : m_cargoReceived) box->close();
  STEVEDORE_LOG_DEBUG("Assignment hub shut down");
}

std::optional<AssignmentEvent> ChannelAssignmentHub::nextEvent(std::stop_token stop) {
  return m_events.receive(stop);
}

bool ChannelAssignmentHub::deliverAssignment(const std::string& consumerId, const std::string& producerId) {
  Mailbox* box = find(m_assignments, consumerId);
  return box && box->trySend(producerId);
}

bool ChannelAssignmentHub::deliverCargoReceived(const std::string& producerId, const std::string& consumerId) {
  Mailbox* box = find(m_cargoReceived, producerId);
  return box && box->trySend(consumerId);
}

std::optional<std::string> ChannelAssignmentHub::reclaimAssignment(const std::string& consumerId) {
  Mailbox* box = find(m_assignments, consumerId);
  if (!box) return std::nullopt;
  return box->tryReceive();
}

} // namespace stevedore::fleet
