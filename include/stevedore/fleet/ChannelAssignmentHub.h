#pragma once

#include "stevedore/core/Channel.h"
#include "stevedore/fleet/AssignmentChannel.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stevedore::fleet {

// AssignmentChannel built on bounded channels: one shared event queue read by
// the WorkAssignmentLoop, plus a one-slot mailbox per consumer (its assigned
// producer) and per producer (the consumer that unloaded into it).
//
// Participants are fixed at construction; any other id is UnknownWorker.
class ChannelAssignmentHub final : public AssignmentChannel {
public:
  ChannelAssignmentHub(const std::vector<std::string>& consumerIds,
                       const std::vector<std::string>& producerIds,
                       std::size_t eventBuffer = 64);
  ~ChannelAssignmentHub() override;

  ChannelAssignmentHub(const ChannelAssignmentHub&) = delete;
  ChannelAssignmentHub& operator=(const ChannelAssignmentHub&) = delete;

  core::CoordError requestProducer(std::string_view consumerId,
                                   std::string& outProducerId,
                                   std::stop_token stop = {},
                                   std::string* outError = nullptr) override;

  core::CoordError signalAvailability(std::string_view producerId,
                                      int supplyLevel,
                                      std::stop_token stop = {},
                                      std::string* outError = nullptr) override;

  core::CoordError notifyTransferComplete(std::string_view consumerId,
                                          std::string_view producerId,
                                          std::stop_token stop = {},
                                          std::string* outError = nullptr) override;

  void shutdown() override;
  bool isShutDown() const { return m_shutdown.load(); }

  bool isConsumer(std::string_view id) const;
  bool isProducer(std::string_view id) const;

  // Loop side.

  // nullopt once stopped, or shut down and drained.
  std::optional<AssignmentEvent> nextEvent(std::stop_token stop);

  // Never block: false when the mailbox is full or closed.
  bool deliverAssignment(const std::string& consumerId, const std::string& producerId);
  bool deliverCargoReceived(const std::string& producerId, const std::string& consumerId);

  // Takes back an assignment its consumer never picked up.
  std::optional<std::string> reclaimAssignment(const std::string& consumerId);

private:
  using Mailbox = core::Channel<std::string>;
  using MailboxMap = std::unordered_map<std::string, std::unique_ptr<Mailbox>>;

  static Mailbox* find(const MailboxMap& map, std::string_view id);

  core::CoordError post(AssignmentEvent event, std::stop_token stop, std::string* outError);
  core::CoordError interrupted(const std::stop_token& stop, std::string* outError, std::string_view what) const;

  core::Channel<AssignmentEvent> m_events;
  MailboxMap m_assignments;   // per consumer; fixed after construction
  MailboxMap m_cargoReceived; // per producer; fixed after construction
  std::atomic<bool> m_shutdown{false};
};

} // namespace stevedore::fleet
