#pragma once

#include "stevedore/core/Error.h"

#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

namespace stevedore::fleet {

// Messages workers post to an operation's assignment loop.
struct ProducerRequest {
  std::string consumerId;
};

struct ProducerAvailable {
  std::string producerId;
  int supplyLevel{0}; // units the producer already carries
};

struct TransferCompleted {
  std::string consumerId;
  std::string producerId;
};

// The consumer stopped waiting after its ProducerRequest was posted.
struct RequestWithdrawn {
  std::string consumerId;
};

using AssignmentEvent = std::variant<ProducerRequest, ProducerAvailable, TransferCompleted, RequestWithdrawn>;

// Worker-facing side of an operation's producer/consumer pairing.
//
// Consumers (extractors with a full hold) ask for a producer (a hauler) to
// unload into; producers announce that they are parked and how much they
// already carry, then wait until a consumer has finished handing cargo over.
//
// Every blocking call returns WaitCancelled when `stop` fires and ShutDown
// once shutdown() ran; neither is a failure of the worker.
class AssignmentChannel {
public:
  virtual ~AssignmentChannel() = default;

  // Blocks until a producer is assigned to `consumerId`.
  virtual core::CoordError requestProducer(std::string_view consumerId,
                                           std::string& outProducerId,
                                           std::stop_token stop = {},
                                           std::string* outError = nullptr) = 0;

  // Blocks until a consumer reported a completed transfer into `producerId`.
  virtual core::CoordError signalAvailability(std::string_view producerId,
                                              int supplyLevel,
                                              std::stop_token stop = {},
                                              std::string* outError = nullptr) = 0;

  virtual core::CoordError notifyTransferComplete(std::string_view consumerId,
                                                  std::string_view producerId,
                                                  std::stop_token stop = {},
                                                  std::string* outError = nullptr) = 0;

  // Idempotent. Wakes every blocked worker with ShutDown.
  virtual void shutdown() = 0;
};

} // namespace stevedore::fleet
