#include "stevedore/fleet/ChannelAssignmentHub.h"
#include "stevedore/fleet/WorkAssignmentLoop.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

using namespace stevedore;
using core::CoordError;
using namespace std::chrono_literals;

namespace {

static bool eventually(const std::function<bool()>& pred, std::chrono::milliseconds limit = 2000ms) {
  const auto until = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < until) {
    if (pred()) return true;
    std::this_thread::sleep_for(1ms);
  }
  return pred();
}

struct Producer {
  std::atomic<bool> released{false};
  CoordError error{CoordError::None};
};

} // namespace

int test_assignment_loop() {
  int fails = 0;

  // A queued consumer is paired the moment a producer shows up.
  {
    fleet::ChannelAssignmentHub hub({"M1", "M2"}, {"T1", "T2"});
    fleet::WorkAssignmentLoop loop(hub, "op1");
    std::jthread loopThread([&](std::stop_token st) { loop.run(st); });

    std::string assigned;
    CoordError requestErr = CoordError::None;
    std::jthread consumer([&] { requestErr = hub.requestProducer("M1", assigned); });
    if (!eventually([&] { return loop.stats().queuedConsumers == 1; })) {
      std::cerr << "[test_assignment_loop] M1 never queued\n";
      ++fails;
    }

    Producer t1;
    std::jthread producer([&] {
      t1.error = hub.signalAvailability("T1", 0);
      t1.released = true;
    });

    consumer.join();
    if (requestErr != CoordError::None || assigned != "T1") {
      std::cerr << "[test_assignment_loop] M1 should be paired with T1, got '" << assigned << "'\n";
      ++fails;
    }
    const auto s = loop.stats();
    if (s.queuedConsumers != 0 || s.idleProducers != 0 || s.pairings != 1) {
      std::cerr << "[test_assignment_loop] T1 should never sit idle\n";
      ++fails;
    }

    std::this_thread::sleep_for(10ms);
    if (t1.released) {
      std::cerr << "[test_assignment_loop] producer released before the transfer completed\n";
      ++fails;
    }
    if (hub.notifyTransferComplete("M1", "T1") != CoordError::None) ++fails;
    producer.join();
    if (t1.error != CoordError::None || loop.stats().transfers != 1) {
      std::cerr << "[test_assignment_loop] completion should release T1 and count one transfer\n";
      ++fails;
    }

    loopThread.request_stop();
    loopThread.join();
    if (!hub.isShutDown()) {
      std::cerr << "[test_assignment_loop] loop exit should shut the hub down\n";
      ++fails;
    }
  }

  // The fullest idle producer is chosen.
  {
    fleet::ChannelAssignmentHub hub({"M1"}, {"T1", "T2", "T3"});
    fleet::WorkAssignmentLoop loop(hub, "op1");

    std::vector<std::pair<std::string, std::string>> hooked;
    std::mutex hookedMutex;
    loop.setPairingHook([&](const std::string& c, const std::string& p) {
      std::lock_guard<std::mutex> lock(hookedMutex);
      hooked.emplace_back(c, p);
    });
    std::jthread loopThread([&](std::stop_token st) { loop.run(st); });

    Producer t1;
    Producer t2;
    Producer t3;
    std::jthread p2([&] {
      t2.error = hub.signalAvailability("T2", 5);
      t2.released = true;
    });
    if (!eventually([&] { return loop.stats().idleProducers == 1; })) ++fails;
    std::jthread p1([&] {
      t1.error = hub.signalAvailability("T1", 20);
      t1.released = true;
    });
    if (!eventually([&] { return loop.stats().idleProducers == 2; })) ++fails;
    std::jthread p3([&] {
      t3.error = hub.signalAvailability("T3", 20);
      t3.released = true;
    });
    if (!eventually([&] { return loop.stats().idleProducers == 3; })) {
      std::cerr << "[test_assignment_loop] producers never became idle\n";
      ++fails;
    }

    std::string assigned;
    if (hub.requestProducer("M1", assigned) != CoordError::None || assigned != "T1") {
      std::cerr << "[test_assignment_loop] expected T1 (supply 20, first in pool), got '" << assigned << "'\n";
      ++fails;
    }
    if (!eventually([&] {
          std::lock_guard<std::mutex> lock(hookedMutex);
          return hooked.size() == 1;
        })) {
      std::cerr << "[test_assignment_loop] pairing hook not called\n";
      ++fails;
    }

    if (hub.notifyTransferComplete("M1", "T1") != CoordError::None) ++fails;
    p1.join();

    // Second request: T3 (20) beats T2 (5).
    if (hub.requestProducer("M1", assigned) != CoordError::None || assigned != "T3") {
      std::cerr << "[test_assignment_loop] expected T3 next, got '" << assigned << "'\n";
      ++fails;
    }

    hub.shutdown();
    p2.join();
    p3.join();
    if (t1.error != CoordError::None || t2.error != CoordError::ShutDown || t3.error != CoordError::ShutDown) {
      std::cerr << "[test_assignment_loop] producers still blocked at shutdown should see ShutDown\n";
      ++fails;
    }
  }

  // A consumer that stops waiting leaves the queue; the next producer parks.
  {
    fleet::ChannelAssignmentHub hub({"C1"}, {"P1", "P2"});
    fleet::WorkAssignmentLoop loop(hub, "op1");
    std::jthread loopThread([&](std::stop_token st) { loop.run(st); });

    std::string assigned;
    std::stop_source src;
    CoordError first = CoordError::None;
    std::jthread consumer([&] { first = hub.requestProducer("C1", assigned, src.get_token()); });
    if (!eventually([&] { return loop.stats().queuedConsumers == 1; })) ++fails;
    src.request_stop();
    consumer.join();
    if (first != CoordError::WaitCancelled || !eventually([&] { return loop.stats().queuedConsumers == 0; })) {
      std::cerr << "[test_assignment_loop] cancelled C1 should leave the queue\n";
      ++fails;
    }

    Producer p1;
    std::jthread producer([&] { p1.error = hub.signalAvailability("P1", 3); });
    if (!eventually([&] { return loop.stats().idleProducers == 1; }) || loop.stats().pairings != 0) {
      std::cerr << "[test_assignment_loop] P1 should park instead of pairing with a departed consumer\n";
      ++fails;
    }

    hub.shutdown();
    producer.join();
  }

  // An assignment made before the withdrawal is taken back, and the consumer's
  // next request gets a fresh one.
  {
    fleet::ChannelAssignmentHub hub({"C1"}, {"P1", "P2"});
    fleet::WorkAssignmentLoop loop(hub, "op1");

    // Events queue up while the loop is not running: request, availability,
    // then the withdrawal.
    std::string assigned;
    std::stop_source src;
    std::jthread consumer([&] { (void)hub.requestProducer("C1", assigned, src.get_token()); });
    std::this_thread::sleep_for(10ms);
    Producer p1;
    std::jthread producer1([&] {
      p1.error = hub.signalAvailability("P1", 4);
      p1.released = true;
    });
    std::this_thread::sleep_for(10ms);
    src.request_stop();
    consumer.join();

    std::jthread loopThread([&](std::stop_token st) { loop.run(st); });
    if (!eventually([&] {
          const auto s = loop.stats();
          return s.idleProducers == 1 && s.queuedConsumers == 0;
        })) {
      std::cerr << "[test_assignment_loop] withdrawn assignment should return P1 to the pool\n";
      ++fails;
    }

    if (hub.requestProducer("C1", assigned) != CoordError::None || assigned != "P1") {
      std::cerr << "[test_assignment_loop] C1 should get P1 again, got '" << assigned << "'\n";
      ++fails;
    }

    Producer p2;
    std::jthread producer2([&] { p2.error = hub.signalAvailability("P2", 1); });
    if (!eventually([&] { return loop.stats().idleProducers == 1; })) {
      std::cerr << "[test_assignment_loop] P2 should stay idle, no request is outstanding\n";
      ++fails;
    }

    if (hub.notifyTransferComplete("C1", "P1") != CoordError::None) ++fails;
    producer1.join();
    if (p1.error != CoordError::None) ++fails;

    hub.shutdown();
    producer2.join();
  }

  // Bad ids, bad levels, cancellation and shutdown.
  {
    fleet::ChannelAssignmentHub hub({"M1"}, {"T1"});
    std::string assigned;
    std::string err;

    if (hub.requestProducer("T1", assigned, {}, &err) != CoordError::UnknownWorker || err.empty()) {
      std::cerr << "[test_assignment_loop] producer id used as consumer should be UnknownWorker\n";
      ++fails;
    }
    if (hub.signalAvailability("M1", 1) != CoordError::UnknownWorker ||
        hub.notifyTransferComplete("M1", "T9") != CoordError::UnknownWorker) {
      std::cerr << "[test_assignment_loop] unknown producer should be UnknownWorker\n";
      ++fails;
    }
    if (hub.signalAvailability("T1", -1) != CoordError::InvalidArgument) {
      std::cerr << "[test_assignment_loop] negative supply should be InvalidArgument\n";
      ++fails;
    }

    // No loop running: the request is posted and then waits for an answer.
    std::stop_source src;
    CoordError cancelled = CoordError::None;
    std::jthread consumer([&] { cancelled = hub.requestProducer("M1", assigned, src.get_token()); });
    std::this_thread::sleep_for(10ms);
    src.request_stop();
    consumer.join();
    if (cancelled != CoordError::WaitCancelled) {
      std::cerr << "[test_assignment_loop] stopped request should be WaitCancelled, got "
                << core::toString(cancelled) << "\n";
      ++fails;
    }

    hub.shutdown();
    hub.shutdown();
    if (hub.requestProducer("M1", assigned) != CoordError::ShutDown ||
        hub.notifyTransferComplete("M1", "T1") != CoordError::ShutDown) {
      std::cerr << "[test_assignment_loop] calls after shutdown should be ShutDown\n";
      ++fails;
    }
  }

  return fails;
}
