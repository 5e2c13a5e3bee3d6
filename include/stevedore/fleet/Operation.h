#pragma once

#include "stevedore/core/Error.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stevedore::fleet {

enum class OperationType {
  GasSiphon,
  Mining,
  Custom,
};

enum class OperationStatus {
  Pending,
  Running,
  Completed,
  Stopped,
  Failed,
};

std::string_view toString(OperationType type);   // "GAS_SIPHON", "MINING", "CUSTOM"
std::string_view toString(OperationStatus status); // "PENDING", "RUNNING", ...
bool parseOperationType(std::string_view text, OperationType& out);

struct OperationSpec {
  std::string id;
  std::string siteSymbol; // may stay empty until the candidate search picks one
  OperationType type{OperationType::Mining};
  std::vector<std::string> extractors;  // consumers on the assignment loop
  std::vector<std::string> storage;     // buffer hulls parked at the site
  std::vector<std::string> transports;  // producers on the assignment loop
  std::vector<std::string> supportedGoods;
};

// One extraction operation and its lifecycle.
//
//   PENDING --start--> RUNNING --complete--> COMPLETED
//      |                  |
//      +------stop/fail---+--> STOPPED / FAILED
//
// STOPPED and COMPLETED are final for stop() and fail(); resetForRestart()
// returns any state to PENDING. Not thread-safe: owned by one session.
class Operation {
  struct Key {
    explicit Key() = default;
  };

public:
  using Clock = std::chrono::steady_clock;

  // Requires an id, at least one extractor, at least one storage hull and at
  // least one supported good.
  static std::unique_ptr<Operation> create(OperationSpec spec, std::string* outError = nullptr);

  Operation(Key, OperationSpec spec) : m_spec(std::move(spec)) {}

  const std::string& id() const { return m_spec.id; }
  const std::string& siteSymbol() const { return m_spec.siteSymbol; }
  OperationType type() const { return m_spec.type; }
  const std::vector<std::string>& extractors() const { return m_spec.extractors; }
  const std::vector<std::string>& storage() const { return m_spec.storage; }
  const std::vector<std::string>& transports() const { return m_spec.transports; }
  const std::vector<std::string>& supportedGoods() const { return m_spec.supportedGoods; }
  bool supportsGood(std::string_view good) const;

  // Only while PENDING.
  core::CoordError assignSite(std::string siteSymbol, std::string* outError = nullptr);

  OperationStatus status() const { return m_status; }
  bool isPending() const { return m_status == OperationStatus::Pending; }
  bool isRunning() const { return m_status == OperationStatus::Running; }
  bool isFinished() const;
  const std::string& lastError() const { return m_lastError; }

  core::CoordError start(std::string* outError = nullptr);
  core::CoordError stop(std::string* outError = nullptr);
  core::CoordError complete(std::string* outError = nullptr);
  core::CoordError fail(std::string reason, std::string* outError = nullptr);
  void resetForRestart();

  // Zero until started; frozen once finished.
  Clock::duration runtime() const;

  // "OPERATION[op-1, type=MINING, status=RUNNING, site=X1-A1, extractors=3, storage=1, transports=2, goods=2]"
  std::string describe() const;

private:
  core::CoordError reject(std::string_view action, std::string* outError) const;
  void finish(OperationStatus status);

  OperationSpec m_spec;
  OperationStatus m_status{OperationStatus::Pending};
  std::string m_lastError;
  std::optional<Clock::time_point> m_startedAt;
  std::optional<Clock::time_point> m_stoppedAt;
};

} // namespace stevedore::fleet
