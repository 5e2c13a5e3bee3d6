#include "stevedore/fleet/Operation.h"

#include <algorithm>
#include <sstream>

namespace stevedore::fleet {

using core::CoordError;

std::string_view toString(OperationType type) {
  switch (type) {
    case OperationType::GasSiphon: return "GAS_SIPHON";
    case OperationType::Mining:    return "MINING";
    case OperationType::Custom:    return "CUSTOM";
  }
  return "UNKNOWN";
}

std::string_view toString(OperationStatus status) {
  switch (status) {
    case OperationStatus::Pending:   return "PENDING";
    case OperationStatus::Running:   return "RUNNING";
    case OperationStatus::Completed: return "COMPLETED";
    case OperationStatus::Stopped:   return "STOPPED";
    case OperationStatus::Failed:    return "FAILED";
  }
  return "UNKNOWN";
}

bool parseOperationType(std::string_view text, OperationType& out) {
  for (const auto t : {OperationType::GasSiphon, OperationType::Mining, OperationType::Custom}) {
    if (toString(t) == text) {
      out = t;
      return true;
    }
  }
  return false;
}

std::unique_ptr<Operation> Operation::create(OperationSpec spec, std::string* outError) {
  const auto reject = [outError](const char* msg) -> std::unique_ptr<Operation> {
    if (outError) *outError = msg;
    return nullptr;
  };

  if (spec.id.empty()) return reject("operation id cannot be empty");
  if (spec.extractors.empty()) return reject("operation needs at least one extractor");
  if (spec.storage.empty()) return reject("operation needs at least one storage hull");
  if (spec.supportedGoods.empty()) return reject("operation must name its supported goods");

  return std::make_unique<Operation>(Key{}, std::move(spec));
}

bool Operation::supportsGood(std::string_view good) const {
  const auto& goods = m_spec.supportedGoods;
  return std::find(goods.begin(), goods.end(), good) != goods.end();
}

CoordError Operation::assignSite(std::string siteSymbol, std::string* outError) {
  if (m_status != OperationStatus::Pending) return reject("assign a site to", outError);
  if (siteSymbol.empty()) {
    return core::fail(CoordError::InvalidArgument, outError, "site symbol cannot be empty");
  }
  m_spec.siteSymbol = std::move(siteSymbol);
  return CoordError::None;
}

bool Operation::isFinished() const {
  return m_status == OperationStatus::Completed ||
         m_status == OperationStatus::Stopped ||
         m_status == OperationStatus::Failed;
}

CoordError Operation::reject(std::string_view action, std::string* outError) const {
  return core::fail(CoordError::InvalidTransition, outError,
                    "cannot " + std::string(action) + " operation " + m_spec.id + " in " +
                    std::string(toString(m_status)) + " state");
}

void Operation::finish(OperationStatus status) {
  m_status = status;
  m_stoppedAt = Clock::now();
}

CoordError Operation::start(std::string* outError) {
  if (m_status != OperationStatus::Pending) return reject("start", outError);
  if (m_spec.siteSymbol.empty()) {
    return core::fail(CoordError::InvalidTransition, outError, "cannot start operation " + m_spec.id + " without a site");
  }
  m_status = OperationStatus::Running;
  m_startedAt = Clock::now();
  return CoordError::None;
}

CoordError Operation::stop(std::string* outError) {
  if (m_status == OperationStatus::Completed || m_status == OperationStatus::Stopped) {
    return reject("stop", outError);
  }
  finish(OperationStatus::Stopped);
  return CoordError::None;
}

CoordError Operation::complete(std::string* outError) {
  if (m_status != OperationStatus::Running) return reject("complete", outError);
  finish(OperationStatus::Completed);
  return CoordError::None;
}

CoordError Operation::fail(std::string reason, std::string* outError) {
  if (m_status == OperationStatus::Completed || m_status == OperationStatus::Stopped) {
    return reject("fail", outError);
  }
  m_lastError = std::move(reason);
  finish(OperationStatus::Failed);
  return CoordError::None;
}

void Operation::resetForRestart() {
  m_status = OperationStatus::Pending;
  m_lastError.clear();
  m_startedAt.reset();
  m_stoppedAt.reset();
}

Operation::Clock::duration Operation::runtime() const {
  if (!m_startedAt) return Clock::duration::zero();
  const auto end = m_stoppedAt ? *m_stoppedAt : Clock::now();
  return end - *m_startedAt;
}

std::string Operation::describe() const {
  std::ostringstream oss;
  oss << "OPERATION[" << m_spec.id << ", type=" << toString(m_spec.type) << ", status=" << toString(m_status)
      << ", site=" << (m_spec.siteSymbol.empty() ? "?" : m_spec.siteSymbol)
      << ", extractors=" << m_spec.extractors.size() << ", storage=" << m_spec.storage.size()
      << ", transports=" << m_spec.transports.size() << ", goods=" << m_spec.supportedGoods.size() << "]";
  return oss.str();
}

} // namespace stevedore::fleet
