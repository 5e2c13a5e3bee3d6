#include "stevedore/cargo/ResourceLedger.h"

#include <algorithm>
#include <sstream>

namespace stevedore::cargo {

using core::CoordError;
using core::fail;

namespace {

CoordError checkUnits(std::string_view what, int units, std::string* outError) {
  if (units <= 0) {
    return fail(CoordError::InvalidArgument, outError,
                std::string(what) + " units must be positive (got " + std::to_string(units) + ")");
  }
  return CoordError::None;
}

CoordError checkGood(std::string_view good, std::string* outError) {
  if (good.empty()) {
    return fail(CoordError::InvalidArgument, outError, "good symbol cannot be empty");
  }
  return CoordError::None;
}

int lookup(const Inventory& map, const std::string& good) {
  const auto it = map.find(good);
  return it == map.end() ? 0 : it->second;
}

void subtractAndPrune(Inventory& map, const std::string& good, int units) {
  const auto it = map.find(good);
  if (it == map.end()) return;
  it->second -= units;
  if (it->second <= 0) map.erase(it);
}

} // namespace

std::unique_ptr<ResourceLedger> ResourceLedger::create(std::string symbol,
                                                       std::string locationSymbol,
                                                       std::string operationId,
                                                       int capacity,
                                                       const Inventory& initialCargo,
                                                       std::string* outError) {
  if (symbol.empty()) {
    fail(CoordError::InvalidArgument, outError, "resource symbol cannot be empty");
    return nullptr;
  }
  if (locationSymbol.empty()) {
    fail(CoordError::InvalidArgument, outError, "location symbol cannot be empty");
    return nullptr;
  }
  if (operationId.empty()) {
    fail(CoordError::InvalidArgument, outError, "operation id cannot be empty");
    return nullptr;
  }
  if (capacity < 0) {
    fail(CoordError::InvalidArgument, outError, "capacity cannot be negative");
    return nullptr;
  }

  Inventory inventory;
  int total = 0;
  for (const auto& [good, units] : initialCargo) {
    if (good.empty()) {
      fail(CoordError::InvalidArgument, outError, "initial cargo has an empty good symbol");
      return nullptr;
    }
    if (units < 0) {
      fail(CoordError::InvalidArgument, outError, "initial cargo for " + good + " cannot be negative");
      return nullptr;
    }
    if (units == 0) continue;
    // total <= capacity holds here, so the subtraction cannot overflow.
    if (units > capacity - total) {
      fail(CoordError::InvalidArgument, outError,
           "initial cargo for " + good + " (" + std::to_string(units) + ") exceeds remaining capacity (" +
               std::to_string(capacity - total) + " of " + std::to_string(capacity) + ")");
      return nullptr;
    }
    inventory[good] += units;
    total += units;
  }

  return std::make_unique<ResourceLedger>(Key{},
                                          std::move(symbol),
                                          std::move(locationSymbol),
                                          std::move(operationId),
                                          capacity,
                                          std::move(inventory));
}

ResourceLedger::ResourceLedger(Key, std::string symbol, std::string locationSymbol, std::string operationId,
                               int capacity, Inventory inventory)
    : m_symbol(std::move(symbol))
    , m_locationSymbol(std::move(locationSymbol))
    , m_operationId(std::move(operationId))
    , m_capacity(capacity)
    , m_inventory(std::move(inventory)) {}

int ResourceLedger::totalCargoLocked() const {
  int total = 0;
  for (const auto& [good, units] : m_inventory) total += units;
  return total;
}

int ResourceLedger::availableSpaceLocked() const {
  return m_capacity - totalCargoLocked() - m_reservedSpace;
}

int ResourceLedger::availableCargoLocked(const std::string& good) const {
  return std::max(0, lookup(m_inventory, good) - lookup(m_reservedCargo, good));
}

int ResourceLedger::availableSpace() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return availableSpaceLocked();
}

int ResourceLedger::availableCargo(std::string_view good) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return availableCargoLocked(std::string(good));
}

bool ResourceLedger::hasAvailableCargo(std::string_view good, int minUnits) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return availableCargoLocked(std::string(good)) >= minUnits;
}

int ResourceLedger::totalCargo() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return totalCargoLocked();
}

int ResourceLedger::cargoUnits(std::string_view good) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return lookup(m_inventory, std::string(good));
}

int ResourceLedger::reservedCargo(std::string_view good) const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return lookup(m_reservedCargo, std::string(good));
}

int ResourceLedger::reservedSpace() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_reservedSpace;
}

Inventory ResourceLedger::inventory() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_inventory;
}

std::vector<GoodSymbol> ResourceLedger::goods() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  std::vector<GoodSymbol> out;
  out.reserve(m_inventory.size());
  for (const auto& [good, units] : m_inventory) out.push_back(good);
  std::sort(out.begin(), out.end());
  return out;
}

CoordError ResourceLedger::reserveSpace(int units, std::string* outError) {
  if (auto err = checkUnits("reserve", units, outError); err != CoordError::None) return err;

  std::lock_guard<std::mutex> lock(m_mutex);
  const int space = availableSpaceLocked();
  if (units > space) {
    return fail(CoordError::InsufficientSpace, outError,
                m_symbol + ": insufficient space: need " + std::to_string(units) +
                ", have " + std::to_string(space));
  }
  m_reservedSpace += units;
  return CoordError::None;
}

void ResourceLedger::releaseReservedSpace(int units) {
  if (units <= 0) return;

  std::lock_guard<std::mutex> lock(m_mutex);
  m_reservedSpace = std::max(0, m_reservedSpace - units);
}

CoordError ResourceLedger::confirmDeposit(std::string_view good, int units, std::string* outError) {
  if (auto err = checkUnits("deposit", units, outError); err != CoordError::None) return err;
  if (auto err = checkGood(good, outError); err != CoordError::None) return err;

  std::lock_guard<std::mutex> lock(m_mutex);

  // Units beyond the outstanding reservation are an unreserved deposit and
  // must fit into the free space like one.
  const int covered = std::min(units, m_reservedSpace);
  const int uncovered = units - covered;
  if (uncovered > 0 && uncovered > availableSpaceLocked()) {
    return fail(CoordError::InsufficientSpace, outError,
                m_symbol + ": confirmed deposit of " + std::to_string(units) + " exceeds reservation (" +
                std::to_string(m_reservedSpace) + ") and free space (" +
                std::to_string(availableSpaceLocked()) + ")");
  }

  m_reservedSpace -= covered;
  m_inventory[std::string(good)] += units;
  return CoordError::None;
}

CoordError ResourceLedger::depositCargo(std::string_view good, int units, std::string* outError) {
  if (auto err = checkUnits("deposit", units, outError); err != CoordError::None) return err;
  if (auto err = checkGood(good, outError); err != CoordError::None) return err;

  std::lock_guard<std::mutex> lock(m_mutex);
  const int space = availableSpaceLocked();
  if (units > space) {
    return fail(CoordError::InsufficientSpace, outError,
                m_symbol + ": insufficient space: need " + std::to_string(units) +
                ", have " + std::to_string(space));
  }
  m_inventory[std::string(good)] += units;
  return CoordError::None;
}

CoordError ResourceLedger::tryReserveCargo(std::string_view good, int minUnits, int& outReserved,
                                           std::string* outError) {
  outReserved = 0;
  if (auto err = checkUnits("min", minUnits, outError); err != CoordError::None) return err;
  if (auto err = checkGood(good, outError); err != CoordError::None) return err;

  const std::string key(good);
  std::lock_guard<std::mutex> lock(m_mutex);
  const int available = availableCargoLocked(key);
  if (available < minUnits) {
    return CoordError::None;
  }

  m_reservedCargo[key] += available;
  outReserved = available;
  return CoordError::None;
}

CoordError ResourceLedger::reserveCargo(std::string_view good, int units, std::string* outError) {
  if (auto err = checkUnits("reserve", units, outError); err != CoordError::None) return err;
  if (auto err = checkGood(good, outError); err != CoordError::None) return err;

  const std::string key(good);
  std::lock_guard<std::mutex> lock(m_mutex);
  const int available = availableCargoLocked(key);
  if (available < units) {
    return fail(CoordError::InsufficientCargo, outError,
                m_symbol + ": insufficient cargo: need " + std::to_string(units) + " " + key +
                ", have " + std::to_string(available) + " available");
  }
  m_reservedCargo[key] += units;
  return CoordError::None;
}

CoordError ResourceLedger::confirmWithdrawal(std::string_view good, int units, std::string* outError) {
  if (auto err = checkUnits("withdrawal", units, outError); err != CoordError::None) return err;
  if (auto err = checkGood(good, outError); err != CoordError::None) return err;

  const std::string key(good);
  std::lock_guard<std::mutex> lock(m_mutex);

  const int reserved = lookup(m_reservedCargo, key);
  if (reserved < units) {
    return fail(CoordError::InsufficientCargo, outError,
                m_symbol + ": cannot confirm withdrawal of " + std::to_string(units) + " " + key +
                ": only " + std::to_string(reserved) + " reserved");
  }
  const int held = lookup(m_inventory, key);
  if (held < units) {
    return fail(CoordError::InsufficientCargo, outError,
                m_symbol + ": cannot confirm withdrawal of " + std::to_string(units) + " " + key +
                ": only " + std::to_string(held) + " in inventory");
  }

  subtractAndPrune(m_reservedCargo, key, units);
  subtractAndPrune(m_inventory, key, units);
  return CoordError::None;
}

CoordError ResourceLedger::cancelReservation(std::string_view good, int units, std::string* outError) {
  if (auto err = checkUnits("cancel", units, outError); err != CoordError::None) return err;
  if (auto err = checkGood(good, outError); err != CoordError::None) return err;

  const std::string key(good);
  std::lock_guard<std::mutex> lock(m_mutex);

  const int reserved = lookup(m_reservedCargo, key);
  if (reserved < units) {
    return fail(CoordError::InsufficientCargo, outError,
                m_symbol + ": cannot cancel " + std::to_string(units) + " " + key +
                ": only " + std::to_string(reserved) + " reserved");
  }
  subtractAndPrune(m_reservedCargo, key, units);
  return CoordError::None;
}

CoordError ResourceLedger::jettisonCargo(std::string_view good, int units, std::string* outError) {
  if (auto err = checkUnits("jettison", units, outError); err != CoordError::None) return err;
  if (auto err = checkGood(good, outError); err != CoordError::None) return err;

  const std::string key(good);
  std::lock_guard<std::mutex> lock(m_mutex);

  const int unreserved = availableCargoLocked(key);
  if (unreserved < units) {
    return fail(CoordError::InsufficientCargo, outError,
                m_symbol + ": cannot jettison " + std::to_string(units) + " " + key + ": only " +
                std::to_string(unreserved) + " unreserved (" + std::to_string(lookup(m_inventory, key)) +
                " held)");
  }
  subtractAndPrune(m_inventory, key, units);
  return CoordError::None;
}

std::string ResourceLedger::describe() const {
  std::lock_guard<std::mutex> lock(m_mutex);

  int totalReserved = 0;
  for (const auto& [good, units] : m_reservedCargo) totalReserved += units;

  std::ostringstream oss;
  oss << "LEDGER[" << m_symbol << ", op=" << m_operationId
      << ", cargo=" << totalCargoLocked() << "/" << m_capacity
      << ", reservedCargo=" << totalReserved
      << ", reservedSpace=" << m_reservedSpace << "]";
  return oss.str();
}

} // namespace stevedore::cargo
