#pragma once

#include "stevedore/core/Error.h"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stevedore::cargo {

using GoodSymbol = std::string;
using Inventory = std::unordered_map<GoodSymbol, int>;

// Cargo accounting for one buffer resource (a storage hull parked at the
// extraction site, or a transport hull while it is loading).
//
// Thread-safe: every call takes the ledger's own mutex, so a slow transfer on
// one buffer never blocks another.
//
// Invariants (hold between any two calls):
//  - sum(inventory) <= capacity
//  - sum(inventory) + reservedSpace <= capacity
//  - reservedForWithdrawal[good] <= inventory[good]
class ResourceLedger {
  struct Key {
    explicit Key() = default;
  };

public:
  // Validates the identity and the externally observed initial cargo
  // (recovery after a restart). Returns nullptr and fills *outError on bad input.
  static std::unique_ptr<ResourceLedger> create(std::string symbol,
                                                std::string locationSymbol,
                                                std::string operationId,
                                                int capacity,
                                                const Inventory& initialCargo = {},
                                                std::string* outError = nullptr);

  // Only reachable through create().
  ResourceLedger(Key, std::string symbol, std::string locationSymbol, std::string operationId,
                 int capacity, Inventory inventory);
  ResourceLedger(const ResourceLedger&) = delete;
  ResourceLedger& operator=(const ResourceLedger&) = delete;

  const std::string& symbol() const { return m_symbol; }
  const std::string& locationSymbol() const { return m_locationSymbol; }
  const std::string& operationId() const { return m_operationId; }
  int capacity() const { return m_capacity; }

  // capacity - sum(inventory) - reservedSpace
  int availableSpace() const;

  // max(0, inventory[good] - reservedForWithdrawal[good])
  int availableCargo(std::string_view good) const;

  bool hasAvailableCargo(std::string_view good, int minUnits) const;

  int totalCargo() const;
  int cargoUnits(std::string_view good) const;
  int reservedCargo(std::string_view good) const;
  int reservedSpace() const;
  Inventory inventory() const;
  std::vector<GoodSymbol> goods() const;

  // Space side (deposits).
  core::CoordError reserveSpace(int units, std::string* outError = nullptr);
  void releaseReservedSpace(int units);
  core::CoordError confirmDeposit(std::string_view good, int units, std::string* outError = nullptr);
  core::CoordError depositCargo(std::string_view good, int units, std::string* outError = nullptr);

  // Cargo side (withdrawals).
  //
  // tryReserveCargo: 0 when fewer than minUnits are available (not an error).
  // Otherwise reserves *every* available unit of `good`, so a hauler loading a
  // mixed-cargo buffer drains the good in one trip instead of waiting for a
  // full hold of a single type.
  core::CoordError tryReserveCargo(std::string_view good, int minUnits, int& outReserved,
                                   std::string* outError = nullptr);
  core::CoordError reserveCargo(std::string_view good, int units, std::string* outError = nullptr);
  core::CoordError confirmWithdrawal(std::string_view good, int units, std::string* outError = nullptr);
  core::CoordError cancelReservation(std::string_view good, int units, std::string* outError = nullptr);

  // Discards low-value byproducts. Reservations are untouched, so only the
  // unreserved part of the stock can be jettisoned.
  core::CoordError jettisonCargo(std::string_view good, int units, std::string* outError = nullptr);

  // "LEDGER[STORE-1, op=op1, cargo=40/100, reservedCargo=10, reservedSpace=5]"
  std::string describe() const;

private:
  int totalCargoLocked() const;
  int availableSpaceLocked() const;
  int availableCargoLocked(const std::string& good) const;

  const std::string m_symbol;
  const std::string m_locationSymbol;
  const std::string m_operationId;
  const int m_capacity{0};

  mutable std::mutex m_mutex;
  Inventory m_inventory;
  Inventory m_reservedCargo;
  int m_reservedSpace{0};
};

} // namespace stevedore::cargo
