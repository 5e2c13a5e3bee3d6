#pragma once

#include "stevedore/core/Error.h"
#include "stevedore/nav/Location.h"
#include "stevedore/nav/RoutingOracle.h"

#include <cstddef>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>

namespace stevedore::nav {

// One (site, destination) pairing as judged by the search.
struct Candidate {
  std::string site;
  std::string destination;
  double distance{0.0};   // straight line site <-> destination

  bool feasible{false};
  bool evaluated{false};  // oracle consulted; round-trip figures are exact
  int roundTripFuel{0};   // exact when evaluated, pre-filter estimate otherwise
  int roundTripSeconds{0};
};

struct SearchParams {
  std::size_t workerCount{15};
  std::size_t destinationsPerSite{5};
  std::string destinationTrait{"MARKETPLACE"};

  // Fuel per distance unit of the least efficient flight mode a hauler would
  // still use. Pairs whose 2 * distance * factor exceeds the tank are dropped
  // without asking the oracle.
  double prefilterFuelPerDistance{1.0};

  // Return the least-infeasible pair instead of failing (logged as a warning).
  bool allowInfeasible{false};
};

struct SearchStats {
  std::size_t sites{0};
  std::size_t destinations{0};
  std::size_t pairs{0};
  std::size_t prefiltered{0};    // infeasible by estimate, oracle not called
  std::size_t evaluated{0};      // both legs planned
  std::size_t oracleFailures{0}; // pair dropped
  std::size_t skipped{0};        // beaten by a closer feasible pair, or stopped
  std::size_t feasible{0};
};

struct CandidateSelection {
  Candidate best;
  SearchStats stats;
};

// Bounded pool of evaluator threads choosing where an operation should work.
//
// Pairs are restricted to each site's closest destinations, sorted by
// distance, and evaluated nearest first. The winner is the feasible pair with
// the smallest distance (ties: site, then destination symbol), so once one is
// known every farther pair is skipped unevaluated.
class CandidateSearchPool {
public:
  explicit CandidateSearchPool(RoutingOracle& oracle, SearchParams params = {});

  // Errors: InvalidArgument (bad ship profile), NoFeasibleCandidate,
  // WaitCancelled (stop fired before every pair was taken).
  core::CoordError selectBestCandidate(std::string_view siteTrait,
                                       const ShipProfile& ship,
                                       std::span<const Location> locations,
                                       CandidateSelection& out,
                                       std::stop_token stop = {},
                                       std::string* outError = nullptr) const;

  const SearchParams& params() const { return m_params; }

private:
  RoutingOracle& m_oracle;
  SearchParams m_params;
};

// Destination for a site the user picked by hand: the nearest location
// carrying `destinationTrait` that also sells fuel. nullptr (with *outError)
// when the site is unknown or nothing qualifies.
const Location* closestDestinationWithFuel(std::string_view site,
                                           std::span<const Location> locations,
                                           std::string_view destinationTrait = "MARKETPLACE",
                                           std::string* outError = nullptr);

} // namespace stevedore::nav
