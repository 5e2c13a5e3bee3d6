#include "stevedore/nav/CandidateSearch.h"

#include "stevedore/core/Log.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <limits>
#include <sstream>
#include <thread>
#include <utility>
#include <vector>

namespace stevedore::nav {

using core::CoordError;
using core::fail;

namespace {

struct PairJob {
  const Location* site{nullptr};
  const Location* destination{nullptr};
  double distance{0.0};
};

static bool pairLess(const PairJob& a, const PairJob& b) {
  if (a.distance != b.distance) return a.distance < b.distance;
  if (a.site->symbol != b.site->symbol) return a.site->symbol < b.site->symbol;
  return a.destination->symbol < b.destination->symbol;
}

static bool candidateLess(const Candidate& a, const Candidate& b) {
  if (a.distance != b.distance) return a.distance < b.distance;
  if (a.site != b.site) return a.site < b.site;
  return a.destination < b.destination;
}

static void lowerTo(std::atomic<double>& bound, double value) {
  double cur = bound.load();
  while (value < cur && !bound.compare_exchange_weak(cur, value)) {
  }
}

struct Counters {
  std::atomic<std::size_t> prefiltered{0};
  std::atomic<std::size_t> evaluated{0};
  std::atomic<std::size_t> oracleFailures{0};
  std::atomic<std::size_t> skipped{0};
};

static std::string describe(const Candidate& c) {
  std::ostringstream oss;
  oss << c.site << " <-> " << c.destination << " (distance " << c.distance
      << ", round trip " << c.roundTripFuel << " fuel";
  if (c.evaluated) oss << ", " << c.roundTripSeconds << "s";
  oss << ")";
  return oss.str();
}

} // namespace

CandidateSearchPool::CandidateSearchPool(RoutingOracle& oracle, SearchParams params)
    : m_oracle(oracle), m_params(std::move(params)) {}

CoordError CandidateSearchPool::selectBestCandidate(std::string_view siteTrait,
                                                    const ShipProfile& ship,
                                                    std::span<const Location> locations,
                                                    CandidateSelection& out,
                                                    std::stop_token stop,
                                                    std::string* outError) const {
  out = CandidateSelection{};

  if (siteTrait.empty()) {
    return fail(CoordError::InvalidArgument, outError, "site trait cannot be empty");
  }
  if (ship.fuelCapacity <= 0) {
    return fail(CoordError::InvalidArgument, outError, "ship fuel capacity must be positive");
  }

  std::vector<const Location*> sites;
  std::vector<const Location*> destinations;
  for (const auto& loc : locations) {
    if (loc.hasTrait(siteTrait)) sites.push_back(&loc);
    if (loc.hasTrait(m_params.destinationTrait)) destinations.push_back(&loc);
  }
  out.stats.sites = sites.size();
  out.stats.destinations = destinations.size();

  if (sites.empty()) {
    return fail(CoordError::NoFeasibleCandidate, outError,
                "no location carries site trait " + std::string(siteTrait));
  }
  if (destinations.empty()) {
    return fail(CoordError::NoFeasibleCandidate, outError,
                "no location carries destination trait " + m_params.destinationTrait);
  }

  // Each site only competes with its closest destinations.
  const std::size_t perSite = std::max<std::size_t>(1, m_params.destinationsPerSite);
  std::vector<PairJob> pairs;
  pairs.reserve(sites.size() * std::min(perSite, destinations.size()));
  for (const Location* site : sites) {
    std::vector<PairJob> nearest;
    nearest.reserve(destinations.size());
    for (const Location* dest : destinations) {
      nearest.push_back(PairJob{site, dest, math::distance(site->pos, dest->pos)});
    }
    std::sort(nearest.begin(), nearest.end(), pairLess);
    if (nearest.size() > perSite) nearest.resize(perSite);
    pairs.insert(pairs.end(), nearest.begin(), nearest.end());
  }
  std::sort(pairs.begin(), pairs.end(), pairLess);
  out.stats.pairs = pairs.size();

  STEVEDORE_LOG_INFO("Candidate search: " + std::to_string(sites.size()) + " sites (" + std::string(siteTrait) +
                     "), " + std::to_string(pairs.size()) + " pairs, fuel capacity " +
                     std::to_string(ship.fuelCapacity));

  const int capacity = ship.fuelCapacity;
  const std::size_t workerCount = std::clamp<std::size_t>(m_params.workerCount, 1, pairs.size());

  std::atomic<std::size_t> cursor{0};
  std::atomic<double> bestFeasible{std::numeric_limits<double>::infinity()};
  Counters counters;
  std::vector<std::vector<Candidate>> results(workerCount);

  auto evaluate = [&](std::size_t worker) {
    auto& mine = results[worker];
    while (!stop.stop_requested()) {
      const std::size_t i = cursor.fetch_add(1);
      if (i >= pairs.size()) return;
      const PairJob& job = pairs[i];

      if (job.distance > bestFeasible.load()) {
        ++counters.skipped;
        continue;
      }

      Candidate c;
      c.site = job.site->symbol;
      c.destination = job.destination->symbol;
      c.distance = job.distance;

      const double estimate = 2.0 * job.distance * m_params.prefilterFuelPerDistance;
      if (estimate > (double)capacity) {
        c.roundTripFuel = (int)std::ceil(estimate);
        ++counters.prefiltered;
        mine.push_back(std::move(c));
        continue;
      }

      // Haulers shuttle destination -> site -> destination on a full tank.
      RouteRequest req;
      req.start = c.destination;
      req.goal = c.site;
      req.currentFuel = capacity;
      req.fuelCapacity = capacity;
      req.engineSpeed = ship.engineSpeed;
      req.locations = locations;

      RoutePlan outbound;
      RoutePlan inbound;
      std::string err;
      bool ok = m_oracle.planRoute(req, outbound, &err);
      if (ok) {
        std::swap(req.start, req.goal);
        ok = m_oracle.planRoute(req, inbound, &err);
      }
      if (!ok) {
        ++counters.oracleFailures;
        STEVEDORE_LOG_DEBUG("Pair " + c.site + " <-> " + c.destination + " dropped: " + err);
        continue;
      }

      ++counters.evaluated;
      c.evaluated = true;
      c.roundTripFuel = outbound.totalFuel + inbound.totalFuel;
      c.roundTripSeconds = outbound.totalSeconds + inbound.totalSeconds;
      c.feasible = c.roundTripFuel <= capacity;
      if (c.feasible) lowerTo(bestFeasible, c.distance);
      mine.push_back(std::move(c));
    }
  };

  {
    std::vector<std::jthread> workers;
    workers.reserve(workerCount);
    for (std::size_t w = 0; w < workerCount; ++w) workers.emplace_back(evaluate, w);
  }

  out.stats.prefiltered = counters.prefiltered.load();
  out.stats.evaluated = counters.evaluated.load();
  out.stats.oracleFailures = counters.oracleFailures.load();
  out.stats.skipped = counters.skipped.load();

  // Every taken pair runs to completion, so a stop after the last one was
  // taken leaves a full result.
  if (stop.stop_requested() && cursor.load() < pairs.size()) {
    const std::size_t taken = cursor.load();
    out.stats.skipped += pairs.size() - taken;
    return fail(CoordError::WaitCancelled, outError,
                "candidate search cancelled after " + std::to_string(taken) + " of " +
                std::to_string(pairs.size()) + " pairs");
  }

  const Candidate* best = nullptr;
  const Candidate* leastInfeasible = nullptr;
  for (const auto& bucket : results) {
    for (const auto& c : bucket) {
      if (c.feasible) {
        ++out.stats.feasible;
        if (!best || candidateLess(c, *best)) best = &c;
        continue;
      }
      if (!leastInfeasible || c.roundTripFuel < leastInfeasible->roundTripFuel ||
          (c.roundTripFuel == leastInfeasible->roundTripFuel && candidateLess(c, *leastInfeasible))) {
        leastInfeasible = &c;
      }
    }
  }

  if (best) {
    out.best = *best;
    STEVEDORE_LOG_INFO("Selected " + describe(out.best) + "; " + std::to_string(out.stats.feasible) +
                       " feasible, " + std::to_string(out.stats.skipped) + " skipped");
    return CoordError::None;
  }

  if (m_params.allowInfeasible && leastInfeasible) {
    out.best = *leastInfeasible;
    STEVEDORE_LOG_WARN("No pair fits a " + std::to_string(capacity) + " fuel round trip; proceeding with " +
                       describe(out.best));
    return CoordError::None;
  }

  return fail(CoordError::NoFeasibleCandidate, outError,
              "no pair fits a round trip within " + std::to_string(capacity) + " fuel (" +
              std::to_string(out.stats.evaluated) + " evaluated, " + std::to_string(out.stats.prefiltered) +
              " pre-filtered, " + std::to_string(out.stats.oracleFailures) + " unroutable)");
}

const Location* closestDestinationWithFuel(std::string_view site,
                                           std::span<const Location> locations,
                                           std::string_view destinationTrait,
                                           std::string* outError) {
  const Location* from = findLocation(locations, site);
  if (!from) {
    if (outError) *outError = "unknown site " + std::string(site);
    return nullptr;
  }

  const Location* best = nullptr;
  double bestDist = 0.0;
  for (const auto& loc : locations) {
    if (!loc.hasFuel || !loc.hasTrait(destinationTrait)) continue;
    const double d = math::distance(from->pos, loc.pos);
    if (!best || d < bestDist || (d == bestDist && loc.symbol < best->symbol)) {
      best = &loc;
      bestDist = d;
    }
  }

  if (!best && outError) {
    *outError = "no " + std::string(destinationTrait) + " with fuel near " + std::string(site);
  }
  return best;
}

} // namespace stevedore::nav
