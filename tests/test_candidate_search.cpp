#include "stevedore/nav/CandidateSearch.h"
#include "stevedore/nav/RoutingOracle.h"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace stevedore;
using core::CoordError;

namespace {

static nav::Location loc(const char* symbol, double x, double y, std::vector<std::string> traits, bool fuel = false) {
  nav::Location l;
  l.symbol = symbol;
  l.pos = math::Vec2d{x, y};
  l.hasFuel = fuel;
  l.traits = std::move(traits);
  return l;
}

// Round-trip fuel per site, split evenly over the two legs.
class ScriptedOracle final : public nav::RoutingOracle {
public:
  std::map<std::string, int> roundTrip;
  std::set<std::string> unroutable;
  std::atomic<int> calls{0};
  std::stop_source* stopOnCall = nullptr; // fired from inside the oracle

  bool planRoute(const nav::RouteRequest& req, nav::RoutePlan& out, std::string* outError) override {
    ++calls;
    if (stopOnCall) stopOnCall->request_stop();
    out = nav::RoutePlan{};
    const std::string site = roundTrip.count(req.start) ? req.start : req.goal;
    if (unroutable.count(site)) {
      if (outError) *outError = "no path to " + site;
      return false;
    }
    const auto it = roundTrip.find(site);
    if (it == roundTrip.end()) {
      if (outError) *outError = "unscripted pair " + req.start + " -> " + req.goal;
      return false;
    }
    out.totalFuel = it->second / 2;
    out.totalSeconds = 100;
    out.steps.push_back(nav::RouteStep{nav::RouteAction::Travel, req.goal, out.totalFuel, 100});
    return true;
  }
};

static std::vector<nav::Location> threeSites() {
  return {
    loc("D1", 0, 0, {"MARKETPLACE"}, true),
    loc("S1", 10, 0, {"ICE_CRYSTALS"}),
    loc("S2", 20, 0, {"ICE_CRYSTALS"}),
    loc("S3", 30, 0, {"ICE_CRYSTALS"}),
  };
}

} // namespace

int test_candidate_search() {
  int fails = 0;

  nav::ShipProfile hauler;
  hauler.fuelCapacity = 200;
  hauler.engineSpeed = 30;

  // Only S2 fits the tank; it wins no matter how the input is ordered or how
  // many evaluators run.
  {
    ScriptedOracle oracle;
    oracle.roundTrip = {{"S1", 300}, {"S2", 80}, {"S3", 250}};

    auto locations = threeSites();
    std::sort(locations.begin(), locations.end(),
              [](const nav::Location& a, const nav::Location& b) { return a.symbol < b.symbol; });

    for (const std::size_t workers : {std::size_t{1}, std::size_t{2}, std::size_t{15}}) {
      int permutation = 0;
      do {
        nav::SearchParams params;
        params.workerCount = workers;
        nav::CandidateSearchPool pool(oracle, params);

        nav::CandidateSelection sel;
        std::string err;
        const auto e = pool.selectBestCandidate("ICE_CRYSTALS", hauler, locations, sel, {}, &err);
        if (e != CoordError::None || sel.best.site != "S2" || sel.best.destination != "D1" || !sel.best.feasible ||
            sel.best.roundTripFuel != 80) {
          std::cerr << "[test_candidate_search] workers=" << workers << " perm=" << permutation
                    << ": expected S2 <-> D1, got " << sel.best.site << " (" << err << ")\n";
          ++fails;
          break;
        }
        if (sel.stats.pairs != 3 || sel.stats.feasible != 1) {
          std::cerr << "[test_candidate_search] expected 3 pairs / 1 feasible\n";
          ++fails;
        }
        ++permutation;
      } while (std::next_permutation(locations.begin(), locations.end(),
                                     [](const nav::Location& a, const nav::Location& b) { return a.symbol < b.symbol; }));
    }
  }

  // Nearest feasible pair wins; ties fall to the site symbol.
  {
    ScriptedOracle oracle;
    oracle.roundTrip = {{"SA", 40}, {"SB", 40}, {"SC", 20}};
    const std::vector<nav::Location> locations = {
      loc("D1", 0, 0, {"MARKETPLACE"}, true),
      loc("SB", 0, 10, {"ICE_CRYSTALS"}),
      loc("SA", 10, 0, {"ICE_CRYSTALS"}),
      loc("SC", 50, 0, {"ICE_CRYSTALS"}),
    };
    nav::CandidateSearchPool pool(oracle);
    nav::CandidateSelection sel;
    if (pool.selectBestCandidate("ICE_CRYSTALS", hauler, locations, sel) != CoordError::None ||
        sel.best.site != "SA") {
      std::cerr << "[test_candidate_search] equal-distance tie should go to SA, got " << sel.best.site << "\n";
      ++fails;
    }
  }

  // Pairs the estimate already rules out never reach the oracle.
  {
    ScriptedOracle oracle;
    oracle.roundTrip = {{"NEAR", 40}, {"FAR", 40}};
    const std::vector<nav::Location> locations = {
      loc("D1", 0, 0, {"MARKETPLACE"}, true),
      loc("NEAR", 20, 0, {"ICE_CRYSTALS"}),
      loc("FAR", 150, 0, {"ICE_CRYSTALS"}),
    };
    nav::SearchParams params;
    params.workerCount = 1;
    nav::CandidateSearchPool pool(oracle, params);
    nav::CandidateSelection sel;
    if (pool.selectBestCandidate("ICE_CRYSTALS", hauler, locations, sel) != CoordError::None ||
        sel.best.site != "NEAR") {
      std::cerr << "[test_candidate_search] expected NEAR\n";
      ++fails;
    }
    // One evaluator, nearest first: NEAR takes 2 calls, FAR is skipped.
    if (oracle.calls.load() != 2 || sel.stats.evaluated != 1 || sel.stats.skipped + sel.stats.prefiltered != 1) {
      std::cerr << "[test_candidate_search] oracle calls=" << oracle.calls.load()
                << " evaluated=" << sel.stats.evaluated << "\n";
      ++fails;
    }

    ScriptedOracle far;
    far.roundTrip = {{"FAR", 40}};
    const std::vector<nav::Location> onlyFar = {locations[0], locations[2]};
    nav::CandidateSearchPool farPool(far, params);
    if (farPool.selectBestCandidate("ICE_CRYSTALS", hauler, onlyFar, sel) != CoordError::NoFeasibleCandidate ||
        far.calls.load() != 0 || sel.stats.prefiltered != 1) {
      std::cerr << "[test_candidate_search] 300 > 200 should be pre-filtered without oracle calls\n";
      ++fails;
    }
  }

  // A failing oracle drops its pair only.
  {
    ScriptedOracle oracle;
    oracle.roundTrip = {{"S1", 10}, {"S2", 80}, {"S3", 250}};
    oracle.unroutable = {"S1"};
    auto locations = threeSites();
    nav::CandidateSearchPool pool(oracle);
    nav::CandidateSelection sel;
    if (pool.selectBestCandidate("ICE_CRYSTALS", hauler, locations, sel) != CoordError::None ||
        sel.best.site != "S2" || sel.stats.oracleFailures != 1) {
      std::cerr << "[test_candidate_search] unroutable S1 should be dropped, S2 chosen\n";
      ++fails;
    }
  }

  // Nothing fits: fail, or take the least-infeasible pair when forced.
  {
    ScriptedOracle oracle;
    oracle.roundTrip = {{"S1", 400}, {"S2", 230}, {"S3", 260}};
    auto locations = threeSites();

    nav::CandidateSearchPool strict(oracle);
    nav::CandidateSelection sel;
    std::string err;
    if (strict.selectBestCandidate("ICE_CRYSTALS", hauler, locations, sel, {}, &err) !=
            CoordError::NoFeasibleCandidate ||
        err.empty()) {
      std::cerr << "[test_candidate_search] expected NoFeasibleCandidate\n";
      ++fails;
    }

    nav::SearchParams params;
    params.allowInfeasible = true;
    nav::CandidateSearchPool forced(oracle, params);
    if (forced.selectBestCandidate("ICE_CRYSTALS", hauler, locations, sel) != CoordError::None ||
        sel.best.site != "S2" || sel.best.feasible) {
      std::cerr << "[test_candidate_search] forced search should return infeasible S2, got " << sel.best.site << "\n";
      ++fails;
    }
  }

  // Per-site destination cap.
  {
    ScriptedOracle oracle;
    oracle.roundTrip = {{"S1", 10}};
    std::vector<nav::Location> locations = {loc("S1", 0, 0, {"ICE_CRYSTALS"})};
    for (int i = 0; i < 8; ++i) {
      locations.push_back(loc(("D" + std::to_string(i)).c_str(), 5.0 + i, 0, {"MARKETPLACE"}, true));
    }
    nav::SearchParams params;
    params.destinationsPerSite = 5;
    nav::CandidateSearchPool pool(oracle, params);
    nav::CandidateSelection sel;
    if (pool.selectBestCandidate("ICE_CRYSTALS", hauler, locations, sel) != CoordError::None ||
        sel.stats.pairs != 5 || sel.best.destination != "D0") {
      std::cerr << "[test_candidate_search] expected 5 pairs with D0 best, got " << sel.stats.pairs << "\n";
      ++fails;
    }
  }

  // Bad input and cancellation.
  {
    ScriptedOracle oracle;
    oracle.roundTrip = {{"S1", 10}, {"S2", 10}, {"S3", 10}};
    auto locations = threeSites();
    nav::CandidateSearchPool pool(oracle);
    nav::CandidateSelection sel;

    if (pool.selectBestCandidate("", hauler, locations, sel) != CoordError::InvalidArgument) {
      std::cerr << "[test_candidate_search] empty trait should be InvalidArgument\n";
      ++fails;
    }
    nav::ShipProfile empty;
    if (pool.selectBestCandidate("ICE_CRYSTALS", empty, locations, sel) != CoordError::InvalidArgument) {
      std::cerr << "[test_candidate_search] zero fuel capacity should be InvalidArgument\n";
      ++fails;
    }
    if (pool.selectBestCandidate("EXPLOSIVE_GASES", hauler, locations, sel) != CoordError::NoFeasibleCandidate) {
      std::cerr << "[test_candidate_search] no matching site should be NoFeasibleCandidate\n";
      ++fails;
    }

    std::stop_source src;
    src.request_stop();
    if (pool.selectBestCandidate("ICE_CRYSTALS", hauler, locations, sel, src.get_token()) !=
            CoordError::WaitCancelled ||
        oracle.calls.load() != 0 || sel.stats.skipped != 3) {
      std::cerr << "[test_candidate_search] pre-stopped search should be WaitCancelled with no oracle calls\n";
      ++fails;
    }
  }

  // A stop that lands while the last pair is being evaluated keeps the result.
  {
    ScriptedOracle oracle;
    oracle.roundTrip = {{"S1", 40}};
    std::stop_source src;
    oracle.stopOnCall = &src;
    const std::vector<nav::Location> locations = {
      loc("D1", 0, 0, {"MARKETPLACE"}, true),
      loc("S1", 10, 0, {"ICE_CRYSTALS"}),
    };
    nav::CandidateSearchPool pool(oracle);
    nav::CandidateSelection sel;
    if (pool.selectBestCandidate("ICE_CRYSTALS", hauler, locations, sel, src.get_token()) != CoordError::None ||
        sel.best.site != "S1" || sel.stats.skipped != 0) {
      std::cerr << "[test_candidate_search] completed search should not be reported as cancelled\n";
      ++fails;
    }

    // With pairs left untouched it is still a cancellation.
    ScriptedOracle partial;
    partial.roundTrip = {{"S1", 40}, {"S2", 40}, {"S3", 40}};
    std::stop_source partialSrc;
    partial.stopOnCall = &partialSrc;
    auto sites = threeSites();
    nav::SearchParams single;
    single.workerCount = 1;
    nav::CandidateSearchPool serial(partial, single);
    if (serial.selectBestCandidate("ICE_CRYSTALS", hauler, sites, sel, partialSrc.get_token()) !=
            CoordError::WaitCancelled ||
        sel.stats.skipped != 2) {
      std::cerr << "[test_candidate_search] search stopped with pairs left should be WaitCancelled\n";
      ++fails;
    }
  }

  // Straight-leg oracle.
  {
    nav::DirectRouteOracle oracle;
    const std::vector<nav::Location> locations = {
      loc("A", 0, 0, {}), loc("B", 6, 8, {}), loc("C", 300, 0, {}),
    };
    nav::RouteRequest req;
    req.start = "A";
    req.goal = "B";
    req.currentFuel = 50;
    req.fuelCapacity = 50;
    req.engineSpeed = 30;
    req.locations = locations;

    nav::RoutePlan plan;
    if (!oracle.planRoute(req, plan) || plan.totalFuel != 10 || plan.totalSeconds != 15 + 8 ||
        plan.steps.size() != 1 || plan.steps[0].location != "B") {
      std::cerr << "[test_candidate_search] A -> B should cost 10 fuel / 23s, got " << plan.totalFuel << " / "
                << plan.totalSeconds << "\n";
      ++fails;
    }

    std::string err;
    req.goal = "C";
    if (oracle.planRoute(req, plan, &err) || err.empty()) {
      std::cerr << "[test_candidate_search] 300 distance on 50 fuel should fail\n";
      ++fails;
    }
    req.goal = "Z";
    if (oracle.planRoute(req, plan, &err)) {
      std::cerr << "[test_candidate_search] unknown goal should fail\n";
      ++fails;
    }
    req.goal = "A";
    if (!oracle.planRoute(req, plan) || !plan.steps.empty()) {
      std::cerr << "[test_candidate_search] same start and goal should be an empty plan\n";
      ++fails;
    }
  }

  // Hand-picked site: nearest fuel-selling destination.
  {
    const std::vector<nav::Location> locations = {
      loc("SITE", 0, 0, {"ICE_CRYSTALS"}),
      loc("DRY", 1, 0, {"MARKETPLACE"}, false),
      loc("M2", 0, 5, {"MARKETPLACE"}, true),
      loc("M1", 5, 0, {"MARKETPLACE"}, true),
      loc("M3", 9, 9, {"MARKETPLACE"}, true),
    };
    const nav::Location* d = nav::closestDestinationWithFuel("SITE", locations);
    if (!d || d->symbol != "M1") {
      std::cerr << "[test_candidate_search] expected M1 (tie on distance, skip DRY)\n";
      ++fails;
    }
    std::string err;
    if (nav::closestDestinationWithFuel("NOWHERE", locations, "MARKETPLACE", &err) || err.empty()) {
      std::cerr << "[test_candidate_search] unknown site should return nullptr\n";
      ++fails;
    }
  }

  {
    std::string trait;
    if (!nav::siteTraitForExtraction("ice", trait) || trait != "ICE_CRYSTALS" ||
        !nav::siteTraitForExtraction("gas", trait) || trait != "EXPLOSIVE_GASES" ||
        nav::siteTraitForExtraction("plasma", trait)) {
      std::cerr << "[test_candidate_search] extraction type mapping is off\n";
      ++fails;
    }
  }

  return fails;
}
