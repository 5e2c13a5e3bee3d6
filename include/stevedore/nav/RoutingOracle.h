#pragma once

#include "stevedore/nav/Location.h"

#include <span>
#include <string>
#include <vector>

namespace stevedore::nav {

enum class RouteAction {
  Travel,
  Refuel,
};

struct RouteStep {
  RouteAction action{RouteAction::Travel};
  std::string location; // destination of a Travel step, station of a Refuel step
  int fuelCost{0};
  int seconds{0};
};

struct RouteRequest {
  std::string start;
  std::string goal;
  int currentFuel{0};
  int fuelCapacity{0};
  int engineSpeed{0};
  std::span<const Location> locations; // everything the planner may route through
};

struct RoutePlan {
  std::vector<RouteStep> steps;
  int totalFuel{0};
  int totalSeconds{0};
  double totalDistance{0.0};
};

// External pathfinding service. Implementations must tolerate concurrent
// planRoute() calls: the candidate search runs one per evaluator thread.
//
// Returns false (and fills *outError) when the service fails or no path exists.
class RoutingOracle {
public:
  virtual ~RoutingOracle() = default;

  virtual bool planRoute(const RouteRequest& request, RoutePlan& out, std::string* outError = nullptr) = 0;
};

// Straight single leg, no refuel stops.
//  fuel    = ceil(distance)
//  seconds = 15 + round(distance * 25 / engineSpeed)
// Fails when start/goal are unknown or the leg needs more than currentFuel.
class DirectRouteOracle final : public RoutingOracle {
public:
  bool planRoute(const RouteRequest& request, RoutePlan& out, std::string* outError = nullptr) override;
};

} // namespace stevedore::nav
