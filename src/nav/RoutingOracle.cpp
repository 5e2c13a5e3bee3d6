#include "stevedore/nav/RoutingOracle.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace stevedore::nav {

namespace {

static bool setError(std::string* outError, std::string msg) {
  if (outError) *outError = std::move(msg);
  return false;
}

} // namespace

bool DirectRouteOracle::planRoute(const RouteRequest& request, RoutePlan& out, std::string* outError) {
  out = RoutePlan{};

  const Location* from = findLocation(request.locations, request.start);
  if (!from) return setError(outError, "unknown start location " + request.start);
  const Location* to = findLocation(request.locations, request.goal);
  if (!to) return setError(outError, "unknown goal location " + request.goal);

  const double dist = math::distance(from->pos, to->pos);
  const int fuel = (int)std::ceil(dist);
  if (fuel > request.currentFuel) {
    return setError(outError, "leg " + request.start + " -> " + request.goal + " needs " +
                                  std::to_string(fuel) + " fuel, ship carries " +
                                  std::to_string(request.currentFuel));
  }

  const int speed = std::max(1, request.engineSpeed);
  const int seconds = 15 + (int)std::lround(dist * 25.0 / (double)speed);

  if (request.start != request.goal) {
    out.steps.push_back(RouteStep{RouteAction::Travel, request.goal, fuel, seconds});
    out.totalFuel = fuel;
    out.totalSeconds = seconds;
    out.totalDistance = dist;
  }
  return true;
}

} // namespace stevedore::nav
