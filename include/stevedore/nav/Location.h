#pragma once

#include "stevedore/math/Vec2.h"

#include <algorithm>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stevedore::nav {

// A waypoint the fleet can fly to.
struct Location {
  std::string symbol;
  math::Vec2d pos{};
  bool hasFuel{false};             // sells fuel
  std::vector<std::string> traits; // MARKETPLACE, ICE_CRYSTALS, ...

  bool hasTrait(std::string_view trait) const {
    return std::find(traits.begin(), traits.end(), trait) != traits.end();
  }
};

// What the candidate search needs to know about the hauling hull.
struct ShipProfile {
  int fuelCapacity{0};
  int engineSpeed{30};
};

// "ice" -> "ICE_CRYSTALS", "common_metals" -> "COMMON_METAL_DEPOSITS", ...
// Returns false for an unknown extraction type.
bool siteTraitForExtraction(std::string_view extractionType, std::string& outTrait);

// Comma separated list of the names siteTraitForExtraction() accepts.
std::string knownExtractionTypes();

// nullptr when `symbol` is not in `locations`.
const Location* findLocation(std::span<const Location> locations, std::string_view symbol);

} // namespace stevedore::nav
