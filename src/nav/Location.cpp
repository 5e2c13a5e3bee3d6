#include "stevedore/nav/Location.h"

#include <utility>

namespace stevedore::nav {

namespace {

struct ExtractionTrait {
  std::string_view type;
  std::string_view trait;
};

constexpr ExtractionTrait kExtractionTraits[] = {
  {"common_metals",   "COMMON_METAL_DEPOSITS"},
  {"precious_metals", "PRECIOUS_METAL_DEPOSITS"},
  {"rare_metals",     "RARE_METAL_DEPOSITS"},
  {"minerals",        "MINERAL_DEPOSITS"},
  {"ice",             "ICE_CRYSTALS"},
  {"gas",             "EXPLOSIVE_GASES"},
};

} // namespace

bool siteTraitForExtraction(std::string_view extractionType, std::string& outTrait) {
  for (const auto& e : kExtractionTraits) {
    if (e.type == extractionType) {
      outTrait = std::string(e.trait);
      return true;
    }
  }
  return false;
}

std::string knownExtractionTypes() {
  std::string out;
  for (const auto& e : kExtractionTraits) {
    if (!out.empty()) out += ", ";
    out += e.type;
  }
  return out;
}

const Location* findLocation(std::span<const Location> locations, std::string_view symbol) {
  for (const auto& loc : locations) {
    if (loc.symbol == symbol) return &loc;
  }
  return nullptr;
}

} // namespace stevedore::nav
