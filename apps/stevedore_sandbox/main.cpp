#include "stevedore/cargo/ResourceCoordinator.h"
#include "stevedore/core/Args.h"
#include "stevedore/core/JsonWriter.h"
#include "stevedore/core/Log.h"
#include "stevedore/core/Random.h"
#include "stevedore/fleet/OperationSession.h"
#include "stevedore/nav/CandidateSearch.h"
#include "stevedore/nav/RoutingOracle.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace stevedore;
using namespace std::chrono_literals;

namespace {

const char* kByproduct = "QUARTZ_SAND";

struct GoodsForType {
  const char* type;
  std::vector<std::string> goods;
};

static std::vector<std::string> goodsFor(const std::string& extractionType) {
  static const GoodsForType table[] = {
    {"common_metals",   {"IRON_ORE", "COPPER_ORE", "ALUMINUM_ORE"}},
    {"precious_metals", {"SILVER_ORE", "GOLD_ORE", "PLATINUM_ORE"}},
    {"rare_metals",     {"URANITE_ORE", "MERITIUM_ORE"}},
    {"minerals",        {"SILICON_CRYSTALS", "DIAMONDS"}},
    {"ice",             {"ICE_WATER", "AMMONIA_ICE"}},
    {"gas",             {"HYDROCARBON", "LIQUID_HYDROGEN", "LIQUID_NITROGEN"}},
  };
  for (const auto& row : table) {
    if (extractionType == row.type) return row.goods;
  }
  return {};
}

// Deterministic system of waypoints for one seed.
static std::vector<nav::Location> generateRegion(core::u64 seed, int count, const std::string& siteTrait) {
  static const char* kSiteTraits[] = {
    "COMMON_METAL_DEPOSITS", "PRECIOUS_METAL_DEPOSITS", "RARE_METAL_DEPOSITS",
    "MINERAL_DEPOSITS", "ICE_CRYSTALS", "EXPLOSIVE_GASES",
  };

  core::SplitMix64 rng(core::deriveSeed(seed, "region"));
  std::vector<nav::Location> out;
  out.reserve((std::size_t)count);

  for (int i = 0; i < count; ++i) {
    nav::Location loc;
    char name[32];
    std::snprintf(name, sizeof(name), "X1-SB%02d", i + 1);
    loc.symbol = name;
    loc.pos = math::Vec2d{std::round(rng.uniform(-180.0, 180.0)), std::round(rng.uniform(-180.0, 180.0))};

    if (rng.chance(0.45)) {
      loc.traits.push_back(kSiteTraits[rng.range<int>(0, 5)]);
    } else if (rng.chance(0.6)) {
      loc.traits.push_back("MARKETPLACE");
      loc.hasFuel = rng.chance(0.7);
    }
    out.push_back(std::move(loc));
  }

  // Every region gets at least one site of the requested kind and one fuel stop.
  out[0].traits = {siteTrait};
  out[0].hasFuel = false;
  out[1].traits = {"MARKETPLACE"};
  out[1].hasFuel = true;
  return out;
}

// Stand-in for the game server: ship holds and market sales.
class SimWorld {
public:
  explicit SimWorld(int holdCapacity) : m_holdCapacity(holdCapacity) {}

  int holdCapacity() const { return m_holdCapacity; }

  int load(const std::string& ship) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto it = m_holds.find(ship);
    return it == m_holds.end() ? 0 : it->second;
  }

  // Clamped to the free hold; returns what fit.
  int add(const std::string& ship, int units) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const int fit = std::clamp(m_holdCapacity - m_holds[ship], 0, units);
    m_holds[ship] += fit;
    return fit;
  }

  // Moves up to `units` (bounded by what `from` carries and `to` can take).
  int transfer(const std::string& from, const std::string& to, int units) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const int moved = std::min({units, m_holds[from], m_holdCapacity - m_holds[to]});
    if (moved <= 0) return 0;
    m_holds[from] -= moved;
    m_holds[to] += moved;
    return moved;
  }

  int take(const std::string& ship, int units) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const int moved = std::min(units, m_holds[ship]);
    m_holds[ship] -= moved;
    return moved;
  }

  int sellAll(const std::string& ship) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const int units = m_holds[ship];
    m_holds[ship] = 0;
    m_sold += units;
    return units;
  }

  int sold() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sold;
  }

private:
  const int m_holdCapacity;
  mutable std::mutex m_mutex;
  std::unordered_map<std::string, int> m_holds;
  int m_sold{0};
};

struct SimCounters {
  std::atomic<int> extracted{0};
  std::atomic<int> deposited{0};
  std::atomic<int> handedOff{0};
  std::atomic<int> withdrawn{0};
  std::atomic<int> jettisoned{0};
  std::atomic<int> haulTrips{0};
};

class CountingObserver final : public cargo::CoordinatorObserver {
public:
  void onWaiterQueued(const std::string&, const std::string&, std::size_t depth) override {
    ++queued;
    int prev = maxDepth.load();
    while ((int)depth > prev && !maxDepth.compare_exchange_weak(prev, (int)depth)) {
    }
  }
  void onWaiterSatisfied(const std::string&, const std::string&, const std::string&, int) override { ++satisfied; }
  void onWaiterCancelled(const std::string&, const std::string&) override { ++cancelled; }
  void onNotificationDropped(const std::string&, const std::string&) override { ++dropped; }

  std::atomic<int> queued{0};
  std::atomic<int> satisfied{0};
  std::atomic<int> cancelled{0};
  std::atomic<int> dropped{0};
  std::atomic<int> maxDepth{0};
};

// false once `stop` fired.
static bool nap(const std::stop_token& stop, std::chrono::milliseconds d) {
  std::mutex m;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lock(m);
  cv.wait_for(lock, stop, d, [] { return false; });
  return !stop.stop_requested();
}

struct SimContext {
  cargo::ResourceCoordinator* coordinator{nullptr};
  fleet::OperationSession* session{nullptr};
  SimWorld* world{nullptr};
  SimCounters* counters{nullptr};
  std::vector<std::string> goods;
  core::u64 seed{0};
};

static void runExtractor(std::stop_token stop, const SimContext& ctx, const fleet::WorkerCommand& cmd) {
  core::SplitMix64 rng(core::deriveSeed(ctx.seed, cmd.shipSymbol));
  auto& coord = *ctx.coordinator;
  auto& world = *ctx.world;
  const std::string& self = cmd.shipSymbol;

  while (nap(stop, std::chrono::milliseconds(rng.range<int>(10, 30)))) {
    const int yield = rng.range<int>(3, 9);

    // Worthless rock goes straight into whichever buffer has room.
    if (rng.chance(0.15)) {
      if (auto ledger = coord.findResourceWithSpace(cmd.operationId, yield)) {
        std::string err;
        if (coord.notifyDeposit(ledger->symbol(), kByproduct, yield, &err) != core::CoordError::None) {
          STEVEDORE_LOG_DEBUG(self + " byproduct deposit failed: " + err);
        } else {
          ctx.counters->extracted += yield;
        }
      }
      continue;
    }

    const std::string& good = ctx.goods[rng.range<std::size_t>(0, ctx.goods.size() - 1)];
    ctx.counters->extracted += world.add(self, yield);
    if (world.load(self) < world.holdCapacity() / 2) continue;

    // Storage first.
    cargo::SpaceGrant grant;
    std::string err;
    const int carried = world.load(self);
    if (coord.reserveSpaceForDeposit(cmd.operationId, carried, grant, &err) == core::CoordError::None) {
      const int moved = world.take(self, grant.units);
      if (moved > 0) {
        if (coord.confirmDeposit(grant.ledger->symbol(), good, moved, &err) == core::CoordError::None) {
          ctx.counters->deposited += moved;
        } else {
          STEVEDORE_LOG_DEBUG(self + " deposit not recorded: " + err);
        }
      }
      if (moved < grant.units) {
        std::string releaseErr;
        if (coord.releaseReservedSpace(grant.ledger->symbol(), grant.units - moved, &releaseErr) !=
            core::CoordError::None) {
          STEVEDORE_LOG_DEBUG(self + " release failed: " + releaseErr);
        }
      }
      if (world.load(self) == 0) continue;
    }

    // Storage is full: unload into a transport instead.
    fleet::AssignmentChannel* hub = ctx.session->assignments();
    if (!hub) continue;

    std::string transport;
    const auto e = hub->requestProducer(self, transport, stop, &err);
    if (e != core::CoordError::None) {
      if (core::isTerminal(e)) return;
      STEVEDORE_LOG_WARN(self + ": " + err);
      continue;
    }
    ctx.counters->handedOff += world.transfer(self, transport, world.load(self));
    if (hub->notifyTransferComplete(self, transport, stop, &err) != core::CoordError::None) return;
  }
}

static void runTransport(std::stop_token stop, const SimContext& ctx, const fleet::WorkerCommand& cmd) {
  core::SplitMix64 rng(core::deriveSeed(ctx.seed, cmd.shipSymbol));
  auto& coord = *ctx.coordinator;
  auto& world = *ctx.world;
  const std::string& self = cmd.shipSymbol;
  fleet::AssignmentChannel* hub = ctx.session->assignments();

  while (!stop.stop_requested()) {
    // Top off from storage.
    const std::string& good = ctx.goods[rng.range<std::size_t>(0, ctx.goods.size() - 1)];
    const int room = world.holdCapacity() - world.load(self);
    if (room > 0) {
      cargo::CargoReservation res;
      std::string err;
      const auto e = coord.waitForCargoFor(cmd.operationId, good, 1, 150ms, res, stop, &err);
      if (e == core::CoordError::None) {
        const std::string from = res.ledger->symbol();
        const int take = std::min(room, res.units);
        if (coord.confirmWithdrawal(from, good, take, &err) == core::CoordError::None) {
          ctx.counters->withdrawn += world.add(self, take);
        }
        if (res.units > take && coord.cancelReservation(from, good, res.units - take, &err) != core::CoordError::None) {
          STEVEDORE_LOG_WARN(self + ": " + err);
        }
      } else if (e != core::CoordError::WaitCancelled) {
        return;
      }
    }

    if (world.load(self) >= world.holdCapacity() * 3 / 4) {
      ctx.counters->haulTrips += 1;
      if (!nap(stop, std::chrono::milliseconds(rng.range<int>(40, 80)))) return;
      world.sellAll(self);
      continue;
    }

    if (hub) {
      std::string err;
      const auto e = hub->signalAvailability(self, world.load(self), stop, &err);
      if (core::isTerminal(e)) return;
    }
  }
}

static void runStorage(std::stop_token stop, const SimContext& ctx, const fleet::WorkerCommand& cmd) {
  auto sub = ctx.coordinator->subscribeToDeposits(cmd.shipSymbol);
  while (auto n = sub.next(stop)) {
    if (n->good != kByproduct) continue;
    std::string err;
    if (ctx.coordinator->notifyJettison(cmd.shipSymbol, n->good, n->units, &err) == core::CoordError::None) {
      ctx.counters->jettisoned += n->units;
    } else {
      STEVEDORE_LOG_DEBUG(cmd.shipSymbol + " jettison skipped: " + err);
    }
  }
}

// Runs every worker as a thread of this process.
class ThreadLauncher final : public fleet::WorkerLauncher {
public:
  explicit ThreadLauncher(const SimContext& ctx) : m_ctx(ctx) {}

  std::optional<std::string> startWorker(const fleet::WorkerCommand& cmd, std::string* outError) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string id = std::string(fleet::toString(cmd.kind)) + "-" + cmd.shipSymbol;
    if (m_workers.count(id) != 0) {
      if (outError) *outError = "worker " + id + " already running";
      return std::nullopt;
    }

    Worker w;
    w.kind = cmd.kind;
    w.thread = std::jthread([ctx = &m_ctx, cmd](std::stop_token stop) {
      switch (cmd.kind) {
        case fleet::WorkerKind::Extractor: runExtractor(stop, *ctx, cmd); break;
        case fleet::WorkerKind::Transport: runTransport(stop, *ctx, cmd); break;
        case fleet::WorkerKind::Storage:   runStorage(stop, *ctx, cmd); break;
      }
    });
    m_workers.emplace(id, std::move(w));
    return id;
  }

  bool stopWorker(std::string_view workerId, std::string* outError) override {
    std::jthread thread;
    {
      std::lock_guard<std::mutex> lock(m_mutex);
      const auto it = m_workers.find(std::string(workerId));
      if (it == m_workers.end()) {
        if (outError) *outError = "no worker " + std::string(workerId);
        return false;
      }
      thread = std::move(it->second.thread);
      m_workers.erase(it);
    }
    thread.request_stop();
    return true; // joined here
  }

  std::vector<std::string> listWorkers(fleet::WorkerKind kind) const override {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    for (const auto& [id, w] : m_workers) {
      if (w.kind == kind) out.push_back(id);
    }
    return out;
  }

private:
  struct Worker {
    fleet::WorkerKind kind{fleet::WorkerKind::Extractor};
    std::jthread thread;
  };

  const SimContext& m_ctx;
  mutable std::mutex m_mutex;
  std::map<std::string, Worker> m_workers;
};

static void printHelp() {
  std::cout << "stevedore_sandbox\n"
            << "  --seed <u64>             Region seed (default: 1337)\n"
            << "  --type <name>            Extraction type: " << nav::knownExtractionTypes() << " (default: ice)\n"
            << "  --site <symbol>          Skip the search and work this site\n"
            << "  --locations <n>          Waypoints in the region (default: 24)\n"
            << "  --extractors <n>         Extractor hulls (default: 4)\n"
            << "  --transports <n>         Transport hulls (default: 2)\n"
            << "  --storage <n>            Storage hulls (default: 1)\n"
            << "  --storageCap <units>     Capacity per storage hull (default: 80)\n"
            << "  --hold <units>           Extractor/transport hold (default: 30)\n"
            << "  --fuel <units>           Transport fuel capacity (default: 400)\n"
            << "  --workers <n>            Candidate search threads (default: 15)\n"
            << "  --force                  Accept the least-infeasible site when none fits\n"
            << "  --ms <millis>            Simulated run time (default: 1500)\n"
            << "  --log <level>            trace|debug|info|warn|error|off (default: warn)\n"
            << "  --json                   Emit the report as JSON\n";
}

} // namespace

int main(int argc, char** argv) {
  core::Args args(argc, argv);

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  core::LogLevel level = core::LogLevel::Warn;
  if (const auto text = args.last("log")) {
    if (!core::parseLogLevel(*text, level)) {
      std::cerr << "Unknown log level: " << *text << "\n";
      return 2;
    }
  }
  core::setLogLevel(level);

  unsigned long long seed = 1337;
  (void)args.getU64("seed", seed);

  std::string extractionType = "ice";
  (void)args.getString("type", extractionType);
  std::string siteTrait;
  if (!nav::siteTraitForExtraction(extractionType, siteTrait)) {
    std::cerr << "Unknown extraction type: " << extractionType << " (valid: " << nav::knownExtractionTypes()
              << ")\n";
    return 2;
  }

  int locationCount = 24;
  int extractorCount = 4;
  int transportCount = 2;
  int storageCount = 1;
  int storageCap = 80;
  int hold = 30;
  int runMs = 1500;
  int searchWorkers = 15;
  (void)args.getInt("locations", locationCount);
  (void)args.getInt("extractors", extractorCount);
  (void)args.getInt("transports", transportCount);
  (void)args.getInt("storage", storageCount);
  (void)args.getInt("storageCap", storageCap);
  (void)args.getInt("hold", hold);
  (void)args.getInt("ms", runMs);
  (void)args.getInt("workers", searchWorkers);

  nav::ShipProfile hauler;
  hauler.fuelCapacity = 400;
  (void)args.getInt("fuel", hauler.fuelCapacity);

  locationCount = std::max(locationCount, 2);
  extractorCount = std::max(extractorCount, 1);
  storageCount = std::max(storageCount, 1);
  transportCount = std::max(transportCount, 0);

  const bool json = args.hasFlag("json");

  const auto region = generateRegion(seed, locationCount, siteTrait);

  fleet::OperationSpec spec;
  spec.id = "op-" + extractionType + "-" + std::to_string(seed);
  spec.type = extractionType == "gas" ? fleet::OperationType::GasSiphon : fleet::OperationType::Mining;
  spec.supportedGoods = goodsFor(extractionType);
  for (int i = 0; i < extractorCount; ++i) spec.extractors.push_back("EXTRACTOR-" + std::to_string(i + 1));
  for (int i = 0; i < storageCount; ++i) spec.storage.push_back("STORAGE-" + std::to_string(i + 1));
  for (int i = 0; i < transportCount; ++i) spec.transports.push_back("TRANSPORT-" + std::to_string(i + 1));
  (void)args.getString("site", spec.siteSymbol);

  std::string err;
  auto operation = fleet::Operation::create(spec, &err);
  if (!operation) {
    std::cerr << "Invalid operation: " << err << "\n";
    return 2;
  }

  cargo::ResourceCoordinator coordinator;
  auto observer = std::make_shared<CountingObserver>();
  coordinator.setObserver(observer);

  nav::DirectRouteOracle oracle;
  SimWorld world(std::max(hold, 1));
  SimCounters counters;

  SimContext ctx;
  ctx.coordinator = &coordinator;
  ctx.world = &world;
  ctx.counters = &counters;
  ctx.goods = spec.supportedGoods;
  ctx.seed = seed;

  fleet::SessionConfig cfg;
  cfg.siteTrait = siteTrait;
  cfg.search.workerCount = (std::size_t)std::max(searchWorkers, 1);
  cfg.search.allowInfeasible = args.hasFlag("force");

  // Declared before the session: workers are joined in session teardown.
  ThreadLauncher launcher(ctx);
  auto session = std::make_unique<fleet::OperationSession>(std::move(operation), coordinator, oracle, launcher, cfg);
  ctx.session = session.get();

  std::vector<fleet::BufferSpec> buffers;
  for (const auto& s : spec.storage) buffers.push_back(fleet::BufferSpec{s, storageCap, {}});

  const auto t0 = std::chrono::steady_clock::now();
  const auto startErr = session->start(hauler, region, buffers, {}, &err);
  if (startErr != core::CoordError::None) {
    std::cerr << "Operation failed to start (" << core::toString(startErr) << "): " << err << "\n";
    return 1;
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(std::max(runMs, 0)));

  // Snapshot buffers before teardown unregisters them.
  std::vector<std::string> ledgerLines;
  for (const auto& l : coordinator.resourcesForOperation(session->operation().id())) {
    ledgerLines.push_back(l->describe());
  }

  if (session->complete(&err) != core::CoordError::None) {
    std::cerr << "Operation did not complete cleanly: " << err << "\n";
  }
  const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

  const auto& op = session->operation();
  const auto& target = session->target();
  const auto& search = session->searchStats();
  const auto loop = session->assignmentStats().value_or(fleet::AssignmentStats{});

  if (json) {
    core::JsonWriter j(std::cout, /*pretty=*/true);
    j.beginObject();
    j.key("seed"); j.value((unsigned long long)seed);
    j.key("operation");
    j.beginObject();
    j.key("id"); j.value(op.id());
    j.key("type"); j.value(fleet::toString(op.type()));
    j.key("status"); j.value(fleet::toString(op.status()));
    j.key("seconds"); j.value(seconds);
    j.endObject();
    j.key("target");
    j.beginObject();
    j.key("site"); j.value(target.site);
    j.key("destination"); j.value(target.destination);
    j.key("distance"); j.value(target.distance);
    j.key("feasible"); j.value(target.feasible);
    j.key("roundTripFuel"); j.value(target.roundTripFuel);
    j.key("roundTripSeconds"); j.value(target.roundTripSeconds);
    j.endObject();
    j.key("search");
    j.beginObject();
    j.key("pairs"); j.value((unsigned long long)search.pairs);
    j.key("prefiltered"); j.value((unsigned long long)search.prefiltered);
    j.key("evaluated"); j.value((unsigned long long)search.evaluated);
    j.key("skipped"); j.value((unsigned long long)search.skipped);
    j.key("feasible"); j.value((unsigned long long)search.feasible);
    j.endObject();
    j.key("cargo");
    j.beginObject();
    j.key("extracted"); j.value(counters.extracted.load());
    j.key("deposited"); j.value(counters.deposited.load());
    j.key("handedOff"); j.value(counters.handedOff.load());
    j.key("withdrawn"); j.value(counters.withdrawn.load());
    j.key("jettisoned"); j.value(counters.jettisoned.load());
    j.key("sold"); j.value(world.sold());
    j.key("haulTrips"); j.value(counters.haulTrips.load());
    j.endObject();
    j.key("waiters");
    j.beginObject();
    j.key("queued"); j.value(observer->queued.load());
    j.key("satisfied"); j.value(observer->satisfied.load());
    j.key("cancelled"); j.value(observer->cancelled.load());
    j.key("maxDepth"); j.value(observer->maxDepth.load());
    j.key("droppedNotifications"); j.value(observer->dropped.load());
    j.endObject();
    j.key("assignments");
    j.beginObject();
    j.key("pairings"); j.value((unsigned long long)loop.pairings);
    j.key("transfers"); j.value((unsigned long long)loop.transfers);
    j.endObject();
    j.key("buffers");
    j.beginArray();
    for (const auto& line : ledgerLines) j.value(line);
    j.endArray();
    j.endObject();
    std::cout << "\n";
    return 0;
  }

  std::cout << "Seed: " << seed << "  region: " << region.size() << " waypoints\n";
  std::cout << op.describe() << "  (" << std::fixed << std::setprecision(2) << seconds << "s)\n\n";

  std::cout << "--- Target ---\n";
  std::cout << "  site=" << target.site << "  destination=" << target.destination
            << "  distance=" << std::setprecision(1) << target.distance;
  if (target.roundTripFuel > 0) {
    std::cout << "  roundTrip=" << target.roundTripFuel << " fuel / " << target.roundTripSeconds << "s";
  }
  std::cout << (target.feasible ? "" : "  (INFEASIBLE, forced)") << "\n";
  if (search.pairs > 0) {
    std::cout << "  search: pairs=" << search.pairs << " prefiltered=" << search.prefiltered
              << " evaluated=" << search.evaluated << " skipped=" << search.skipped
              << " feasible=" << search.feasible << "\n";
  }

  std::cout << "\n--- Cargo ---\n";
  std::cout << "  extracted=" << counters.extracted.load() << "  deposited=" << counters.deposited.load()
            << "  handedOff=" << counters.handedOff.load() << "  withdrawn=" << counters.withdrawn.load()
            << "  jettisoned=" << counters.jettisoned.load() << "  sold=" << world.sold()
            << "  haulTrips=" << counters.haulTrips.load() << "\n";
  std::cout << "  waiters: queued=" << observer->queued.load() << " satisfied=" << observer->satisfied.load()
            << " cancelled=" << observer->cancelled.load() << " maxDepth=" << observer->maxDepth.load()
            << "  droppedNotifications=" << observer->dropped.load() << "\n";
  std::cout << "  assignments: pairings=" << loop.pairings << " transfers=" << loop.transfers << "\n";

  std::cout << "\n--- Buffers (at end of run) ---\n";
  for (const auto& line : ledgerLines) std::cout << "  " << line << "\n";

  return 0;
}
