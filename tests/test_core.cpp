#include "stevedore/core/Args.h"
#include "stevedore/core/Channel.h"
#include "stevedore/core/Error.h"
#include "stevedore/core/JsonWriter.h"
#include "stevedore/core/Log.h"
#include "stevedore/core/Random.h"

#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace stevedore;

int test_core() {
  int fails = 0;

  // Channel: drop-on-full, drain after close, stop token.
  {
    core::Channel<int> ch(2);
    if (!ch.trySend(1) || !ch.trySend(2) || ch.trySend(3)) {
      std::cerr << "[test_core] trySend should fail once the buffer is full\n";
      ++fails;
    }
    ch.close();
    if (ch.send(4)) {
      std::cerr << "[test_core] send after close should fail\n";
      ++fails;
    }
    const auto a = ch.receive();
    const auto b = ch.receive();
    const auto c = ch.receive();
    if (!a || *a != 1 || !b || *b != 2 || c) {
      std::cerr << "[test_core] closed channel should drain in order, then end\n";
      ++fails;
    }

    core::Channel<int> empty(1);
    std::stop_source src;
    std::jthread stopper([&] {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      src.request_stop();
    });
    if (empty.receive(src.get_token())) {
      std::cerr << "[test_core] stopped receive should return nullopt\n";
      ++fails;
    }
  }

  // Args.
  {
    const char* argv[] = {"tool", "--seed", "42", "--ms=250", "--json", "-h", "--offset", "-3", "extra"};
    core::Args args(9, const_cast<char**>(argv));

    unsigned long long seed = 0;
    int ms = 0;
    int offset = 0;
    if (!args.getU64("seed", seed) || seed != 42 || !args.getInt("ms", ms) || ms != 250) {
      std::cerr << "[test_core] Args key/value parsing failed\n";
      ++fails;
    }
    if (!args.hasFlag("json") || !args.hasFlag("h") || !args.getInt("offset", offset) || offset != -3) {
      std::cerr << "[test_core] Args flags / negative values failed\n";
      ++fails;
    }
    if (args.positional().size() != 1 || args.positional()[0] != "extra" || args.getInt("seedx", ms)) {
      std::cerr << "[test_core] Args positional parsing failed\n";
      ++fails;
    }
  }

  // JsonWriter (compact).
  {
    std::ostringstream oss;
    core::JsonWriter j(oss, /*pretty=*/false);
    j.beginObject();
    j.key("op"); j.value("op\"1");
    j.key("units"); j.value(12);
    j.key("ok"); j.value(true);
    j.key("buffers");
    j.beginArray();
    j.value("A");
    j.value("B");
    j.endArray();
    j.field("empty", std::string());
    j.endObject();
    const std::string expected = R"({"op":"op\"1","units":12,"ok":true,"buffers":["A","B"],"empty":""})";
    if (oss.str() != expected) {
      std::cerr << "[test_core] JsonWriter produced " << oss.str() << "\n";
      ++fails;
    }
  }

  // Log level gating through a sink.
  {
    core::LogLevel lvl = core::LogLevel::Info;
    if (!core::parseLogLevel("warning", lvl) || lvl != core::LogLevel::Warn || core::parseLogLevel("loud", lvl)) {
      std::cerr << "[test_core] parseLogLevel is off\n";
      ++fails;
    }

    const auto previous = core::getLogLevel();
    std::vector<std::string> lines;
    core::setLogSink([&](core::LogLevel, std::string_view msg) { lines.emplace_back(msg); });
    core::setLogLevel(core::LogLevel::Warn);
    STEVEDORE_LOG_INFO("hidden");
    STEVEDORE_LOG_WARN("shown");
    core::setLogLevel(core::LogLevel::Off);
    STEVEDORE_LOG_ERROR("muted");
    core::setLogSink(nullptr);
    core::setLogLevel(previous);

    if (lines.size() != 1 || lines[0] != "shown") {
      std::cerr << "[test_core] log gating captured " << lines.size() << " lines\n";
      ++fails;
    }
  }

  // Error helpers.
  {
    std::string detail;
    if (core::fail(core::CoordError::ResourceGone, &detail, "gone") != core::CoordError::ResourceGone ||
        detail != "gone" || !core::isTerminal(core::CoordError::WaitCancelled) ||
        core::isTerminal(core::CoordError::InsufficientCargo) ||
        core::toString(core::CoordError::LaunchFailed) != "LaunchFailed") {
      std::cerr << "[test_core] error helpers are off\n";
      ++fails;
    }
  }

  // Seeded streams are reproducible and independent per tag.
  {
    core::SplitMix64 a(core::deriveSeed(7, "EXTRACTOR-1"));
    core::SplitMix64 b(core::deriveSeed(7, "EXTRACTOR-1"));
    core::SplitMix64 c(core::deriveSeed(7, "EXTRACTOR-2"));
    bool same = true;
    bool differs = false;
    for (int i = 0; i < 16; ++i) {
      const auto x = a.nextU64();
      same = same && x == b.nextU64();
      differs = differs || x != c.nextU64();
    }
    const int r = a.range<int>(3, 9);
    if (!same || !differs || r < 3 || r > 9) {
      std::cerr << "[test_core] SplitMix64 streams are off\n";
      ++fails;
    }
  }

  return fails;
}
