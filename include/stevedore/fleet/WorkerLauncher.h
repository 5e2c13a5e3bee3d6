#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stevedore::fleet {

enum class WorkerKind {
  Extractor,
  Storage,
  Transport,
};

std::string_view toString(WorkerKind kind);

// Everything a worker process needs to join an operation.
struct WorkerCommand {
  WorkerKind kind{WorkerKind::Extractor};
  std::string shipSymbol;
  std::string operationId;
  std::string siteSymbol;
  std::string destinationSymbol; // where haulers sell / refuel
};

// Process-lifecycle manager that actually runs worker tasks (containers,
// threads, remote daemons). The session only starts, stops and lists them.
class WorkerLauncher {
public:
  virtual ~WorkerLauncher() = default;

  // Worker id on success; nullopt (with *outError) when it could not start.
  virtual std::optional<std::string> startWorker(const WorkerCommand& command,
                                                 std::string* outError = nullptr) = 0;

  virtual bool stopWorker(std::string_view workerId, std::string* outError = nullptr) = 0;

  virtual std::vector<std::string> listWorkers(WorkerKind kind) const = 0;
};

} // namespace stevedore::fleet
