#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "tsync/orchestrator/cancellation.h"
#include "tsync/routes/route_table.h"

namespace tsync::orchestrator {

class SessionLog;

struct TransferOptions {
  std::string tool{"rsync"};
  std::vector<std::string> flags{"-avzP", "--stats"};
  std::chrono::seconds io_timeout{3600};
  std::vector<std::string> excludes{"*.Trash*",  "lost+found", "System Volume Information",
                                    ".DS_Store", "Thumbs.db",  "desktop.ini"};
  std::filesystem::path ssh_key{"/.ssh/id_rsa"};
  // When false the destination is passed as a local path, without -e or user@host.
  bool remote{true};

  // Full argv for one route. Source and destination each stay a single
  // argument; no shell ever sees them.
  [[nodiscard]] std::vector<std::string> BuildArgv(const routes::RouteEntry& route,
                                                   const std::string& remote_user,
                                                   const std::string& remote_host) const;
};

enum class TransferStatus { kSucceeded, kFailed, kInterrupted };

struct TransferOutcome {
  TransferStatus status{TransferStatus::kFailed};
  int exit_code{0};
  std::chrono::milliseconds duration{0};
};

class TransferRunner {
 public:
  virtual ~TransferRunner() = default;

  // |route| holds already validated paths. Never retries.
  virtual TransferOutcome Run(const routes::RouteEntry& route, const std::string& remote_user,
                              const std::string& remote_host, const TransferOptions& options) = 0;
};

// Spawns the transfer tool and streams its output into the session log.
class RsyncTransferRunner final : public TransferRunner {
 public:
  explicit RsyncTransferRunner(SessionLog& log,
                               std::optional<CancellationToken> cancel = std::nullopt);

  TransferOutcome Run(const routes::RouteEntry& route, const std::string& remote_user,
                      const std::string& remote_host, const TransferOptions& options) override;

 private:
  SessionLog& log_;
  std::optional<CancellationToken> cancel_;
};

// Exit status reported when the tool could not be started at all.
inline constexpr int kTransferSpawnFailedExitCode = 127;

}  // namespace tsync::orchestrator
