#pragma once

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tsync/orchestrator/cancellation.h"

namespace tsync::orchestrator {

struct SubprocessOptions {
  // argv[0] is resolved through PATH. Arguments are passed verbatim.
  std::vector<std::string> argv;
  // Called for every stdout/stderr line as it arrives, without the terminator.
  std::function<void(std::string_view)> on_line;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<CancellationToken> cancel;
  // Time between SIGTERM and SIGKILL when the child has to be stopped.
  std::chrono::milliseconds terminate_grace{std::chrono::seconds(5)};
};

struct SubprocessResult {
  // WEXITSTATUS for normal exits, 128 + signo for signal-terminated children.
  int exit_code{0};
  bool timed_out{false};
  bool cancelled{false};
};

// Spawns argv with stdin on /dev/null and stdout+stderr merged into one pipe.
// The child runs in its own process group so termination reaches helpers it
// started. Throws Error{Transfer, kSpawnFailed|kPipeFailed} when the child
// cannot be started (including exec failure).
SubprocessResult RunSubprocess(const SubprocessOptions& options);

// Starts argv fully detached (double fork, setsid) with stdout/stderr
// appended to |output_file|. Returns the pid of the detached process.
pid_t SpawnDetached(const std::vector<std::string>& argv,
                    const std::filesystem::path& output_file);

}  // namespace tsync::orchestrator
