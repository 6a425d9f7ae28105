#include "tsync/orchestrator/transfer_runner.h"

#include "tsync/common.h"
#include "tsync/error.h"
#include "tsync/orchestrator/session_log.h"
#include "tsync/orchestrator/subprocess.h"

namespace tsync::orchestrator {
namespace {

std::string WithTrailingSlash(const std::string& path) {
  if (!path.empty() && path.back() == '/') {
    return path;
  }
  return path + "/";
}

}  // namespace

std::vector<std::string> TransferOptions::BuildArgv(const routes::RouteEntry& route,
                                                    const std::string& remote_user,
                                                    const std::string& remote_host) const {
  std::vector<std::string> argv;
  argv.reserve(flags.size() + excludes.size() + 6);
  argv.push_back(tool);
  argv.insert(argv.end(), flags.begin(), flags.end());
  argv.push_back("--timeout=" + std::to_string(io_timeout.count()));
  for (const auto& pattern : excludes) {
    argv.push_back("--exclude=" + pattern);
  }
  if (remote) {
    argv.push_back("-e");
    argv.push_back("ssh -i " + PathToUtf8String(ssh_key) +
                   " -o BatchMode=yes -o ConnectTimeout=10 -o ServerAliveInterval=60"
                   " -o StrictHostKeyChecking=no -o UserKnownHostsFile=/dev/null");
  }
  argv.push_back(WithTrailingSlash(route.source));
  if (remote) {
    argv.push_back(remote_user + "@" + remote_host + ":" + WithTrailingSlash(route.destination));
  } else {
    argv.push_back(WithTrailingSlash(route.destination));
  }
  return argv;
}

RsyncTransferRunner::RsyncTransferRunner(SessionLog& log, std::optional<CancellationToken> cancel)
    : log_(log), cancel_(std::move(cancel)) {}

TransferOutcome RsyncTransferRunner::Run(const routes::RouteEntry& route,
                                         const std::string& remote_user,
                                         const std::string& remote_host,
                                         const TransferOptions& options) {
  SubprocessOptions spawn;
  spawn.argv = options.BuildArgv(route, remote_user, remote_host);
  spawn.cancel = cancel_;
  spawn.on_line = [this](std::string_view line) { log_.Info(line); };

  TransferOutcome outcome;
  const auto started = std::chrono::steady_clock::now();
  try {
    const auto result = RunSubprocess(spawn);
    outcome.exit_code = result.exit_code;
    if (result.cancelled) {
      outcome.status = TransferStatus::kInterrupted;
    } else {
      outcome.status = result.exit_code == 0 ? TransferStatus::kSucceeded : TransferStatus::kFailed;
    }
  } catch (const Error& err) {
    log_.Error(err.what());
    outcome.status = TransferStatus::kFailed;
    outcome.exit_code = kTransferSpawnFailedExitCode;
  }
  outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return outcome;
}

}  // namespace tsync::orchestrator
