#include <charconv>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "tsync/config/session_config.h"
#include "tsync/error.h"
#include "tsync/monitor/monitor_service.h"
#include "tsync/orchestrator/cancellation.h"
#include "tsync/orchestrator/connectivity_probe.h"
#include "tsync/orchestrator/event_bus.h"
#include "tsync/orchestrator/session_lock.h"
#include "tsync/orchestrator/session_log.h"
#include "tsync/orchestrator/sync_orchestrator.h"
#include "tsync/orchestrator/transfer_runner.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitUnavailable = 69;
  constexpr int kExitIO = 74;
  constexpr int kExitTempFail = 75;
  constexpr int kExitConfig = 78;
  constexpr int kExitInterrupted = 130;

  void PrintUsage() {
    std::cerr << "TunnelSync\n";
    std::cerr << "Usage:\n";
    std::cerr << "  tsync [flags] run           Run one sync session\n";
    std::cerr << "  tsync [flags] status        Print the derived session status as JSON\n";
    std::cerr << "  tsync [flags] logs [--tail=N]\n";
    std::cerr << "  tsync [flags] trigger       Start a detached session unless one is running\n";
    std::cerr << "  tsync [flags] clear-logs    Truncate the session log\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --env-file=PATH        KEY=value file (default /etc/environment)\n";
    std::cerr << "  --routes=PATH          Route configuration (ROUTES_FILE)\n";
    std::cerr << "  --log-file=PATH        Session log (SYNC_LOG_FILE)\n";
    std::cerr << "  --lock-file=PATH       Lock file (SYNC_LOCK_FILE)\n";
    std::cerr << "  --lock-timeout=SEC     Lock wait (SYNC_LOCK_TIMEOUT)\n";
    std::cerr << "  --probe-attempts=N     Connectivity attempts (PROBE_MAX_ATTEMPTS)\n";
    std::cerr << "  --probe-timeout=SEC    Per-attempt timeout (PROBE_TIMEOUT)\n";
    std::cerr << "  --probe-interval=SEC   Delay between attempts (PROBE_INTERVAL)\n";
    std::cerr << "  --quiet                Do not mirror the session log to the console\n";
  }

  struct FlagMapping {
    std::string_view flag;
    std::string_view key;
  };

  constexpr FlagMapping kFlagMappings[] = {
      {"--routes=", tsync::config::keys::kRoutesFile},
      {"--log-file=", tsync::config::keys::kLogFile},
      {"--lock-file=", tsync::config::keys::kLockFile},
      {"--lock-timeout=", tsync::config::keys::kLockTimeout},
      {"--probe-attempts=", tsync::config::keys::kProbeAttempts},
      {"--probe-timeout=", tsync::config::keys::kProbeTimeout},
      {"--probe-interval=", tsync::config::keys::kProbeInterval},
  };

  struct GlobalOptions {
    std::optional<std::filesystem::path> env_file;
    tsync::config::Settings overrides;
    bool quiet{false};
    std::vector<std::string> forwarded;  // flags repeated for a triggered session
  };

  std::string_view DomainPrefix(tsync::ErrorDomain domain) {
    switch (domain) {
    case tsync::ErrorDomain::Config:
      return "Configuration error";
    case tsync::ErrorDomain::Lock:
      return "Lock error";
    case tsync::ErrorDomain::Connectivity:
      return "Connectivity error";
    case tsync::ErrorDomain::Validation:
      return "Validation error";
    case tsync::ErrorDomain::Transfer:
      return "Transfer error";
    case tsync::ErrorDomain::Interrupted:
      return "Interrupted";
    case tsync::ErrorDomain::IO:
      return "I/O error";
    case tsync::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const tsync::Error& err) {
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    tsync::orchestrator::Event event;
    event.category = tsync::orchestrator::EventCategory::kDiagnostics;
    event.severity = tsync::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code),
                              tsync::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                tsync::orchestrator::FieldPrivacy::kPublic, true);
    }
    try {
      tsync::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  int ExitCodeFor(const tsync::Error& err) {
    switch (err.domain) {
    case tsync::ErrorDomain::Config:
      return kExitConfig;
    case tsync::ErrorDomain::Lock:
      return kExitTempFail;
    case tsync::ErrorDomain::Connectivity:
      return kExitUnavailable;
    case tsync::ErrorDomain::Validation:
      return kExitUsage;
    case tsync::ErrorDomain::Interrupted:
      return kExitInterrupted;
    case tsync::ErrorDomain::Transfer:
    case tsync::ErrorDomain::IO:
    case tsync::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  // Attaches the HMAC-chained audit journal to the process event bus.
  std::shared_ptr<tsync::orchestrator::JsonLineLogger> AttachJournal(
      const tsync::config::SessionConfig& config) {
    auto journal = std::make_shared<tsync::orchestrator::JsonLineLogger>(
        config.AuditDirectory() / "events.jsonl");
    tsync::orchestrator::EventBus::Instance().Subscribe(
        [journal](const tsync::orchestrator::Event& event) { journal->Log(event); });
    return journal;
  }

  std::vector<std::string> SelfRunCommand(const char* argv0, const GlobalOptions& options) {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    std::vector<std::string> command;
    command.push_back(ec ? std::string(argv0) : self.string());
    command.insert(command.end(), options.forwarded.begin(), options.forwarded.end());
    command.emplace_back("--quiet");
    command.emplace_back("run");
    return command;
  }

  int HandleRun(const GlobalOptions& options) {
    auto config = tsync::config::LoadSessionConfig(options.env_file, options.overrides);
    auto journal = AttachJournal(config);

    tsync::orchestrator::SessionLog log(config.log_file, !options.quiet);
    tsync::orchestrator::CancellationToken cancel;
    tsync::orchestrator::SignalCancellationScope signal_scope(cancel);
    tsync::orchestrator::FileLockResource lock(config.lock_file);
    tsync::orchestrator::SshReachabilityCheck ssh(config.remote_user, config.ssh_key, cancel);
    tsync::orchestrator::RsyncTransferRunner rsync(log, cancel);

    tsync::orchestrator::SyncOrchestrator orchestrator(
        config, tsync::orchestrator::SessionCollaborators{
                    .lock = lock,
                    .reachability = ssh,
                    .transfer = rsync,
                    .log = log,
                    .events = &tsync::orchestrator::EventBus::Instance(),
                    .cancel = cancel,
                });
    const auto report = orchestrator.Run();
    return tsync::orchestrator::ExitCodeFor(report.outcome);
  }

  tsync::monitor::MonitorService MakeMonitor(const char* argv0, const GlobalOptions& options,
                                             tsync::orchestrator::LockResource& lock,
                                             const tsync::config::SessionConfig& config) {
    return tsync::monitor::MonitorService(config, lock, SelfRunCommand(argv0, options),
                                          &tsync::orchestrator::EventBus::Instance());
  }

  std::optional<std::size_t> ParseTail(std::string_view value) {
    std::size_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size() || parsed == 0) {
      return std::nullopt;
    }
    return parsed;
  }

}  // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    GlobalOptions options;
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg == "--quiet") {
        options.quiet = true;
        continue;
      }
      if (arg.rfind("--env-file=", 0) == 0) {
        auto value = arg.substr(std::string_view("--env-file=").size());
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        options.env_file = std::filesystem::path(std::string(value));
        options.forwarded.emplace_back(arg);
        continue;
      }
      bool matched = false;
      for (const auto& mapping : kFlagMappings) {
        if (arg.rfind(mapping.flag, 0) != 0) {
          continue;
        }
        auto value = arg.substr(mapping.flag.size());
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        options.overrides.insert_or_assign(std::string(mapping.key), std::string(value));
        options.forwarded.emplace_back(arg);
        matched = true;
        break;
      }
      if (!matched) {
        PrintUsage();
        return kExitUsage;
      }
    }

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }
    std::string cmd = argv[index++];

    if (cmd == "run") {
      if (index != argc) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleRun(options);
    }

    auto config = tsync::config::LoadSessionConfig(options.env_file, options.overrides);
    tsync::orchestrator::FileLockResource lock(config.lock_file);

    if (cmd == "status") {
      if (index != argc) {
        PrintUsage();
        return kExitUsage;
      }
      auto monitor = MakeMonitor(argv[0], options, lock, config);
      std::cout << monitor.StatusJson() << std::endl;
      return kExitOk;
    }
    if (cmd == "logs") {
      std::optional<std::size_t> tail;
      for (; index < argc; ++index) {
        std::string_view arg = argv[index];
        if (arg.rfind("--tail=", 0) != 0) {
          PrintUsage();
          return kExitUsage;
        }
        tail = ParseTail(arg.substr(std::string_view("--tail=").size()));
        if (!tail) {
          PrintUsage();
          return kExitUsage;
        }
      }
      auto monitor = MakeMonitor(argv[0], options, lock, config);
      std::cout << monitor.Logs(tail);
      return kExitOk;
    }
    if (cmd == "trigger") {
      if (index != argc) {
        PrintUsage();
        return kExitUsage;
      }
      auto journal = AttachJournal(config);
      auto monitor = MakeMonitor(argv[0], options, lock, config);
      const auto response = monitor.Trigger();
      if (response.result == tsync::monitor::TriggerResult::kAlreadyRunning) {
        std::cout << "Sync already running" << std::endl;
        return kExitTempFail;
      }
      std::cout << "Sync started (pid " << response.pid << ")" << std::endl;
      return kExitOk;
    }
    if (cmd == "clear-logs") {
      if (index != argc) {
        PrintUsage();
        return kExitUsage;
      }
      auto journal = AttachJournal(config);
      auto monitor = MakeMonitor(argv[0], options, lock, config);
      monitor.ClearLogs();
      std::cout << "Logs cleared" << std::endl;
      return kExitOk;
    }

    PrintUsage();
    return kExitUsage;
  } catch (const tsync::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
