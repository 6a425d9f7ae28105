#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsync::orchestrator {
class LockResource;
}

namespace tsync::monitor {

enum class SyncState {
  kIdle,
  kRunning,
  kCompletedOk,
  kCompletedWithFailures,
  kAborted,
  kInterrupted
};

std::string_view SyncStateName(SyncState state) noexcept;

struct SyncStatus {
  SyncState state{SyncState::kIdle};
  // Session log timestamp of the newest session start. When a long transfer
  // pushed the start marker out of the scan window, the oldest line of that
  // session still in view.
  std::optional<std::string> last_run_at;
  std::optional<std::size_t> last_success_count;
  std::optional<std::size_t> last_failure_count;
};

// "[timestamp] [LEVEL] message" split into its parts.
struct ParsedLogLine {
  std::string_view timestamp;
  std::string_view level;
  std::string_view message;
};

[[nodiscard]] std::optional<ParsedLogLine> ParseLogLine(std::string_view line);

// Read-only view of session state. Derived from the lock and the session log
// on every call; never writes either.
class StatusReporter {
 public:
  // Bytes read from the end of the log when scanning for markers.
  static constexpr std::uintmax_t kScanWindowBytes = 4 * 1024 * 1024;

  StatusReporter(std::filesystem::path log_file, orchestrator::LockResource& lock);

  [[nodiscard]] SyncStatus Current();

  [[nodiscard]] static SyncStatus Derive(const std::vector<std::string>& lines, bool lock_held);

 private:
  std::filesystem::path log_file_;
  orchestrator::LockResource& lock_;
};

}  // namespace tsync::monitor
