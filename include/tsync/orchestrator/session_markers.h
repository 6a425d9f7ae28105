#pragma once

#include <cstddef>
#include <string>
#include <string_view>

// Session log lines that carry lifecycle meaning. The orchestrator writes them
// and the status reporter reads them back.
namespace tsync::orchestrator::markers {

inline constexpr std::string_view kSessionStarted{"Starting sync process..."};
inline constexpr std::string_view kSummaryPrefix{"Sync process completed - Success: "};
inline constexpr std::string_view kAbortedPrefix{"Sync aborted: "};
inline constexpr std::string_view kInterruptedPrefix{"Sync interrupted"};
inline constexpr std::string_view kSkippedPrefix{"Sync skipped: "};
inline constexpr std::string_view kLogsCleared{"Logs cleared via monitoring interface"};
inline constexpr std::string_view kLegacyLogsCleared{"Logs cleared via web interface"};
inline constexpr std::string_view kAllSucceeded{"All syncs completed successfully"};
inline constexpr std::string_view kSomeFailed{"Some syncs failed. Check logs for details."};

inline std::string Counts(std::size_t success, std::size_t failures) {
  return "Success: " + std::to_string(success) + ", Failures: " + std::to_string(failures);
}

inline std::string Summary(std::size_t success, std::size_t failures) {
  return "Sync process completed - " + Counts(success, failures);
}

inline std::string Interrupted(std::size_t success, std::size_t failures) {
  return std::string(kInterruptedPrefix) + " - " + Counts(success, failures);
}

}  // namespace tsync::orchestrator::markers
