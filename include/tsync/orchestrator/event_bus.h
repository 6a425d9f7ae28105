#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tsync::orchestrator {

// Structured event primitives
enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

enum class FieldPrivacy { kPublic, kRedact, kHash };

struct EventField {
  std::string key;
  std::string value;
  FieldPrivacy privacy{FieldPrivacy::kPublic};
  bool numeric{false};

  EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
             bool is_numeric = false)
      : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
};

struct Event {
  EventCategory category{EventCategory::kDiagnostics};
  EventSeverity severity{EventSeverity::kInfo};
  std::string event_id;
  std::string message;
  std::vector<EventField> fields;
};

// Lowercase hex SHA-256 of |input|; empty input yields an empty string.
std::string HashForTelemetry(std::string_view input);

// Append-only JSON-lines audit journal. Every entry carries audit_prev_count,
// audit_seq and an HMAC-SHA256 chained over the previous entry's MAC, so any
// edit, reorder or deletion inside the current file breaks verification.
// Several processes may share one journal: each append holds an exclusive
// flock on "<path>.lock" and re-reads the chain head when the file changed.
class JsonLineLogger {
 public:
  static constexpr std::size_t kMacSize = 32;
  static constexpr std::size_t kMaxFiles = 3;

  // |max_bytes| of 0 reads TSYNC_AUDIT_LOG_MAX_SIZE (default 10 MiB).
  explicit JsonLineLogger(std::filesystem::path log_path, std::size_t max_bytes = 0);

  void Log(const Event& event);

  // Re-reads the journal and checks every MAC and sequence number. Entries
  // appended by other writers since the last call are adopted.
  [[nodiscard]] bool VerifyChain();

  [[nodiscard]] bool healthy() const noexcept { return integrity_ok_; }
  [[nodiscard]] std::uint64_t entry_count() const noexcept { return entry_counter_; }
  [[nodiscard]] const std::filesystem::path& path() const noexcept { return log_path_; }

 private:
  using Mac = std::array<std::uint8_t, kMacSize>;

  // Device, inode and size of the journal as of the last read or append.
  struct JournalIdentity {
    bool valid{false};
    std::uint64_t device{0};
    std::uint64_t inode{0};
    std::uint64_t size{0};
  };

  void EnsureKey();
  void EnsureOpen();
  void RotateIfNeeded(std::size_t incoming_bytes);
  bool ParseLog(Mac& mac, std::uint64_t& sequence);
  bool SyncWithJournal(bool force_verify);
  void RecordJournalIdentity();
  static std::size_t ResolveMaxBytes();

  std::mutex mutex_;
  std::ofstream stream_;
  std::filesystem::path log_path_;
  std::filesystem::path key_path_;
  std::filesystem::path lock_path_;
  std::size_t max_bytes_;
  Mac hmac_key_{};
  Mac last_mac_{};
  std::uint64_t entry_counter_{0};
  JournalIdentity identity_{};
  bool key_loaded_{false};
  bool integrity_ok_{true};
};

// Process-wide synchronous publish/subscribe hub.
class EventBus {
 public:
  using Subscriber = std::function<void(const Event&)>;

  static EventBus& Instance();

  void Publish(const Event& event);
  void Subscribe(Subscriber fn);

  EventBus() = default;

 private:
  using SubscriberList = std::vector<Subscriber>;

  std::shared_ptr<const SubscriberList> subscribers_snapshot_;
  std::mutex subscribers_mutex_;
};

// Drops the singleton so the next Instance() call starts with no subscribers.
void ResetEventBusForTesting();

}  // namespace tsync::orchestrator
