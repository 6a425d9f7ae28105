#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tsync::config {

// KEY -> raw string value, as read from an environment file, the process
// environment or command line flags.
using Settings = std::map<std::string, std::string, std::less<>>;

namespace keys {
inline constexpr std::string_view kRemoteUser{"REMOTE_USER"};
inline constexpr std::string_view kRemoteHost{"REMOTE_HOST"};
inline constexpr std::string_view kRoutesFile{"ROUTES_FILE"};
inline constexpr std::string_view kLogFile{"SYNC_LOG_FILE"};
inline constexpr std::string_view kLockFile{"SYNC_LOCK_FILE"};
inline constexpr std::string_view kLockTimeout{"SYNC_LOCK_TIMEOUT"};
inline constexpr std::string_view kSshKey{"SSH_KEY_PATH"};
inline constexpr std::string_view kProbeAttempts{"PROBE_MAX_ATTEMPTS"};
inline constexpr std::string_view kProbeTimeout{"PROBE_TIMEOUT"};
inline constexpr std::string_view kProbeInterval{"PROBE_INTERVAL"};
inline constexpr std::string_view kTransferTool{"TRANSFER_TOOL"};
inline constexpr std::string_view kTransferTimeout{"TRANSFER_TIMEOUT"};
inline constexpr std::string_view kAuditDir{"AUDIT_LOG_DIR"};
}  // namespace keys

inline constexpr std::string_view kDefaultEnvironmentFile{"/etc/environment"};

struct SessionConfig {
  std::string remote_user;
  std::string remote_host;
  std::filesystem::path routes_file;
  std::filesystem::path log_file{"/config/logs/sync.log"};
  std::filesystem::path lock_file{"/var/lock/sync_script.lock"};
  std::chrono::seconds lock_timeout{300};
  std::filesystem::path ssh_key{"/.ssh/id_rsa"};
  std::uint32_t probe_max_attempts{3};
  std::chrono::seconds probe_timeout{15};
  std::chrono::seconds probe_interval{10};
  std::string transfer_tool{"rsync"};
  std::chrono::seconds transfer_timeout{3600};
  std::filesystem::path audit_dir;

  // Throws Error{Config, kMissingKey} when REMOTE_USER, REMOTE_HOST or
  // ROUTES_FILE is unset. Monitor commands only need the log and lock paths.
  void RequireSessionKeys() const;

  [[nodiscard]] std::filesystem::path AuditDirectory() const;
};

// Parses KEY=value lines. "export " prefixes, blank lines and '#' comments are
// skipped; one level of matching single or double quotes is stripped.
[[nodiscard]] Settings ParseEnvironmentFile(std::string_view content);

// Reads and parses an environment file. Throws Error{Config,
// kEnvFileUnreadable} when the file is missing or cannot be read.
[[nodiscard]] Settings ReadEnvironmentFile(const std::filesystem::path& path);

// Known keys present in the process environment.
[[nodiscard]] Settings CaptureProcessEnvironment();

// Applies |overlay| on top of |base|.
void MergeSettings(Settings& base, const Settings& overlay);

// Starts from the defaults above and applies every known key. Throws
// Error{Config, kInvalidValue} on malformed numbers.
[[nodiscard]] SessionConfig BuildSessionConfig(const Settings& settings);

// defaults < env file < process environment < |overrides|. |env_file| unset
// means the default file, used only when it exists.
[[nodiscard]] SessionConfig LoadSessionConfig(const std::optional<std::filesystem::path>& env_file,
                                              const Settings& overrides);

}  // namespace tsync::config
