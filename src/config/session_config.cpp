#include "tsync/config/session_config.h"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <limits>
#include <system_error>

#include "tsync/common.h"
#include "tsync/error.h"

namespace tsync::config {
namespace {

constexpr std::array<std::string_view, 13> kKnownKeys = {
    keys::kRemoteUser,   keys::kRemoteHost,    keys::kRoutesFile,     keys::kLogFile,
    keys::kLockFile,     keys::kLockTimeout,   keys::kSshKey,         keys::kProbeAttempts,
    keys::kProbeTimeout, keys::kProbeInterval, keys::kTransferTool,   keys::kTransferTimeout,
    keys::kAuditDir};

std::string_view StripQuotes(std::string_view value) {
  if (value.size() >= 2) {
    const char first = value.front();
    if ((first == '"' || first == '\'') && value.back() == first) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

const std::string* Find(const Settings& settings, std::string_view key) {
  auto it = settings.find(key);
  if (it == settings.end()) {
    return nullptr;
  }
  return &it->second;
}

std::uint64_t ParseNumber(const Settings& settings, std::string_view key, std::uint64_t fallback,
                          bool allow_zero) {
  const std::string* raw = Find(settings, key);
  if (!raw) {
    return fallback;
  }
  const std::string_view text = TrimView(*raw);
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(key) + " must be a non-negative integer, got '" + *raw + "'"};
  }
  if (value == 0 && !allow_zero) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(key) + " must be greater than zero"};
  }
  return value;
}

std::chrono::seconds ParseSeconds(const Settings& settings, std::string_view key,
                                  std::chrono::seconds fallback, bool allow_zero) {
  const auto value = ParseNumber(settings, key, static_cast<std::uint64_t>(fallback.count()),
                                 allow_zero);
  if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(key) + " is out of range"};
  }
  return std::chrono::seconds(static_cast<std::chrono::seconds::rep>(value));
}

void AssignString(const Settings& settings, std::string_view key, std::string& out) {
  if (const std::string* raw = Find(settings, key)) {
    out = *raw;
  }
}

void AssignPath(const Settings& settings, std::string_view key, std::filesystem::path& out) {
  if (const std::string* raw = Find(settings, key); raw && !raw->empty()) {
    out = *raw;
  }
}

}  // namespace

void SessionConfig::RequireSessionKeys() const {
  std::vector<std::string> missing;
  if (remote_user.empty()) {
    missing.emplace_back(keys::kRemoteUser);
  }
  if (remote_host.empty()) {
    missing.emplace_back(keys::kRemoteHost);
  }
  if (routes_file.empty()) {
    missing.emplace_back(keys::kRoutesFile);
  }
  if (missing.empty()) {
    return;
  }
  std::string message = "Missing required configuration:";
  for (const auto& key : missing) {
    message.push_back(' ');
    message.append(key);
  }
  throw Error{ErrorDomain::Config, errors::config::kMissingKey, std::move(message),
              std::nullopt, Retryability::kFatal, std::move(missing)};
}

std::filesystem::path SessionConfig::AuditDirectory() const {
  if (!audit_dir.empty()) {
    return audit_dir;
  }
  return log_file.parent_path() / "audit";
}

Settings ParseEnvironmentFile(std::string_view content) {
  Settings settings;
  while (!content.empty()) {
    const auto newline = content.find('\n');
    std::string_view line = content.substr(0, newline);
    content = newline == std::string_view::npos ? std::string_view{} : content.substr(newline + 1);

    line = TrimView(line);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    if (line.starts_with("export ")) {
      line = TrimView(line.substr(7));
    }
    const auto equals = line.find('=');
    if (equals == std::string_view::npos || equals == 0) {
      continue;
    }
    const std::string_view key = TrimView(line.substr(0, equals));
    const std::string_view value = StripQuotes(TrimView(line.substr(equals + 1)));
    settings.insert_or_assign(std::string(key), std::string(value));
  }
  return settings;
}

Settings ReadEnvironmentFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int saved = errno;
    throw Error{ErrorDomain::Config, errors::config::kEnvFileUnreadable,
                "Cannot read environment file: " + PathToUtf8String(path), saved};
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  return ParseEnvironmentFile(content);
}

Settings CaptureProcessEnvironment() {
  Settings settings;
  for (auto key : kKnownKeys) {
    const std::string name(key);
    if (const char* value = std::getenv(name.c_str())) {
      settings.insert_or_assign(name, std::string(value));
    }
  }
  return settings;
}

void MergeSettings(Settings& base, const Settings& overlay) {
  for (const auto& [key, value] : overlay) {
    base.insert_or_assign(key, value);
  }
}

SessionConfig BuildSessionConfig(const Settings& settings) {
  SessionConfig config;
  AssignString(settings, keys::kRemoteUser, config.remote_user);
  AssignString(settings, keys::kRemoteHost, config.remote_host);
  AssignPath(settings, keys::kRoutesFile, config.routes_file);
  AssignPath(settings, keys::kLogFile, config.log_file);
  AssignPath(settings, keys::kLockFile, config.lock_file);
  AssignPath(settings, keys::kSshKey, config.ssh_key);
  AssignPath(settings, keys::kAuditDir, config.audit_dir);
  if (const std::string* tool = Find(settings, keys::kTransferTool); tool && !tool->empty()) {
    config.transfer_tool = *tool;
  }

  config.lock_timeout = ParseSeconds(settings, keys::kLockTimeout, config.lock_timeout, true);
  config.probe_timeout = ParseSeconds(settings, keys::kProbeTimeout, config.probe_timeout, false);
  config.probe_interval = ParseSeconds(settings, keys::kProbeInterval, config.probe_interval, true);
  config.transfer_timeout =
      ParseSeconds(settings, keys::kTransferTimeout, config.transfer_timeout, false);
  const auto attempts = ParseNumber(settings, keys::kProbeAttempts, config.probe_max_attempts, false);
  if (attempts > 1000) {
    throw Error{ErrorDomain::Config, errors::config::kInvalidValue,
                std::string(keys::kProbeAttempts) + " is out of range"};
  }
  config.probe_max_attempts = static_cast<std::uint32_t>(attempts);
  return config;
}

SessionConfig LoadSessionConfig(const std::optional<std::filesystem::path>& env_file,
                                const Settings& overrides) {
  Settings merged;
  if (env_file) {
    merged = ReadEnvironmentFile(*env_file);
  } else {
    const std::filesystem::path fallback{std::string(kDefaultEnvironmentFile)};
    std::error_code ec;
    if (std::filesystem::is_regular_file(fallback, ec)) {
      merged = ReadEnvironmentFile(fallback);
    }
  }
  MergeSettings(merged, CaptureProcessEnvironment());
  MergeSettings(merged, overrides);
  return BuildSessionConfig(merged);
}

}  // namespace tsync::config
