#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace tsync::orchestrator {

enum class LogLevel { kInfo, kWarn, kError, kSuccess };

std::string_view LogLevelName(LogLevel level) noexcept;

// Append-only, human-readable session log:
//   [YYYY-MM-DD HH:MM:SS] [LEVEL] message
// Each line is written with a single write(2) on an O_APPEND descriptor, so
// concurrent writers never interleave within a line.
class SessionLog {
 public:
  // Opens (creating parent directories) or throws Error{IO, kLogOpenFailed}.
  explicit SessionLog(std::filesystem::path path, bool mirror_to_console = true);
  ~SessionLog();

  SessionLog(const SessionLog&) = delete;
  SessionLog& operator=(const SessionLog&) = delete;

  void Append(LogLevel level, std::string_view message);
  void Info(std::string_view message) { Append(LogLevel::kInfo, message); }
  void Warn(std::string_view message) { Append(LogLevel::kWarn, message); }
  void Error(std::string_view message) { Append(LogLevel::kError, message); }
  void Success(std::string_view message) { Append(LogLevel::kSuccess, message); }

  // Truncates the file, then appends |note| at INFO.
  void Clear(std::string_view note);

  [[nodiscard]] std::vector<std::string> Tail(std::size_t max_lines) const;
  [[nodiscard]] std::string ReadAll() const;
  [[nodiscard]] std::uintmax_t Size() const;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  static std::string FormatLine(LogLevel level, std::string_view message,
                                std::chrono::system_clock::time_point when);

 private:
  void WriteLine(const std::string& line, LogLevel level);

  std::filesystem::path path_;
  bool mirror_{true};
  int fd_{-1};
  std::mutex mutex_;
};

// Free helpers shared with the monitor, which reads logs it did not open.
[[nodiscard]] std::vector<std::string> ReadLastLines(const std::filesystem::path& path,
                                                     std::size_t max_lines,
                                                     std::uintmax_t max_bytes);

}  // namespace tsync::orchestrator
