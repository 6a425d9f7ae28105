#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tsync::monitor {

struct LogReadOptions {
  std::size_t max_lines{10000};
  std::uintmax_t max_bytes{500ull * 1024 * 1024};
  std::size_t max_errors_shown{15};
  std::size_t max_summary_chars{2000};
};

struct ErrorSummary {
  struct Entry {
    std::size_t line_number;  // 1-based within the lines that were read
    std::string text;
  };

  std::size_t total{0};
  std::vector<Entry> shown;
};

struct LogView {
  bool exists{false};
  std::uintmax_t size_bytes{0};
  // Only the trailing max_bytes were read.
  bool byte_truncated{false};
  // Lines read before the max_lines cap was applied.
  std::size_t total_lines{0};
  std::vector<std::string> lines;
  ErrorSummary errors;
};

// True when |line| contains one of the error keywords, case-insensitively.
[[nodiscard]] bool IsErrorLine(std::string_view line);

[[nodiscard]] ErrorSummary SummarizeErrors(const std::vector<std::string>& lines,
                                           std::size_t max_shown);

class LogReader {
 public:
  explicit LogReader(std::filesystem::path path, LogReadOptions options = {});

  // |tail| narrows the displayed lines further; the error summary always covers
  // everything that was read.
  [[nodiscard]] LogView Read(std::optional<std::size_t> tail = std::nullopt) const;

  // Summary banner, truncation banner and lines, ready for display.
  [[nodiscard]] std::string Render(const LogView& view) const;

 private:
  std::filesystem::path path_;
  LogReadOptions options_;
};

}  // namespace tsync::monitor
