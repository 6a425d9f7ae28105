#include "tsync/monitor/log_reader.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>

#include "tsync/orchestrator/session_log.h"

namespace tsync::monitor {
namespace {

// Upper-cased, matched against an upper-cased line. "ERROR:" also covers "Error:".
constexpr std::array<std::string_view, 7> kErrorKeywords = {
    "[ERROR]", "[CRITICAL]", "ERROR:", "CRITICAL:", "FAILED", "EXCEPTION:", "TRACEBACK"};

const std::string kRule(50, '=');

std::string ToUpper(std::string_view text) {
  std::string upper(text);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  return upper;
}

}  // namespace

bool IsErrorLine(std::string_view line) {
  const std::string upper = ToUpper(line);
  return std::any_of(kErrorKeywords.begin(), kErrorKeywords.end(), [&upper](std::string_view key) {
    return upper.find(key) != std::string::npos;
  });
}

ErrorSummary SummarizeErrors(const std::vector<std::string>& lines, std::size_t max_shown) {
  ErrorSummary summary;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (!IsErrorLine(lines[i])) {
      continue;
    }
    ++summary.total;
    if (summary.shown.size() < max_shown) {
      summary.shown.push_back(ErrorSummary::Entry{i + 1, lines[i]});
    }
  }
  return summary;
}

LogReader::LogReader(std::filesystem::path path, LogReadOptions options)
    : path_(std::move(path)), options_(options) {}

LogView LogReader::Read(std::optional<std::size_t> tail) const {
  LogView view;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path_, ec)) {
    return view;
  }
  view.exists = true;
  view.size_bytes = std::filesystem::file_size(path_, ec);
  if (ec) {
    view.size_bytes = 0;
  }
  view.byte_truncated = view.size_bytes > options_.max_bytes;

  auto lines = orchestrator::ReadLastLines(path_, 0, options_.max_bytes);
  view.total_lines = lines.size();
  view.errors = SummarizeErrors(lines, options_.max_errors_shown);

  std::size_t keep = options_.max_lines;
  if (tail) {
    keep = std::min(keep, *tail);
  }
  if (lines.size() > keep) {
    lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(keep));
  }
  view.lines = std::move(lines);
  return view;
}

std::string LogReader::Render(const LogView& view) const {
  if (!view.exists) {
    return "Log file not found\n";
  }
  std::string summary;
  if (view.errors.total == 0) {
    summary = "ERROR SUMMARY: No errors found\n" + kRule + "\n\n";
  } else {
    summary = "ERROR SUMMARY: " + std::to_string(view.errors.total) +
              (view.errors.total == 1 ? " error found" : " errors found");
    if (view.byte_truncated) {
      summary += " (in displayed portion)";
    }
    summary += "\n" + kRule + "\n";
    for (std::size_t i = 0; i < view.errors.shown.size(); ++i) {
      const auto& entry = view.errors.shown[i];
      if (i > 0) {
        summary.push_back('\n');
      }
      summary += "Line " + std::to_string(entry.line_number) + ": " + entry.text;
    }
    if (view.errors.total > view.errors.shown.size()) {
      summary += "\n... and " + std::to_string(view.errors.total - view.errors.shown.size()) +
                 " more errors (see full log below)";
    }
    summary += "\n" + kRule + "\n\n";
    if (summary.size() > options_.max_summary_chars && options_.max_summary_chars > 100) {
      summary.resize(options_.max_summary_chars - 100);
      summary += "\n[ERROR SUMMARY TRUNCATED - too many errors]\n" + kRule + "\n\n";
    }
  }

  std::string out = std::move(summary);
  if (view.byte_truncated) {
    out += "[LOG TRUNCATED - showing last " + std::to_string(options_.max_bytes) + " bytes]\n";
  } else if (view.lines.size() < view.total_lines) {
    out += "[LOG TRUNCATED - showing last " + std::to_string(view.lines.size()) + " lines]\n";
  }
  for (const auto& line : view.lines) {
    out += line;
    out.push_back('\n');
  }
  return out;
}

}  // namespace tsync::monitor
