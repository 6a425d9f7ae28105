#include "tsync/orchestrator/session_log.h"

#include <ctime>
#include <regex>
#include <thread>

#include "tsync/error.h"
#include "test_support.h"

namespace {

using namespace tsync::orchestrator;
using tsync_test::Expect;
using tsync_test::ReadFile;
using tsync_test::TempDir;

const std::regex kLinePattern(
    R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] \[(INFO|WARN|ERROR|SUCCESS)\] .*$)");

std::vector<std::string> Lines(const std::string& text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    const auto end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

void TestLineFormat() {
  std::tm tm{};
  tm.tm_year = 2024 - 1900;
  tm.tm_mon = 2;
  tm.tm_mday = 5;
  tm.tm_hour = 7;
  tm.tm_min = 8;
  tm.tm_sec = 9;
  tm.tm_isdst = -1;
  const auto when = std::chrono::system_clock::from_time_t(std::mktime(&tm));
  Expect(SessionLog::FormatLine(LogLevel::kSuccess, "done", when) ==
             "[2024-03-05 07:08:09] [SUCCESS] done\n",
         "local timestamp and level");

  TempDir dir("tsync_log_");
  SessionLog log(dir.path() / "nested" / "sync.log", false);
  log.Info("one");
  log.Warn("two");
  log.Error("three");
  log.Success("four");
  const auto lines = Lines(ReadFile(log.path()));
  Expect(lines.size() == 4, "four lines");
  for (const auto& line : lines) {
    Expect(std::regex_match(line, kLinePattern), "well-formed line");
  }
  Expect(lines[1].find("] [WARN] two") != std::string::npos, "warn level");
  Expect(log.Size() == ReadFile(log.path()).size(), "size matches file");
}

void TestMultiLineMessagesSplit() {
  TempDir dir("tsync_log_");
  SessionLog log(dir.path() / "sync.log", false);
  log.Error("first\r\nsecond\n\nthird\n");
  const auto lines = Lines(ReadFile(log.path()));
  Expect(lines.size() == 3, "one entry per non-empty line");
  Expect(lines[0].find("[ERROR] first") != std::string::npos, "first part");
  Expect(lines[0].back() == 't', "carriage return stripped");
  Expect(lines[2].find("[ERROR] third") != std::string::npos, "each part keeps the level");
}

void TestTailAndClear() {
  TempDir dir("tsync_log_");
  SessionLog log(dir.path() / "sync.log", false);
  for (int i = 0; i < 50; ++i) {
    log.Info("line " + std::to_string(i));
  }
  const auto tail = log.Tail(5);
  Expect(tail.size() == 5, "tail size");
  Expect(tail.front().find("line 45") != std::string::npos, "tail starts at the right line");
  Expect(tail.back().find("line 49") != std::string::npos, "tail ends at the newest line");

  log.Clear("Logs cleared via monitoring interface");
  const auto after = Lines(log.ReadAll());
  Expect(after.size() == 1, "clear leaves only the note");
  Expect(after[0].find("[INFO] Logs cleared via monitoring interface") != std::string::npos,
         "clear note");

  log.Info("next");
  Expect(Lines(log.ReadAll()).size() == 2, "appends continue after clear");
}

void TestConcurrentWritersNeverInterleave() {
  TempDir dir("tsync_log_");
  const auto path = dir.path() / "sync.log";
  SessionLog shared(path, false);
  SessionLog other(path, false);

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&, t] {
      SessionLog& log = t % 2 == 0 ? shared : other;
      for (int i = 0; i < 200; ++i) {
        log.Info("writer " + std::to_string(t) + " entry " + std::to_string(i) + " " +
                 std::string(64, static_cast<char>('a' + t)));
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }
  const auto lines = Lines(ReadFile(path));
  Expect(lines.size() == 800, "every entry written");
  for (const auto& line : lines) {
    Expect(std::regex_match(line, kLinePattern), "no interleaved line");
  }
}

void TestReadLastLinesByteCap() {
  TempDir dir("tsync_log_");
  const auto path = dir.path() / "sync.log";
  tsync_test::WriteFile(path, "aaaa\nbbbb\ncccc\ndddd\n");
  auto lines = ReadLastLines(path, 0, 12);
  Expect(lines.size() == 2 && lines[0] == "cccc" && lines[1] == "dddd", "partial line dropped");
  lines = ReadLastLines(path, 0, 10);
  Expect(lines.size() == 2 && lines[0] == "cccc", "cut on a line boundary keeps the line");
  lines = ReadLastLines(path, 3, 0);
  Expect(lines.size() == 3 && lines[0] == "bbbb", "line cap");
  Expect(ReadLastLines(dir.path() / "missing.log", 10, 0).empty(), "missing file reads empty");
}

void TestOpenFailure() {
  TempDir dir("tsync_log_");
  const auto blocker = dir.path() / "file";
  tsync_test::WriteFile(blocker, "x");
  try {
    SessionLog log(blocker / "sync.log", false);
    Expect(false, "log below a regular file must fail");
  } catch (const tsync::Error& err) {
    Expect(err.domain == tsync::ErrorDomain::IO, "io domain");
    Expect(err.code == tsync::errors::io::kLogOpenFailed, "open failed code");
  }
}

}  // namespace

int main() {
  TestLineFormat();
  TestMultiLineMessagesSplit();
  TestTailAndClear();
  TestConcurrentWritersNeverInterleave();
  TestReadLastLinesByteCap();
  TestOpenFailure();
  std::cout << "session log tests ok\n";
  return 0;
}
