#include "tsync/orchestrator/session_log.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <deque>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "tsync/common.h"
#include "tsync/error.h"
#include "tsync/errors.h"

namespace tsync::orchestrator {
namespace {

void ReportLogFailure(const std::filesystem::path& path, int native) {
  std::clog << "{\"event\":\"session_log_failure\",\"path\":\"" << PathToUtf8String(path)
            << "\",\"errno\":" << native << "}" << std::endl;
}

bool WriteFully(int fd, const char* data, std::size_t size) {
  while (size > 0) {
    const ssize_t rc = ::write(fd, data, size);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += rc;
    size -= static_cast<std::size_t>(rc);
  }
  return true;
}

}  // namespace

std::string_view LogLevelName(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  case LogLevel::kSuccess:
    return "SUCCESS";
  }
  return "INFO";
}

SessionLog::SessionLog(std::filesystem::path path, bool mirror_to_console)
    : path_(std::move(path)), mirror_(mirror_to_console) {
  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    const int saved = errno;
    throw tsync::Error{ErrorDomain::IO, errors::io::kLogOpenFailed,
                       std::string(errors::msg::kLogOpenFailed) + ": " + PathToUtf8String(path_) +
                           ": " + std::strerror(saved),
                       saved};
  }
}

SessionLog::~SessionLog() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

std::string SessionLog::FormatLine(LogLevel level, std::string_view message,
                                   std::chrono::system_clock::time_point when) {
  std::string line;
  line.reserve(message.size() + 40);
  line.push_back('[');
  line.append(FormatLocalTimestamp(when));
  line.append("] [");
  line.append(LogLevelName(level));
  line.append("] ");
  line.append(message);
  line.push_back('\n');
  return line;
}

void SessionLog::Append(LogLevel level, std::string_view message) {
  const auto now = std::chrono::system_clock::now();
  // Embedded newlines would break the one-entry-per-line format.
  while (true) {
    const auto newline = message.find('\n');
    std::string_view part = message.substr(0, newline);
    if (!part.empty() && part.back() == '\r') {
      part.remove_suffix(1);
    }
    if (!part.empty() || newline == std::string_view::npos) {
      WriteLine(FormatLine(level, part, now), level);
    }
    if (newline == std::string_view::npos) {
      break;
    }
    message.remove_prefix(newline + 1);
    if (message.empty()) {
      break;
    }
  }
}

void SessionLog::WriteLine(const std::string& line, LogLevel level) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!WriteFully(fd_, line.data(), line.size())) {
    ReportLogFailure(path_, errno);
  }
  if (mirror_) {
    auto& stream = level == LogLevel::kError ? std::cerr : std::cout;
    stream << line << std::flush;
  }
}

void SessionLog::Clear(std::string_view note) {
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (::ftruncate(fd_, 0) != 0) {
      const int saved = errno;
      throw tsync::Error{ErrorDomain::IO, errors::io::kLogWriteFailed,
                         std::string(errors::msg::kLogWriteFailed) + ": " +
                             PathToUtf8String(path_) + ": " + std::strerror(saved),
                         saved};
    }
  }
  Append(LogLevel::kInfo, note);
}

std::vector<std::string> SessionLog::Tail(std::size_t max_lines) const {
  return ReadLastLines(path_, max_lines, 0);
}

std::string SessionLog::ReadAll() const {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    return {};
  }
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::uintmax_t SessionLog::Size() const {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path_, ec);
  return ec ? 0 : size;
}

std::vector<std::string> ReadLastLines(const std::filesystem::path& path, std::size_t max_lines,
                                       std::uintmax_t max_bytes) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return {};
  }
  if (max_bytes > 0) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec && size > max_bytes) {
      in.seekg(static_cast<std::streamoff>(size - max_bytes - 1));
      char before = '\0';
      in.get(before);
      if (before != '\n') {
        std::string partial;
        std::getline(in, partial);  // drop the cut-off first line
      }
    }
  }
  std::deque<std::string> window;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    window.push_back(std::move(line));
    if (max_lines > 0 && window.size() > max_lines) {
      window.pop_front();
    }
  }
  return std::vector<std::string>(std::make_move_iterator(window.begin()),
                                  std::make_move_iterator(window.end()));
}

}  // namespace tsync::orchestrator
