#include "tsync/orchestrator/event_bus.h"

#include <atomic>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <new>
#include <optional>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include "tsync/common.h"

namespace tsync::orchestrator {
namespace {

struct EventBusSingletonStorage {
  std::once_flag once;
  std::unique_ptr<EventBus> instance;

  void Reset() {
    instance.reset();
    this->~EventBusSingletonStorage();
    new (this) EventBusSingletonStorage();
  }
};

std::mutex& EventBusSingletonMutex() {
  static std::mutex mutex;
  return mutex;
}

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

// Exclusive flock on the journal's lock file, held for one read or append.
class JournalFileLock {
 public:
  explicit JournalFileLock(const std::filesystem::path& path) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd_ < 0) {
      error_ = errno;
      return;
    }
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno == EINTR) {
        continue;
      }
      error_ = errno;
      ::close(fd_);
      fd_ = -1;
      return;
    }
  }

  JournalFileLock(const JournalFileLock&) = delete;
  JournalFileLock& operator=(const JournalFileLock&) = delete;

  ~JournalFileLock() {
    if (fd_ >= 0) {
      ::flock(fd_, LOCK_UN);
      ::close(fd_);
    }
  }

  [[nodiscard]] bool locked() const noexcept { return fd_ >= 0; }
  [[nodiscard]] int error() const noexcept { return error_; }

 private:
  int fd_{-1};
  int error_{0};
};

void ReportLockFailure(const JournalFileLock& lock) {
  std::clog << "{\"event\":\"logger_error\",\"message\":\"audit lock unavailable\","
               "\"error_code\":"
            << lock.error() << "}" << std::endl;
}

constexpr std::size_t kMaxEventBytes = 16 * 1024;
constexpr std::size_t kDefaultMaxBytes = 10 * 1024 * 1024;
constexpr std::string_view kRedacted = "[redacted]";

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

template <std::size_t N>
std::string HexEncode(const std::array<std::uint8_t, N>& bytes) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (std::uint8_t byte : bytes) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

template <std::size_t N>
bool HexDecode(std::string_view text, std::array<std::uint8_t, N>& out) {
  if (text.size() != N * 2) {
    return false;
  }
  auto nibble = [](char ch) -> int {
    if (ch >= '0' && ch <= '9') {
      return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
      return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
      return 10 + (ch - 'A');
    }
    return -1;
  };
  for (std::size_t i = 0; i < N; ++i) {
    const int high = nibble(text[i * 2]);
    const int low = nibble(text[i * 2 + 1]);
    if (high < 0 || low < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((high << 4) | low);
  }
  return true;
}

std::array<std::uint8_t, JsonLineLogger::kMacSize> ComputeChainedMac(
    const std::array<std::uint8_t, JsonLineLogger::kMacSize>& key,
    const std::array<std::uint8_t, JsonLineLogger::kMacSize>& previous,
    std::uint64_t previous_count, std::uint64_t sequence, std::string_view canonical) {
  const std::uint64_t sequence_be = ToBigEndian(sequence);
  const std::uint64_t previous_be = ToBigEndian(previous_count);
  std::vector<std::uint8_t> buffer;
  buffer.reserve(previous.size() + sizeof(sequence_be) + sizeof(previous_be) + canonical.size());
  buffer.insert(buffer.end(), previous.begin(), previous.end());
  const auto* previous_bytes = reinterpret_cast<const std::uint8_t*>(&previous_be);
  buffer.insert(buffer.end(), previous_bytes, previous_bytes + sizeof(previous_be));
  const auto* seq_bytes = reinterpret_cast<const std::uint8_t*>(&sequence_be);
  buffer.insert(buffer.end(), seq_bytes, seq_bytes + sizeof(sequence_be));
  buffer.insert(buffer.end(), canonical.begin(), canonical.end());

  std::array<std::uint8_t, JsonLineLogger::kMacSize> mac{};
  unsigned int mac_len = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), buffer.data(), buffer.size(),
            mac.data(), &mac_len) ||
      mac_len != mac.size()) {
    mac.fill(0);
  }
  return mac;
}

std::string BuildEventJson(const Event& event, const std::string& timestamp) {
  std::string payload = "{\"ts\":\"" + EscapeJson(timestamp) + "\"";
  payload += ",\"severity\":\"";
  payload += SeverityToString(event.severity);
  payload += "\",\"category\":\"";
  payload += CategoryToString(event.category);
  payload += "\"";
  if (!event.event_id.empty()) {
    payload += ",\"event_id\":\"" + EscapeJson(event.event_id) + "\"";
  }
  if (!event.message.empty()) {
    payload += ",\"message\":\"" + EscapeJson(event.message) + "\"";
  }
  if (!event.fields.empty()) {
    payload += ",\"fields\":{";
    bool first = true;
    for (const auto& field : event.fields) {
      if (!first) {
        payload.push_back(',');
      }
      first = false;
      payload += "\"" + EscapeJson(field.key) + "\":";
      switch (field.privacy) {
      case FieldPrivacy::kRedact:
        payload += "\"" + std::string(kRedacted) + "\"";
        break;
      case FieldPrivacy::kHash:
        payload += "\"hash:" + HashForTelemetry(field.value) + "\"";
        break;
      case FieldPrivacy::kPublic:
        if (field.numeric) {
          payload += field.value.empty() ? std::string("0") : field.value;
        } else {
          payload += "\"" + EscapeJson(field.value) + "\"";
        }
        break;
      }
    }
    payload += "}";
  }
  payload += "}";
  return payload;
}

// Returns the digits following |marker|, or nullopt.
std::optional<std::uint64_t> ParseCounter(std::string_view line, std::string_view marker,
                                          std::size_t from = 0) {
  auto pos = line.find(marker, from);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  pos += marker.size();
  std::size_t end = pos;
  while (end < line.size() && std::isdigit(static_cast<unsigned char>(line[end]))) {
    ++end;
  }
  std::uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(line.data() + pos, line.data() + end, value);
  if (end == pos || ec != std::errc() || ptr != line.data() + end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  std::array<std::uint8_t, 32> digest{};
  unsigned int digest_len = 0;
  if (EVP_Digest(input.data(), input.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) !=
          1 ||
      digest_len != digest.size()) {
    return "";
  }
  return HexEncode(digest);
}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path, std::size_t max_bytes)
    : log_path_(std::move(log_path)),
      key_path_(log_path_.string() + ".key"),
      lock_path_(log_path_.string() + ".lock"),
      max_bytes_(max_bytes == 0 ? ResolveMaxBytes() : max_bytes) {
  std::error_code ec;
  if (log_path_.has_parent_path()) {
    std::filesystem::create_directories(log_path_.parent_path(), ec);
  }
  std::lock_guard<std::mutex> guard(mutex_);
  JournalFileLock file_lock(lock_path_);
  if (!file_lock.locked()) {
    ReportLockFailure(file_lock);
  }
  if (ParseLog(last_mac_, entry_counter_)) {
    RecordJournalIdentity();
  } else {
    std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"audit chain verification "
                 "failed on open\",\"path\":\""
              << EscapeJson(PathToUtf8String(log_path_)) << "\"}" << std::endl;
    integrity_ok_ = false;
  }
}

std::size_t JsonLineLogger::ResolveMaxBytes() {
  if (const char* env = std::getenv("TSYNC_AUDIT_LOG_MAX_SIZE")) {
    std::size_t value = 0;
    const std::string_view text(env);
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec == std::errc() && ptr == text.data() + text.size() && value > 0) {
      return value;
    }
  }
  return kDefaultMaxBytes;
}

void JsonLineLogger::EnsureKey() {
  if (key_loaded_) {
    return;
  }
  std::ifstream in(key_path_);
  if (in) {
    std::string hex;
    std::getline(in, hex);
    if (HexDecode(TrimView(hex), hmac_key_)) {
      key_loaded_ = true;
      return;
    }
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit key unreadable\"}" << std::endl;
    return;
  }
  if (RAND_bytes(hmac_key_.data(), static_cast<int>(hmac_key_.size())) != 1) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit key generation failed\"}"
              << std::endl;
    return;
  }
  {
    std::ofstream out(key_path_, std::ios::out | std::ios::trunc);
    out << HexEncode(hmac_key_) << '\n';
    if (!out) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit key write failed\"}"
                << std::endl;
      OPENSSL_cleanse(hmac_key_.data(), hmac_key_.size());
      return;
    }
  }
  ::chmod(key_path_.c_str(), S_IRUSR | S_IWUSR);
  key_loaded_ = true;
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

bool JsonLineLogger::ParseLog(Mac& mac, std::uint64_t& sequence) {
  EnsureKey();
  if (!key_loaded_) {
    return false;
  }
  std::ifstream in(log_path_);
  if (!in) {
    mac.fill(0);
    sequence = 0;
    return true;
  }
  constexpr std::string_view kMacMarker = ",\"audit_mac\":\"";
  constexpr std::string_view kSeqMarker = "\"audit_seq\":";
  constexpr std::string_view kPrevMarker = "\"audit_prev_count\":";

  Mac previous{};
  std::uint64_t seq = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    if (line.size() > kMaxEventBytes * 2) {
      return false;
    }
    const std::string_view view(line);
    const auto mac_pos = view.find(kMacMarker);
    if (mac_pos == std::string_view::npos) {
      return false;
    }
    const auto mac_start = mac_pos + kMacMarker.size();
    const auto mac_end = view.find('"', mac_start);
    if (mac_end == std::string_view::npos) {
      return false;
    }
    Mac parsed{};
    if (!HexDecode(view.substr(mac_start, mac_end - mac_start), parsed)) {
      return false;
    }
    const auto parsed_prev = ParseCounter(view, kPrevMarker);
    const auto parsed_seq = ParseCounter(view, kSeqMarker);
    if (!parsed_prev || !parsed_seq || *parsed_prev != seq || *parsed_seq != seq + 1) {
      return false;
    }
    std::string canonical(view.substr(0, mac_pos));
    canonical.push_back('}');
    const auto expected = ComputeChainedMac(hmac_key_, previous, seq, seq + 1, canonical);
    if (CRYPTO_memcmp(expected.data(), parsed.data(), expected.size()) != 0) {
      return false;
    }
    previous = expected;
    ++seq;
  }
  if (in.bad()) {
    return false;
  }
  mac = previous;
  sequence = seq;
  return true;
}

void JsonLineLogger::RecordJournalIdentity() {
  struct stat st {};
  if (::stat(log_path_.c_str(), &st) != 0) {
    identity_ = JournalIdentity{};
    return;
  }
  identity_ = JournalIdentity{true, static_cast<std::uint64_t>(st.st_dev),
                              static_cast<std::uint64_t>(st.st_ino),
                              static_cast<std::uint64_t>(st.st_size)};
}

// Brings last_mac_ and entry_counter_ up to date with entries other writers
// appended. Must run under the journal file lock. A shrunken or rewritten
// file that is still the same inode counts as tampering.
bool JsonLineLogger::SyncWithJournal(bool force_verify) {
  struct stat st {};
  if (::stat(log_path_.c_str(), &st) != 0) {
    if (errno != ENOENT) {
      return false;
    }
    if (stream_.is_open()) {
      stream_.close();
    }
    if (force_verify && identity_.valid && entry_counter_ != 0) {
      return false;
    }
    last_mac_.fill(0);
    entry_counter_ = 0;
    identity_ = JournalIdentity{};
    return true;
  }
  const bool same_file = identity_.valid &&
                         identity_.device == static_cast<std::uint64_t>(st.st_dev) &&
                         identity_.inode == static_cast<std::uint64_t>(st.st_ino);
  if (!force_verify && same_file && identity_.size == static_cast<std::uint64_t>(st.st_size)) {
    return true;
  }
  if (!same_file && stream_.is_open()) {
    // Another writer rotated the journal out from under our stream.
    stream_.close();
  }
  Mac mac{};
  std::uint64_t sequence = 0;
  if (!ParseLog(mac, sequence)) {
    return false;
  }
  if (same_file && (sequence < entry_counter_ ||
                    (sequence == entry_counter_ && mac != last_mac_))) {
    return false;
  }
  last_mac_ = mac;
  entry_counter_ = sequence;
  RecordJournalIdentity();
  return true;
}

bool JsonLineLogger::VerifyChain() {
  std::lock_guard<std::mutex> guard(mutex_);
  if (stream_.is_open()) {
    stream_.flush();
  }
  JournalFileLock file_lock(lock_path_);
  if (!file_lock.locked()) {
    ReportLockFailure(file_lock);
    return false;
  }
  return SyncWithJournal(true);
}

void JsonLineLogger::RotateIfNeeded(std::size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    current_size = 0;
  }
  if (current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  Mac mac{};
  std::uint64_t sequence = 0;
  if (!ParseLog(mac, sequence) || sequence != entry_counter_ || mac != last_mac_) {
    std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"audit chain verification "
                 "failed before rotation\"}"
              << std::endl;
    integrity_ok_ = false;
    return;
  }
  for (std::size_t idx = kMaxFiles; idx > 0; --idx) {
    const std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    const std::filesystem::path dst(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    if (!std::filesystem::exists(src, rotate_ec)) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log rotate rename failed\","
                   "\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
  // Each file carries its own chain.
  last_mac_.fill(0);
  entry_counter_ = 0;
  identity_ = JournalIdentity{};
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!integrity_ok_) {
    return;
  }
  JournalFileLock file_lock(lock_path_);
  if (!file_lock.locked()) {
    ReportLockFailure(file_lock);
    return;
  }
  EnsureKey();
  if (!key_loaded_) {
    integrity_ok_ = false;
    return;
  }
  if (!SyncWithJournal(false)) {
    std::clog << "{\"event\":\"logger_integrity_failure\",\"message\":\"audit chain changed "
                 "underneath this writer\",\"path\":\""
              << EscapeJson(PathToUtf8String(log_path_)) << "\"}" << std::endl;
    integrity_ok_ = false;
    return;
  }
  const auto base = BuildEventJson(event, FormatUtcTimestamp(std::chrono::system_clock::now()));
  // Rotation restarts the chain, so it happens before the MAC is computed.
  RotateIfNeeded(base.size() + 160);
  if (!integrity_ok_) {
    return;
  }
  const std::uint64_t prev = entry_counter_;
  const std::uint64_t seq = prev + 1;

  std::string prefix = base.substr(0, base.size() - 1);
  prefix.append(",\"audit_prev_count\":");
  prefix.append(std::to_string(prev));
  prefix.append(",\"audit_seq\":");
  prefix.append(std::to_string(seq));
  std::string canonical = prefix;
  canonical.push_back('}');
  const auto mac = ComputeChainedMac(hmac_key_, last_mac_, prev, seq, canonical);
  std::string line = prefix;
  line.append(",\"audit_mac\":\"");
  line.append(HexEncode(mac));
  line.append("\"}");

  EnsureOpen();
  if (!stream_.is_open()) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open audit log\"}"
              << std::endl;
    return;
  }
  stream_ << line << '\n';
  stream_.flush();
  if (!stream_) {
    std::clog << "{\"event\":\"logger_error\",\"message\":\"audit log write failed\"}" << std::endl;
    stream_.close();
    return;
  }
  last_mac_ = mac;
  entry_counter_ = seq;
  RecordJournalIdentity();
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  {
    std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
    std::call_once(storage.once, [&storage]() { storage.instance = std::make_unique<EventBus>(); });
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated =
      current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_,
                             std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(EventBusSingletonMutex());
  storage.Reset();
}

}  // namespace tsync::orchestrator
