#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tsync {
  enum class ErrorDomain : std::uint16_t {
    Config = 0x01,
    Lock = 0x02,
    Connectivity = 0x03,
    Validation = 0x04,
    Transfer = 0x05,
    Interrupted = 0x06,
    IO = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // errno values and transfer tool exit statuses.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Config:
      return 0x0100;
    case ErrorDomain::Lock:
      return 0x0200;
    case ErrorDomain::Connectivity:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Transfer:
      return 0x0500;
    case ErrorDomain::Interrupted:
      return 0x0600;
    case ErrorDomain::IO:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace config {
      inline constexpr int kMissingKey = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kInvalidValue = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kRoutesFileMissing = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kRoutesFileUnreadable = Make(ErrorDomain::Config, 0x04);
      inline constexpr int kRoutesMalformed = Make(ErrorDomain::Config, 0x05);
      inline constexpr int kRoutesEmpty = Make(ErrorDomain::Config, 0x06);
      inline constexpr int kEnvFileUnreadable = Make(ErrorDomain::Config, 0x07);
    } // namespace config

    namespace lock {
      inline constexpr int kTimeout = Make(ErrorDomain::Lock, 0x01);
      inline constexpr int kOpenFailed = Make(ErrorDomain::Lock, 0x02);
    } // namespace lock

    namespace connectivity {
      inline constexpr int kUnreachable = Make(ErrorDomain::Connectivity, 0x01);
      inline constexpr int kKeyMissing = Make(ErrorDomain::Connectivity, 0x02);
    } // namespace connectivity

    namespace validation {
      inline constexpr int kEmptyPath = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kTraversal = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kNotAbsolute = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kDangerousCharacters = Make(ErrorDomain::Validation, 0x04);
    } // namespace validation

    namespace transfer {
      inline constexpr int kSpawnFailed = Make(ErrorDomain::Transfer, 0x01);
      inline constexpr int kPipeFailed = Make(ErrorDomain::Transfer, 0x02);
    } // namespace transfer

    namespace interrupted {
      inline constexpr int kSignalled = Make(ErrorDomain::Interrupted, 0x01);
    } // namespace interrupted

    namespace io {
      inline constexpr int kLogOpenFailed = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kLogWriteFailed = Make(ErrorDomain::IO, 0x02);
    } // namespace io

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
} // namespace tsync
