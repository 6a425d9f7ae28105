#pragma once

#include <string_view>

namespace tsync::errors::msg {
inline constexpr std::string_view kEmptyPath{"Empty path not allowed"};
inline constexpr std::string_view kDirectoryTraversal{"Directory traversal detected"};
inline constexpr std::string_view kSourceMustBeAbsolute{"Source path must be absolute"};
inline constexpr std::string_view kDangerousCharacters{"Potentially dangerous characters in path"};
inline constexpr std::string_view kRoutesFileNotFound{"Routes file not found"};
inline constexpr std::string_view kRoutesFileNotReadable{"Routes file not readable"};
inline constexpr std::string_view kInvalidRoutesJson{"Invalid JSON in routes file"};
inline constexpr std::string_view kRoutesNotObject{"Routes file must contain a JSON object"};
inline constexpr std::string_view kRouteValueNotString{"Route destination must be a string"};
inline constexpr std::string_view kNoRoutes{"No valid routes found"};
inline constexpr std::string_view kLockTimeout{"Another sync instance is running or lock timeout exceeded"};
inline constexpr std::string_view kLockOpenFailed{"Failed to open lock file"};
inline constexpr std::string_view kSshKeyMissing{"SSH private key not found"};
inline constexpr std::string_view kRemoteUnreachable{"Remote host unreachable"};
inline constexpr std::string_view kSpawnFailed{"Failed to start subprocess"};
inline constexpr std::string_view kInterrupted{"Sync interrupted by signal"};
inline constexpr std::string_view kLogOpenFailed{"Failed to open session log"};
inline constexpr std::string_view kLogWriteFailed{"Failed to append to session log"};
}  // namespace tsync::errors::msg
