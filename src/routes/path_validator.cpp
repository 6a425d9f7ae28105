#include "tsync/routes/path_validator.h"

#include "tsync/error.h"
#include "tsync/errors.h"

namespace tsync::routes {
namespace {

constexpr std::string_view kDangerousCharacters = ";&|`$()";

[[noreturn]] void ThrowValidation(int code, std::string_view reason, PathRole role,
                                  std::string_view path) {
  std::string message(reason);
  message.append(" in ");
  message.append(PathRoleName(role));
  message.append(" path: ");
  message.append(path);
  throw Error{ErrorDomain::Validation, code, std::move(message)};
}

}  // namespace

std::string_view PathRoleName(PathRole role) noexcept {
  switch (role) {
  case PathRole::kSource:
    return "source";
  case PathRole::kDestination:
    return "destination";
  }
  return "unknown";
}

std::string PathValidator::Validate(std::string_view path, PathRole role) {
  if (path.empty()) {
    ThrowValidation(errors::validation::kEmptyPath, errors::msg::kEmptyPath, role, path);
  }
  if (path.find("../") != std::string_view::npos || path.find("..\\") != std::string_view::npos) {
    ThrowValidation(errors::validation::kTraversal, errors::msg::kDirectoryTraversal, role, path);
  }
  if (role == PathRole::kSource && path.front() != '/') {
    ThrowValidation(errors::validation::kNotAbsolute, errors::msg::kSourceMustBeAbsolute, role,
                    path);
  }
  if (path.find_first_of(kDangerousCharacters) != std::string_view::npos) {
    ThrowValidation(errors::validation::kDangerousCharacters, errors::msg::kDangerousCharacters,
                    role, path);
  }
  return Normalize(path);
}

std::string PathValidator::Normalize(std::string_view path) {
  std::string normalized;
  normalized.reserve(path.size());
  for (char ch : path) {
    if (ch == '/' && !normalized.empty() && normalized.back() == '/') {
      continue;
    }
    normalized.push_back(ch);
  }
  if (!normalized.empty() && normalized.back() == '/') {
    normalized.pop_back();
  }
  if (normalized.empty()) {
    normalized = "/";
  }
  return normalized;
}

}  // namespace tsync::routes
