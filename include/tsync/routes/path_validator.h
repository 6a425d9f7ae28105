#pragma once

#include <string>
#include <string_view>

namespace tsync::routes {

enum class PathRole { kSource, kDestination };

std::string_view PathRoleName(PathRole role) noexcept;

class PathValidator {
 public:
  // Returns the normalized path or throws tsync::Error (ErrorDomain::Validation).
  // Rules: non-empty, no "../" or "..\" sequence, absolute when used as a
  // source, none of ; & | ` $ ( ). Normalization collapses repeated '/',
  // strips one trailing '/' and maps an empty result to "/".
  [[nodiscard]] static std::string Validate(std::string_view path, PathRole role);

  [[nodiscard]] static std::string Normalize(std::string_view path);
};

}  // namespace tsync::routes
