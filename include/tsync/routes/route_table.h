#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tsync::routes {

// One directory pair. Strings are kept exactly as declared; validation happens
// per route when the session processes it.
struct RouteEntry {
  std::string source;
  std::string destination;

  bool operator==(const RouteEntry&) const = default;
};

// Ordered, immutable route collection. Declaration order in the JSON object
// is the processing order.
class RouteTable {
 public:
  using const_iterator = std::vector<RouteEntry>::const_iterator;

  // Throws tsync::Error (ErrorDomain::Config) when the file is missing,
  // unreadable, not a JSON object of string values, or has zero entries.
  [[nodiscard]] static RouteTable Load(const std::filesystem::path& file);
  [[nodiscard]] static RouteTable Parse(std::string_view json, std::string_view origin);

  [[nodiscard]] const std::vector<RouteEntry>& entries() const noexcept { return entries_; }
  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  const_iterator begin() const noexcept { return entries_.begin(); }
  const_iterator end() const noexcept { return entries_.end(); }

 private:
  explicit RouteTable(std::vector<RouteEntry> entries) : entries_(std::move(entries)) {}

  std::vector<RouteEntry> entries_;
};

}  // namespace tsync::routes
