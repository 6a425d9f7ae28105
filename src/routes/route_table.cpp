#include "tsync/routes/route_table.h"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

#include <json/json.h>

#include "tsync/common.h"
#include "tsync/error.h"
#include "tsync/errors.h"

namespace tsync::routes {
namespace {

[[noreturn]] void ThrowConfig(int code, std::string_view reason, std::string_view origin,
                              std::string detail = {}, std::optional<int> native = std::nullopt) {
  std::string message(reason);
  message.append(": ");
  message.append(origin);
  if (!detail.empty()) {
    message.append(" (");
    message.append(detail);
    message.push_back(')');
  }
  throw Error{ErrorDomain::Config, code, std::move(message), native};
}

std::string FirstLine(const std::string& text) {
  auto trimmed = std::string(TrimView(text));
  auto newline = trimmed.find('\n');
  if (newline != std::string::npos) {
    trimmed.resize(newline);
  }
  return trimmed;
}

}  // namespace

RouteTable RouteTable::Load(const std::filesystem::path& file) {
  const std::string origin = PathToUtf8String(file);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    ThrowConfig(errors::config::kRoutesFileMissing, errors::msg::kRoutesFileNotFound, origin);
  }
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    const int saved = errno;
    ThrowConfig(errors::config::kRoutesFileUnreadable, errors::msg::kRoutesFileNotReadable, origin,
                std::generic_category().message(saved), saved);
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    ThrowConfig(errors::config::kRoutesFileUnreadable, errors::msg::kRoutesFileNotReadable, origin);
  }
  return Parse(content, origin);
}

RouteTable RouteTable::Parse(std::string_view json, std::string_view origin) {
  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

  Json::Value root;
  std::string parse_errors;
  if (!reader->parse(json.data(), json.data() + json.size(), &root, &parse_errors)) {
    ThrowConfig(errors::config::kRoutesMalformed, errors::msg::kInvalidRoutesJson, origin,
                FirstLine(parse_errors));
  }
  if (!root.isObject()) {
    ThrowConfig(errors::config::kRoutesMalformed, errors::msg::kRoutesNotObject, origin);
  }

  // jsoncpp keeps object members sorted by key; the byte offset of each value
  // recovers the order the routes were declared in.
  struct Declared {
    std::ptrdiff_t offset;
    RouteEntry entry;
  };
  std::vector<Declared> declared;
  declared.reserve(root.size());
  for (const auto& name : root.getMemberNames()) {
    const Json::Value& value = root[name];
    if (!value.isString()) {
      ThrowConfig(errors::config::kRoutesMalformed, errors::msg::kRouteValueNotString, origin,
                  "key \"" + name + "\"");
    }
    declared.push_back(Declared{value.getOffsetStart(), RouteEntry{name, value.asString()}});
  }
  if (declared.empty()) {
    ThrowConfig(errors::config::kRoutesEmpty, errors::msg::kNoRoutes, origin);
  }
  std::stable_sort(declared.begin(), declared.end(),
                   [](const Declared& lhs, const Declared& rhs) { return lhs.offset < rhs.offset; });

  std::vector<RouteEntry> entries;
  entries.reserve(declared.size());
  for (auto& item : declared) {
    entries.push_back(std::move(item.entry));
  }
  return RouteTable(std::move(entries));
}

}  // namespace tsync::routes
