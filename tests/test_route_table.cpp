#include "tsync/routes/route_table.h"

#include "tsync/error.h"
#include "test_support.h"

namespace {

using tsync::routes::RouteEntry;
using tsync::routes::RouteTable;
using tsync_test::Expect;
using tsync_test::TempDir;
using tsync_test::WriteFile;

int ExpectConfigError(std::string_view json) {
  try {
    (void)RouteTable::Parse(json, "inline");
  } catch (const tsync::Error& err) {
    Expect(err.domain == tsync::ErrorDomain::Config, "route table failures are config errors");
    Expect(tsync::IsFrameworkErrorCode(err.domain, err.code), "code inside the config span");
    return err.code;
  }
  std::cerr << "Expected config error for: " << json << std::endl;
  std::abort();
}

void TestDeclarationOrderPreserved() {
  auto table = RouteTable::Parse(R"({
    "/data/zeta": "/backup/zeta",
    "/data/alpha": "/backup/alpha",
    "/data/mid": "/backup/mid"
  })",
                                 "inline");
  Expect(table.size() == 3, "three entries");
  Expect(table.entries()[0] == RouteEntry{"/data/zeta", "/backup/zeta"}, "first declared first");
  Expect(table.entries()[1] == RouteEntry{"/data/alpha", "/backup/alpha"}, "second declared second");
  Expect(table.entries()[2] == RouteEntry{"/data/mid", "/backup/mid"}, "third declared third");
}

void TestStringsKeptVerbatim() {
  auto table = RouteTable::Parse(R"({"relative//src/": "dst;rm", "": ""})", "inline");
  Expect(table.size() == 2, "unvalidated entries are kept");
  Expect(table.entries()[0].source == "relative//src/", "source untouched");
  Expect(table.entries()[0].destination == "dst;rm", "destination untouched");
  Expect(table.entries()[1].source.empty(), "empty key kept for per-route validation");
}

void TestMalformedInputs() {
  using namespace tsync::errors::config;
  Expect(ExpectConfigError("{not json") == kRoutesMalformed, "syntax error");
  Expect(ExpectConfigError("") == kRoutesMalformed, "empty document");
  Expect(ExpectConfigError(R"(["/a", "/b"])") == kRoutesMalformed, "array root");
  Expect(ExpectConfigError(R"({"/a": 5})") == kRoutesMalformed, "non-string destination");
  Expect(ExpectConfigError(R"({"/a": "/x", "/a": "/y"})") == kRoutesMalformed, "duplicate key");
  Expect(ExpectConfigError(R"({"/a": "/x"} trailing)") == kRoutesMalformed, "trailing garbage");
  Expect(ExpectConfigError("{}") == kRoutesEmpty, "zero entries");
}

void TestLoadFromFile() {
  TempDir dir("tsync_routes_");
  const auto file = dir.path() / "routes.json";
  WriteFile(file, R"({"/data/b": "/backup/b", "/data/a": "/backup/a"})");
  auto table = RouteTable::Load(file);
  Expect(table.size() == 2, "loaded two routes");
  Expect(table.entries().front().source == "/data/b", "file order kept");

  try {
    (void)RouteTable::Load(dir.path() / "missing.json");
    Expect(false, "missing file must fail");
  } catch (const tsync::Error& err) {
    Expect(err.code == tsync::errors::config::kRoutesFileMissing, "missing file code");
  }

  try {
    (void)RouteTable::Load(dir.path());
    Expect(false, "directory must fail");
  } catch (const tsync::Error& err) {
    Expect(err.code == tsync::errors::config::kRoutesFileMissing, "directory is not a routes file");
  }
}

}  // namespace

int main() {
  TestDeclarationOrderPreserved();
  TestStringsKeptVerbatim();
  TestMalformedInputs();
  TestLoadFromFile();
  std::cout << "route table tests ok\n";
  return 0;
}
