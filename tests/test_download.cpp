// Download helper tests
// Author: Max Schwarz <max.schwarz@online.de>

#include <cassert>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include "download.h"
#include "errors.h"
#include "log.h"
#include "test_util.h"

LogLevel log_level = LogLevel::Warning;

namespace {

class MapFetcher : public download::Fetcher {
public:
  std::map<std::string, std::string> files;
  std::vector<std::string> fetched;

  void fetch(const std::string &url,
             const std::filesystem::path &dest) override {
    fetched.push_back(url);
    auto it = files.find(url);
    if (it == files.end())
      throw AcquisitionError{"404 " + url};
    test::writeFile(dest, it->second);
  }

  std::string fetchText(const std::string &url) override {
    fetched.push_back(url);
    auto it = files.find(url);
    if (it == files.end())
      throw AcquisitionError{"404 " + url};
    return it->second;
  }
};

std::string pointer(const std::string &text) {
  std::istringstream in{text};
  return download::parsePointer(in, "latest-stage3-amd64.txt");
}

void testJoinUrl() {
  assert(download::joinUrl("http://m/a/", "/b/c") == "http://m/a/b/c");
  assert(download::joinUrl("http://m/a", "b") == "http://m/a/b");
  assert(download::joinUrl("http://m/a//", "b") == "http://m/a/b");
}

void testParsePointer() {
  assert(pointer("# Latest as of Mon, 01 Jan 2024\n"
                 "# ts=1704128400\n"
                 "20240101T170000Z/stage3-amd64.tar.xz 262144000\n") ==
         "20240101T170000Z/stage3-amd64.tar.xz");

  assert(pointer("\r\n20240101T170000Z/stage3.tar.xz\r\n\r\n") ==
         "20240101T170000Z/stage3.tar.xz");

  for (const char *bad : {"", "# only comments\n", "a 1\nb 2\n", "   \n"}) {
    bool threw = test::throws<AcquisitionError>([&] { pointer(bad); });
    assert(threw && "Expected AcquisitionError for a bad pointer file");
  }
}

void testFindLatest() {
  MapFetcher fetcher;
  fetcher.files["http://m/releases/amd64/autobuilds/latest.txt"] =
      "# comment\nrel/stage3.tar.xz 12\n";

  assert(download::findLatest(fetcher, "http://m/releases/amd64/autobuilds/",
                              "latest.txt") == "rel/stage3.tar.xz");

  bool threw = test::throws<AcquisitionError>(
      [&] { download::findLatest(fetcher, "http://other", "latest.txt"); });
  assert(threw);
}

void testFetchIntoSkipsExisting() {
  test::TempDir dir;
  MapFetcher fetcher;
  fetcher.files["http://m/rel/stage3.tar.xz"] = "payload";

  auto path = download::fetchInto(fetcher, "http://m/rel/stage3.tar.xz",
                                  dir.path());
  assert(path == dir.path() / "stage3.tar.xz");
  assert(test::readFile(path) == "payload");
  assert(fetcher.fetched.size() == 1);

  path = download::fetchInto(fetcher, "http://m/rel/stage3.tar.xz", dir.path());
  assert(fetcher.fetched.size() == 1 && "existing file must not be fetched");

  bool threw = test::throws<AcquisitionError>(
      [&] { download::fetchInto(fetcher, "http://m/rel/", dir.path()); });
  assert(threw && "Expected AcquisitionError for a URL without file name");
}

} // namespace

int main() {
  testJoinUrl();
  testParsePointer();
  testFindLatest();
  testFetchIntoSkipsExisting();

  std::cout << "download tests ok\n";
  return 0;
}
