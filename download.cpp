// Artifact download from the release mirror
// Author: Max Schwarz <max.schwarz@online.de>

#include "download.h"

#include <array>
#include <sstream>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/std.h>

#include "config.h"
#include "errors.h"
#include "log.h"
#include "os.h"

namespace fs = std::filesystem;

namespace download {

CurlFetcher::CurlFetcher() {
  auto curl = os::find_binary("curl");
  if (!curl)
    throw AcquisitionError{"Could not find curl in PATH"};

  m_curl = *curl;
}

void CurlFetcher::fetch(const std::string &url, const fs::path &dest) {
  fs::path partial = dest;
  partial += config::PARTIAL_SUFFIX;

  info("Downloading {}", url);

  std::array<std::string, 5> args{m_curl.string(), "-fSL", "-o",
                                  partial.string(), url};
  if (log_level > LogLevel::Info)
    args[1] = "-fsSL";

  int ret = os::run(args);
  if (ret != 0) {
    std::error_code ec;
    fs::remove(partial, ec);
    throw AcquisitionError{
        fmt::format("Download of {} failed (curl exit status {})", url, ret)};
  }

  std::error_code ec;
  fs::rename(partial, dest, ec);
  if (ec)
    throw AcquisitionError{fmt::format("Could not move {} to {}: {}", partial,
                                       dest, ec.message())};
}

std::string CurlFetcher::fetchText(const std::string &url) {
  debug("Fetching {}", url);

  std::array<std::string, 3> args{m_curl.string(), "-fsSL", url};
  auto output = os::run_get_output(args);
  if (!output)
    throw AcquisitionError{fmt::format("Could not fetch {}", url)};

  return *output;
}

std::string joinUrl(std::string_view base, std::string_view path) {
  while (base.ends_with('/'))
    base.remove_suffix(1);
  while (path.starts_with('/'))
    path.remove_prefix(1);

  return fmt::format("{}/{}", base, path);
}

std::string parsePointer(std::istream &stream, std::string_view name) {
  std::vector<std::string> lines;

  std::string line;
  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty() || line.starts_with('#'))
      continue;

    lines.push_back(line);
  }

  if (lines.empty())
    throw AcquisitionError{fmt::format("Pointer file '{}' is empty", name)};
  if (lines.size() > 1)
    throw AcquisitionError{fmt::format(
        "Pointer file '{}' has more lines than expected", name)};

  std::istringstream fields{lines.front()};
  std::string path;
  if (!(fields >> path))
    throw AcquisitionError{fmt::format(
        "Pointer file '{}' has a format different from expected", name)};

  return path;
}

std::string findLatest(Fetcher &fetcher, const std::string &autobuildsUrl,
                       const std::string &pointerFile) {
  auto text = fetcher.fetchText(joinUrl(autobuildsUrl, pointerFile));

  std::istringstream stream{text};
  auto path = parsePointer(stream, pointerFile);

  info("Latest release: {}", path);
  return path;
}

fs::path fetchInto(Fetcher &fetcher, const std::string &url,
                   const fs::path &dir) {
  auto slash = url.find_last_of('/');
  auto fileName = slash == std::string::npos ? url : url.substr(slash + 1);
  if (fileName.empty())
    throw AcquisitionError{fmt::format("URL {} does not name a file", url)};

  auto dest = dir / fileName;
  if (fs::exists(dest)) {
    info("File already exists, skipping download: {}", dest);
    return dest;
  }

  fetcher.fetch(url, dest);
  return dest;
}

} // namespace download
