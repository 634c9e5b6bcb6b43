// Artifact download from the release mirror
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef DOWNLOAD_H
#define DOWNLOAD_H

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace download {

class Fetcher {
public:
  virtual ~Fetcher() = default;

  // Downloads @p url to @p dest. Throws AcquisitionError.
  virtual void fetch(const std::string &url,
                     const std::filesystem::path &dest) = 0;

  // Throws AcquisitionError.
  virtual std::string fetchText(const std::string &url) = 0;
};

// Downloads with the curl binary. Files are written to a ".part" sibling
// and renamed once complete.
class CurlFetcher : public Fetcher {
public:
  // Throws AcquisitionError if curl is not installed.
  CurlFetcher();

  void fetch(const std::string &url, const std::filesystem::path &dest) override;
  std::string fetchText(const std::string &url) override;

private:
  std::filesystem::path m_curl;
};

std::string joinUrl(std::string_view base, std::string_view path);

// Extracts the artifact path (relative to the autobuilds directory) from
// a "latest" pointer file. Throws AcquisitionError unless exactly one
// non-comment line remains.
std::string parsePointer(std::istream &stream, std::string_view name);

// Fetches the pointer file below @p autobuildsUrl and returns the
// artifact path it names.
std::string findLatest(Fetcher &fetcher, const std::string &autobuildsUrl,
                       const std::string &pointerFile);

// Downloads @p url into @p dir unless a file of that name already exists.
// Returns the local path.
std::filesystem::path fetchInto(Fetcher &fetcher, const std::string &url,
                                const std::filesystem::path &dir);

} // namespace download

#endif
