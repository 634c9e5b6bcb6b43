// Release acquisition: locate, download, verify and extract
// Author: Max Schwarz <max.schwarz@online.de>

#include "acquire.h"

#include <array>
#include <fstream>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <nlohmann/json.hpp>

#include "digest.h"
#include "errors.h"
#include "log.h"
#include "os.h"
#include "signature.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace acquire {

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Marker, release, digest, key, extracted_at)

std::optional<Marker> readMarker(const fs::path &tree) {
  auto path = tree / config::MARKER;

  std::error_code ec;
  if (!fs::exists(path, ec))
    return {};

  std::ifstream in{path};
  if (!in)
    throw AcquisitionError{fmt::format("Could not open marker {}", path)};

  try {
    return json::parse(in).get<Marker>();
  } catch (json::exception &e) {
    throw AcquisitionError{
        fmt::format("Marker {} is corrupt: {}", path, e.what())};
  }
}

void writeMarker(const fs::path &tree, const Marker &marker) {
  json doc = marker;
  if (!os::write_file_atomic(tree / config::MARKER, doc.dump(2) + "\n"))
    throw AcquisitionError{
        fmt::format("Could not write marker into {}", tree)};
}

std::string TrustVerifier::verifyDigest(const fs::path &artifact,
                                        const fs::path &digests) {
  auto manifest = digest::loadManifest(digests);
  auto candidates = digest::publishedFor(
      manifest, artifact.filename().string(), config::DIGEST_PREFERENCE);

  auto algorithm = digest::verifyFile(artifact, candidates);
  info("{} digest of {} verified", algorithm, artifact.filename());
  return algorithm;
}

std::string TrustVerifier::verifySignature(const fs::path &artifact,
                                           const fs::path &sig) {
  auto detached = signature::load(sig);
  auto key = signature::verify(artifact, detached, m_keyring);
  info("Signature of {} verified with key '{}'", artifact.filename(), key);
  return key;
}

Pipeline::Pipeline(const config::Settings &settings,
                   download::Fetcher &fetcher, Verifier &verifier,
                   Options options)
    : m_settings{settings}, m_fetcher{fetcher}, m_verifier{verifier},
      m_options{options} {}

bool Pipeline::run() {
  const auto &tree = m_settings.chroot_dir;

  if (!m_options.force) {
    if (auto marker = readMarker(tree)) {
      info("{} already contains {}, skipping acquisition", tree,
           marker->release);
      return false;
    }
  }

  auto downloads = m_settings.downloads_dir();
  std::error_code ec;
  fs::create_directories(downloads, ec);
  if (ec)
    throw AcquisitionError{
        fmt::format("Could not create {}: {}", downloads, ec.message())};

  auto autobuilds = m_settings.autobuilds_url();
  auto release =
      download::findLatest(m_fetcher, autobuilds, m_settings.pointer_file());
  auto url = download::joinUrl(autobuilds, release);

  auto artifact = download::fetchInto(m_fetcher, url, downloads);
  auto digests =
      download::fetchInto(m_fetcher, url + config::DIGESTS_SUFFIX, downloads);
  auto sig =
      download::fetchInto(m_fetcher, url + config::SIGNATURE_SUFFIX, downloads);

  std::string algorithm;
  try {
    algorithm = m_verifier.verifyDigest(artifact, digests);
  } catch (DigestMismatch &) {
    // Either one may be the broken download, so a retry fetches both
    for (auto &path : {artifact, digests}) {
      error("Deleting {}", path);
      fs::remove(path, ec);
      if (ec)
        warning("Could not delete {}: {}", path, ec.message());
    }
    throw;
  }

  auto key = m_verifier.verifySignature(artifact, sig);

  extract(artifact);

  writeMarker(tree, Marker{
                        .release = release,
                        .digest = algorithm,
                        .key = key,
                        .extracted_at =
                            keyring::formatTimestamp(keyring::Clock::now()),
                    });

  if (!m_options.keep_downloads) {
    fs::remove(artifact, ec);
    if (ec)
      warning("Could not delete {}: {}", artifact, ec.message());
  }

  info("{} is ready", tree);
  return true;
}

void Pipeline::extract(const fs::path &artifact) {
  const auto &tree = m_settings.chroot_dir;

  std::error_code ec;
  fs::create_directories(tree, ec);
  if (ec)
    throw AcquisitionError{
        fmt::format("Could not create {}: {}", tree, ec.message())};

  if (!fs::is_empty(tree, ec)) {
    warning("{} is not empty, clearing it before extraction", tree);
    clearTree(tree);
  }

  info("Extracting {} into {}", artifact.filename(), tree);

  std::array<std::string, 7> args{
      "tar",           "xapf",         artifact.string(), "-C", tree.string(),
      "--xattrs-include=*.*", "--numeric-owner"};
  int ret = os::run(args);
  if (ret != 0)
    throw AcquisitionError{fmt::format(
        "Extraction of {} failed (tar exit status {})", artifact, ret)};
}

void clearTree(const fs::path &tree) {
  auto mounts = os::mounts_below(tree);
  if (!mounts.empty())
    throw AcquisitionError{fmt::format(
        "{} still has mounts ({}). Run 'stage_root umount' first.", tree,
        mounts)};

  std::error_code ec;
  std::vector<fs::path> entries;
  for (auto &entry : fs::directory_iterator{tree, ec})
    entries.push_back(entry.path());
  if (ec)
    throw AcquisitionError{
        fmt::format("Could not list {}: {}", tree, ec.message())};

  for (auto &entry : entries) {
    fs::remove_all(entry, ec);
    if (ec)
      throw AcquisitionError{
          fmt::format("Could not remove {}: {}", entry, ec.message())};
  }
}

} // namespace acquire
