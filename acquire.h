// Release acquisition: locate, download, verify and extract
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef ACQUIRE_H
#define ACQUIRE_H

#include <filesystem>
#include <optional>
#include <string>

#include "config.h"
#include "download.h"
#include "keyring.h"

namespace acquire {

// Contents of the extraction marker
struct Marker {
  std::string release;
  std::string digest;
  std::string key;
  std::string extracted_at;
};

// Returns the marker of @p tree, if any. Throws AcquisitionError if it
// exists but is unreadable.
std::optional<Marker> readMarker(const std::filesystem::path &tree);

// Throws AcquisitionError.
void writeMarker(const std::filesystem::path &tree, const Marker &marker);

class Verifier {
public:
  virtual ~Verifier() = default;

  // Return the digest algorithm / key id that accepted the artifact and
  // throw a VerificationError otherwise.
  virtual std::string verifyDigest(const std::filesystem::path &artifact,
                                   const std::filesystem::path &digests) = 0;
  virtual std::string verifySignature(const std::filesystem::path &artifact,
                                      const std::filesystem::path &sig) = 0;
};

class TrustVerifier : public Verifier {
public:
  explicit TrustVerifier(const keyring::TrustKeyring &keyring)
      : m_keyring{keyring} {}

  std::string verifyDigest(const std::filesystem::path &artifact,
                           const std::filesystem::path &digests) override;
  std::string verifySignature(const std::filesystem::path &artifact,
                              const std::filesystem::path &sig) override;

private:
  const keyring::TrustKeyring &m_keyring;
};

struct Options {
  bool keep_downloads = false;

  // Re-acquire even if the marker is present
  bool force = false;
};

class Pipeline {
public:
  Pipeline(const config::Settings &settings, download::Fetcher &fetcher,
           Verifier &verifier, Options options = {});

  // Returns false if the tree already carried a marker and nothing was done.
  // Throws AcquisitionError or a VerificationError.
  bool run();

private:
  void extract(const std::filesystem::path &artifact);

  const config::Settings &m_settings;
  download::Fetcher &m_fetcher;
  Verifier &m_verifier;
  Options m_options;
};

// Removes everything below @p tree, without crossing into mounts.
// Throws AcquisitionError.
void clearTree(const std::filesystem::path &tree);

} // namespace acquire

#endif
