// Digest verification with algorithm fallback
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef DIGEST_H
#define DIGEST_H

#include <filesystem>
#include <istream>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace digest {

// Algorithm name (as written in the DIGESTS file) -> file name -> hex digest
using Manifest = std::map<std::string, std::map<std::string, std::string>>;

struct Published {
  std::string algorithm;
  std::string value;
};

Manifest parseManifest(std::istream &stream);

// Throws AcquisitionError if the file cannot be read.
Manifest loadManifest(const std::filesystem::path &path);

// Digests published for @p fileName, ordered by @p preference. Algorithms not
// in @p preference are left out.
std::vector<Published> publishedFor(const Manifest &manifest,
                                    const std::string &fileName,
                                    std::span<const std::string_view> preference);

// Maps distributor algorithm names to OpenSSL digest names.
std::string opensslName(std::string_view algorithm);

// Asks the OpenSSL runtime. Some legacy digests only exist when the
// legacy provider is loaded.
bool isAvailable(std::string_view algorithm);

// Throws DigestAlgorithmUnavailable.
std::string hexDigest(std::string_view algorithm, std::string_view data);

// Checks @p artifact against @p candidates in order. Succeeds as soon as one
// algorithm is both computable and matching and returns its name.
// Throws DigestAlgorithmUnavailable if nothing in @p candidates can be
// computed, DigestMismatch if nothing computed matches.
// The stream is read once.
std::string verify(std::istream &artifact, std::span<const Published> candidates);

std::string verifyFile(const std::filesystem::path &artifact,
                       std::span<const Published> candidates);

} // namespace digest

#endif
