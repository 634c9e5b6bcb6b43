// Digest verification with algorithm fallback
// Author: Max Schwarz <max.schwarz@online.de>

#include "digest.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <regex>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <openssl/evp.h>

#include "errors.h"
#include "log.h"

namespace fs = std::filesystem;

namespace digest {

namespace {
using MDPtr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using MDContextPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

const std::regex HASH_HEADER{R"(^\s*#+\s*(\S+)\s+HASH\s*$)"};
const std::regex HASH_LINE{R"(^([a-fA-F0-9]+)\s+(\S+)$)"};

constexpr std::size_t CHUNK_SIZE = 64 * 1024;

MDPtr fetch(std::string_view algorithm) {
  return MDPtr{EVP_MD_fetch(nullptr, opensslName(algorithm).c_str(), nullptr),
               &EVP_MD_free};
}

std::string toLower(std::string_view in) {
  std::string out{in};
  std::ranges::transform(out, out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

std::string trim(const std::string &line) {
  auto begin = line.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos)
    return {};
  auto end = line.find_last_not_of(" \t\r\n");
  return line.substr(begin, end - begin + 1);
}

std::string toHex(std::span<const unsigned char> data) {
  static constexpr char HEX[] = "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (auto byte : data) {
    out.push_back(HEX[byte >> 4]);
    out.push_back(HEX[byte & 0x0F]);
  }
  return out;
}

struct Running {
  const Published *published;
  MDPtr md;
  MDContextPtr ctx;
};

std::string finish(Running &running) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(running.ctx.get(), out.data(), &len) != 1)
    throw DigestAlgorithmUnavailable{fmt::format(
        "Could not finalize {} digest", running.published->algorithm)};

  return toHex(std::span<const unsigned char>{out.data(), len});
}
} // namespace

Manifest parseManifest(std::istream &stream) {
  Manifest manifest;

  std::string line;
  bool haveLine = static_cast<bool>(std::getline(stream, line));
  while (haveLine) {
    std::smatch header;
    std::string trimmed = trim(line);
    if (!std::regex_match(trimmed, header, HASH_HEADER)) {
      haveLine = static_cast<bool>(std::getline(stream, line));
      continue;
    }

    auto &entries = manifest[header[1].str()];
    while ((haveLine = static_cast<bool>(std::getline(stream, line)))) {
      std::smatch entry;
      std::string entryLine = trim(line);
      if (!std::regex_match(entryLine, entry, HASH_LINE))
        break;

      auto fileName = fs::path{entry[2].str()}.filename().string();
      entries[fileName] = toLower(entry[1].str());
    }
  }

  return manifest;
}

Manifest loadManifest(const fs::path &path) {
  std::ifstream file{path};
  if (!file)
    throw AcquisitionError{fmt::format("Could not open digest manifest {}", path)};

  auto manifest = parseManifest(file);
  if (manifest.empty())
    warning("Digest manifest {} does not contain any hashes", path);

  return manifest;
}

std::vector<Published> publishedFor(const Manifest &manifest,
                                    const std::string &fileName,
                                    std::span<const std::string_view> preference) {
  std::vector<Published> published;

  auto base = fs::path{fileName}.filename().string();
  for (auto algorithm : preference) {
    auto it = manifest.find(std::string{algorithm});
    if (it == manifest.end())
      continue;

    auto entry = it->second.find(base);
    if (entry == it->second.end())
      continue;

    published.push_back({std::string{algorithm}, entry->second});
  }

  return published;
}

std::string opensslName(std::string_view algorithm) {
  auto upper = std::string{algorithm};
  std::ranges::transform(upper, upper.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });

  if (upper == "BLAKE2B")
    return "BLAKE2B512";
  if (upper == "BLAKE2S")
    return "BLAKE2S256";
  if (upper == "WHIRLPOOL")
    return "whirlpool";

  return upper;
}

bool isAvailable(std::string_view algorithm) {
  return fetch(algorithm) != nullptr;
}

std::string hexDigest(std::string_view algorithm, std::string_view data) {
  auto md = fetch(algorithm);
  if (!md)
    throw DigestAlgorithmUnavailable{
        fmt::format("Digest algorithm {} is not available", algorithm)};

  std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, md.get(),
                 nullptr) != 1)
    throw DigestAlgorithmUnavailable{
        fmt::format("Could not compute {} digest", algorithm)};

  return toHex(std::span<const unsigned char>{out.data(), len});
}

std::string verify(std::istream &artifact,
                   std::span<const Published> candidates) {
  std::vector<Running> running;
  std::vector<std::string> unavailable;

  for (auto &candidate : candidates) {
    auto md = fetch(candidate.algorithm);
    if (!md) {
      warning("Digest algorithm {} is not available in this OpenSSL runtime, "
              "skipping it",
              candidate.algorithm);
      unavailable.push_back(candidate.algorithm);
      continue;
    }

    MDContextPtr ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md.get(), nullptr) != 1) {
      warning("Could not initialize {} digest, skipping it",
              candidate.algorithm);
      unavailable.push_back(candidate.algorithm);
      continue;
    }

    running.push_back({&candidate, std::move(md), std::move(ctx)});
  }

  if (running.empty()) {
    if (candidates.empty())
      throw DigestAlgorithmUnavailable{
          "No digest published for any supported algorithm"};

    throw DigestAlgorithmUnavailable{
        fmt::format("None of the published digest algorithms are available: {}",
                    unavailable)};
  }

  std::vector<char> buf(CHUNK_SIZE);
  while (artifact) {
    artifact.read(buf.data(), buf.size());
    auto got = artifact.gcount();
    if (got <= 0)
      break;

    for (auto &digest : running) {
      if (EVP_DigestUpdate(digest.ctx.get(), buf.data(),
                           static_cast<std::size_t>(got)) != 1)
        throw DigestAlgorithmUnavailable{fmt::format(
            "Could not update {} digest", digest.published->algorithm)};
    }
  }
  if (artifact.bad())
    throw AcquisitionError{"Could not read artifact while computing digests"};

  std::vector<std::string> mismatched;
  for (auto &digest : running) {
    auto computed = finish(digest);
    if (computed == toLower(digest.published->value)) {
      debug("{} digest matches", digest.published->algorithm);
      return digest.published->algorithm;
    }

    warning("{} digest mismatch: expected {}, got {}",
            digest.published->algorithm, digest.published->value, computed);
    mismatched.push_back(digest.published->algorithm);
  }

  throw DigestMismatch{
      fmt::format("Digest mismatch for algorithm(s) {}", mismatched)};
}

std::string verifyFile(const fs::path &artifact,
                       std::span<const Published> candidates) {
  std::ifstream file{artifact, std::ios::binary};
  if (!file)
    throw AcquisitionError{fmt::format("Could not open {}", artifact)};

  try {
    return verify(file, candidates);
  } catch (DigestMismatch &e) {
    throw DigestMismatch{fmt::format("{}: {}", artifact, e.what())};
  }
}

} // namespace digest
