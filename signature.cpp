// Detached OpenPGP signature verification against the trust keyring
// Author: Max Schwarz <max.schwarz@online.de>

#include "signature.h"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include "errors.h"
#include "log.h"
#include "openpgp.h"

namespace fs = std::filesystem;

namespace signature {

namespace {
std::string describeWindow(const keyring::Key &key) {
  return fmt::format("'{}' valid {} .. {}", key.id,
                     keyring::formatTimestamp(key.notBefore),
                     key.notAfter ? keyring::formatTimestamp(*key.notAfter)
                                  : std::string{"(no expiry)"});
}

std::vector<std::string> ids(const std::vector<const keyring::Key *> &keys) {
  std::vector<std::string> ret;
  for (auto *key : keys)
    ret.push_back(key->id);
  return ret;
}

openpgp::Verdict check(const keyring::Key &key, const Detached &signature,
                       const fs::path &artifact) {
  try {
    auto verdict = openpgp::verify(key.material, signature.packets, artifact);
    debug("Key '{}': {}", key.id, openpgp::verdictName(verdict));
    return verdict;
  } catch (std::runtime_error &e) {
    throw SignatureInvalid{
        fmt::format("Could not check signature of {}: {}", artifact, e.what())};
  }
}
} // namespace

Detached parse(std::istream &stream) {
  std::string data{std::istreambuf_iterator<char>{stream},
                   std::istreambuf_iterator<char>{}};
  if (data.empty())
    throw SignatureInvalid{"Signature is empty"};

  try {
    return Detached{
        .packets = openpgp::packets(data, openpgp::PacketTag::Signature)};
  } catch (std::invalid_argument &e) {
    throw SignatureInvalid{fmt::format("Malformed signature: {}", e.what())};
  }
}

Detached load(const fs::path &path) {
  std::ifstream file{path, std::ios::binary};
  if (!file)
    throw AcquisitionError{fmt::format("Could not open signature {}", path)};

  try {
    return parse(file);
  } catch (SignatureInvalid &e) {
    throw SignatureInvalid{fmt::format("{}: {}", path, e.what())};
  }
}

std::string verify(const fs::path &artifact, const Detached &signature,
                   const keyring::TrustKeyring &keyring,
                   keyring::Clock::time_point now) {
  std::error_code ec;
  if (!fs::is_regular_file(artifact, ec))
    throw AcquisitionError{fmt::format("Could not open {}", artifact)};

  std::vector<const keyring::Key *> current;
  std::vector<const keyring::Key *> outside;
  for (auto &key : keyring.keys()) {
    if (key.validAt(now))
      current.push_back(&key);
    else
      outside.push_back(&key);
  }

  std::vector<std::string> stale;

  for (auto *key : current) {
    switch (check(*key, signature, artifact)) {
    case openpgp::Verdict::Good:
      debug("Signature of {} verified with key '{}'", artifact, key->id);
      return key->id;
    case openpgp::Verdict::KeyExpired:
      stale.push_back(fmt::format("'{}' (OpenPGP key expired)", key->id));
      break;
    case openpgp::Verdict::Revoked:
      warning("Key '{}' has been revoked", key->id);
      break;
    case openpgp::Verdict::Bad:
    case openpgp::Verdict::NoKey:
      break;
    }
  }

  // Only used to tell a stale keyring from a bad signature, never to
  // accept it.
  for (auto *key : outside) {
    auto verdict = check(*key, signature, artifact);
    if (verdict == openpgp::Verdict::Good ||
        verdict == openpgp::Verdict::KeyExpired)
      stale.push_back(describeWindow(*key));
  }

  if (!stale.empty())
    throw SignatureKeyExpired{fmt::format(
        "{} is signed by expired key(s): {}. The keyring bundle is out of "
        "date.",
        artifact, fmt::join(stale, ", "))};

  throw SignatureInvalid{
      fmt::format("Signature of {} does not verify with key(s) {}", artifact,
                  ids(current))};
}

} // namespace signature
