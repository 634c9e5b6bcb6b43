// Versioned trust keyring
// Author: Max Schwarz <max.schwarz@online.de>

#include "keyring.h"

#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/std.h>

#include <nlohmann/json.hpp>

#include "errors.h"
#include "log.h"
#include "openpgp.h"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace keyring {

namespace {
constexpr const char *MANIFEST = "keyring.json";

Clock::time_point timestampFrom(const json &value, const std::string &keyId,
                                const char *field) {
  if (value.is_number_integer())
    return Clock::from_time_t(static_cast<std::time_t>(value.get<std::int64_t>()));
  if (value.is_string())
    return parseTimestamp(value.get<std::string>());

  throw ConfigError{
      fmt::format("Key '{}': '{}' must be a timestamp string or integer",
                  keyId, field)};
}

std::string readFile(const fs::path &path) {
  std::ifstream in{path, std::ios::binary};
  if (!in)
    throw ConfigError{fmt::format("Could not open {}", path)};

  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

json readManifest(const fs::path &dir) {
  auto path = dir / MANIFEST;
  std::ifstream in{path};
  if (!in)
    throw ConfigError{fmt::format("Could not open keyring manifest {}", path)};

  try {
    return json::parse(in);
  } catch (json::exception &e) {
    throw ConfigError{fmt::format("Could not parse {}: {}", path, e.what())};
  }
}
} // namespace

bool Key::validAt(Clock::time_point when) const {
  if (when < notBefore)
    return false;
  if (notAfter && when >= *notAfter)
    return false;
  return true;
}

TrustKeyring::TrustKeyring(int version, std::vector<Key> keys)
    : m_version{version}, m_keys{std::move(keys)} {}

TrustKeyring TrustKeyring::load(const fs::path &dir) {
  auto manifest = readManifest(dir);

  std::vector<Key> keys;
  int version = 0;

  try {
    version = manifest.at("version").get<int>();

    for (auto &entry : manifest.at("keys")) {
      Key key;
      key.id = entry.at("id").get<std::string>();

      std::string data;
      if (entry.contains("armor"))
        data = entry.at("armor").get<std::string>();
      else
        data = readFile(dir / entry.at("file").get<std::string>());

      try {
        key.material = parsePublicKey(data);
      } catch (ConfigError &e) {
        throw ConfigError{fmt::format("Key '{}': {}", key.id, e.what())};
      }

      key.notBefore = entry.contains("not_before")
                          ? timestampFrom(entry.at("not_before"), key.id,
                                          "not_before")
                          : Clock::time_point{};
      if (entry.contains("not_after") && !entry.at("not_after").is_null())
        key.notAfter =
            timestampFrom(entry.at("not_after"), key.id, "not_after");

      debug("Loaded key '{}'", key.id);
      keys.push_back(std::move(key));
    }
  } catch (json::exception &e) {
    throw ConfigError{fmt::format("Invalid keyring manifest in {}: {}", dir,
                                  e.what())};
  }

  if (keys.empty())
    throw ConfigError{fmt::format("Keyring {} does not contain any keys", dir)};

  TrustKeyring keyring{version, std::move(keys)};

  auto now = Clock::now();
  for (auto *key : keyring.flagged(now)) {
    if (now < key->notBefore)
      warning("Key '{}' is not valid before {}", key->id,
              formatTimestamp(key->notBefore));
    else
      warning("Key '{}' expired at {}. Update the keyring bundle "
              "(stage_root keyring --refresh-from DIR).",
              key->id, formatTimestamp(*key->notAfter));
  }

  return keyring;
}

std::vector<const Key *> TrustKeyring::withId(std::string_view id) const {
  std::vector<const Key *> ret;
  for (auto &key : m_keys) {
    if (key.id == id)
      ret.push_back(&key);
  }
  return ret;
}

std::vector<const Key *> TrustKeyring::flagged(Clock::time_point when) const {
  std::vector<const Key *> ret;
  for (auto &key : m_keys) {
    if (!key.validAt(when))
      ret.push_back(&key);
  }
  return ret;
}

Clock::time_point parseTimestamp(const std::string &text) {
  std::tm tm{};
  const char *end = strptime(text.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
  if (!end || (*end != 'Z' && *end != 0) || (*end == 'Z' && end[1] != 0))
    throw ConfigError{fmt::format(
        "Invalid timestamp '{}', expected YYYY-MM-DDTHH:MM:SSZ", text)};

  return Clock::from_time_t(timegm(&tm));
}

std::string formatTimestamp(Clock::time_point when) {
  return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}",
                     fmt::gmtime(Clock::to_time_t(when)));
}

std::string parsePublicKey(std::string_view data) {
  try {
    return openpgp::packets(data, openpgp::PacketTag::PublicKey);
  } catch (std::invalid_argument &e) {
    throw ConfigError{fmt::format("Could not parse OpenPGP public key: {}",
                                  e.what())};
  }
}

bool refresh(const fs::path &source, const fs::path &dest) {
  auto incoming = TrustKeyring::load(source);

  if (fs::exists(dest / MANIFEST)) {
    auto current = TrustKeyring::load(dest);
    if (incoming.version() <= current.version()) {
      info("Installed keyring version {} is not older than {} (version {})",
           current.version(), source, incoming.version());
      return false;
    }
  }

  std::error_code ec;
  fs::path staging = dest;
  staging += ".new";
  fs::remove_all(staging, ec);
  fs::create_directories(staging, ec);
  if (ec)
    throw ConfigError{
        fmt::format("Could not create {}: {}", staging, ec.message())};

  fs::copy(source, staging, fs::copy_options::recursive, ec);
  if (ec)
    throw ConfigError{fmt::format("Could not copy keyring from {}: {}", source,
                                  ec.message())};

  fs::path old = dest;
  old += ".old";
  fs::remove_all(old, ec);
  if (fs::exists(dest)) {
    fs::rename(dest, old, ec);
    if (ec)
      throw ConfigError{
          fmt::format("Could not move {} aside: {}", dest, ec.message())};
  }

  fs::rename(staging, dest, ec);
  if (ec)
    throw ConfigError{
        fmt::format("Could not install keyring at {}: {}", dest, ec.message())};

  fs::remove_all(old, ec);
  if (ec)
    warning("Could not remove previous keyring {}: {}", old, ec.message());

  info("Installed keyring version {} at {}", incoming.version(), dest);
  return true;
}

} // namespace keyring
