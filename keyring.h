// Versioned trust keyring
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef KEYRING_H
#define KEYRING_H

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyring {

using Clock = std::chrono::system_clock;

struct Key {
  std::string id;

  // Binary OpenPGP transferable public key
  std::string material;

  Clock::time_point notBefore;
  std::optional<Clock::time_point> notAfter;

  bool validAt(Clock::time_point when) const;
};

// Loaded once at startup and never modified afterwards. Pass it by const
// reference to whoever needs it.
class TrustKeyring {
public:
  TrustKeyring(int version, std::vector<Key> keys);

  // Reads <dir>/keyring.json and the OpenPGP key files it references.
  // Throws ConfigError.
  static TrustKeyring load(const std::filesystem::path &dir);

  int version() const { return m_version; }
  const std::vector<Key> &keys() const { return m_keys; }

  std::vector<const Key *> withId(std::string_view id) const;

  // Keys outside their validity window at @p when
  std::vector<const Key *> flagged(Clock::time_point when) const;

private:
  int m_version;
  std::vector<Key> m_keys;
};

// Accepts "YYYY-MM-DDTHH:MM:SSZ" (UTC). Throws ConfigError.
Clock::time_point parseTimestamp(const std::string &text);
std::string formatTimestamp(Clock::time_point when);

// Accepts an armored or binary OpenPGP public key and returns its binary
// packets. Throws ConfigError.
std::string parsePublicKey(std::string_view data);

// Installs the bundle in @p source at @p dest if it loads and carries a
// higher version than the bundle at @p dest (or @p dest has none).
// Returns true if installed. Throws ConfigError.
bool refresh(const std::filesystem::path &source,
             const std::filesystem::path &dest);

} // namespace keyring

#endif
