// Path and mirror configuration
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef CONFIG_H
#define CONFIG_H

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace config {
constexpr const char *DEFAULT_MIRROR = "http://mirror.bytemark.co.uk/gentoo";
constexpr const char *DEFAULT_ARCH = "amd64";
constexpr const char *DEFAULT_WORK_DIR = "stage_root_work";
constexpr const char *SYSTEM_KEYRING = "/usr/share/stage_root/keyring";

// Written into the target tree after a verified extraction
constexpr const char *MARKER = ".stage_root-extracted";

constexpr const char *DIGESTS_SUFFIX = ".DIGESTS";
// Detached OpenPGP signature, as published next to each release
constexpr const char *SIGNATURE_SUFFIX = ".asc";
constexpr const char *PARTIAL_SUFFIX = ".part";

// Tree files replaced by a copy are moved aside under this suffix
constexpr const char *BACKUP_SUFFIX = ".stage_root-orig";

// Present next to every copy we installed, and only there
constexpr const char *COPY_RECORD_SUFFIX = ".stage_root-copy";

// Digest algorithms in order of preference, named as in the DIGESTS file
constexpr auto DIGEST_PREFERENCE = std::to_array<std::string_view>(
    {"BLAKE2B", "SHA512", "WHIRLPOOL", "SHA256"});

struct Settings {
  std::filesystem::path work_dir;
  std::filesystem::path chroot_dir;
  std::string mirror;
  std::string arch;
  std::filesystem::path keyring;

  std::filesystem::path downloads_dir() const { return work_dir / "downloads"; }
  std::filesystem::path sessions_dir() const { return work_dir / "sessions"; }
  std::filesystem::path marker() const { return chroot_dir / MARKER; }

  std::string autobuilds_url() const;
  std::string pointer_file() const;
};

// Command line values win over environment variables, which win over the
// built-in defaults.
struct Overrides {
  std::optional<std::string> work_dir;
  std::optional<std::string> chroot_dir;
  std::optional<std::string> mirror;
  std::optional<std::string> arch;
  std::optional<std::string> keyring;
};

// Creates the work directory (mode 0700) and the target tree directory.
// Throws ConfigError.
Settings resolve(const Overrides &overrides);
} // namespace config

#endif
