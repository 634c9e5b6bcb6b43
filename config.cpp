// Path and mirror configuration
// Author: Max Schwarz <max.schwarz@online.de>

#include "config.h"

#include <cstdlib>
#include <system_error>

#include <fmt/format.h>
#include <fmt/std.h>

#include <sys/stat.h>

#include "errors.h"
#include "log.h"

namespace fs = std::filesystem;

namespace config {

namespace {
std::optional<std::string> fromEnv(const char *name) {
  if (auto value = getenv(name); value && *value)
    return std::string{value};
  return {};
}

std::string pick(const std::optional<std::string> &override, const char *env,
                 std::string fallback) {
  if (override)
    return *override;
  if (auto value = fromEnv(env))
    return *value;
  return fallback;
}

void ensureDirectory(const fs::path &path) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec)
    throw ConfigError{
        fmt::format("Could not create directory {}: {}", path, ec.message())};
}
} // namespace

std::string Settings::autobuilds_url() const {
  std::string base = mirror;
  while (!base.empty() && base.back() == '/')
    base.pop_back();

  return fmt::format("{}/releases/{}/autobuilds", base, arch);
}

std::string Settings::pointer_file() const {
  return fmt::format("latest-stage3-{}.txt", arch);
}

Settings resolve(const Overrides &overrides) {
  Settings settings;

  settings.work_dir = fs::absolute(
      pick(overrides.work_dir, "STAGE_ROOT_WORK_DIR", DEFAULT_WORK_DIR));
  ensureDirectory(settings.work_dir);
  if (chmod(settings.work_dir.c_str(), 0700) != 0)
    sys_error("Could not restrict permissions of {}", settings.work_dir);

  settings.chroot_dir =
      fs::absolute(pick(overrides.chroot_dir, "STAGE_ROOT_CHROOT_DIR",
                        (settings.work_dir / "gentoo").string()));
  ensureDirectory(settings.chroot_dir);

  // Mount targets are compared against /proc/self/mounts, which only has
  // canonical paths
  std::error_code ec;
  settings.chroot_dir = fs::canonical(settings.chroot_dir, ec);
  if (ec)
    throw ConfigError{fmt::format("Could not resolve target tree path: {}",
                                  ec.message())};

  settings.mirror = pick(overrides.mirror, "STAGE_ROOT_MIRROR", DEFAULT_MIRROR);
  settings.arch = pick(overrides.arch, "STAGE_ROOT_ARCH", DEFAULT_ARCH);

  if (auto keyring = overrides.keyring ? overrides.keyring
                                       : fromEnv("STAGE_ROOT_KEYRING"))
    settings.keyring = fs::absolute(*keyring);
  else if (fs::exists(settings.work_dir / "keyring"))
    settings.keyring = settings.work_dir / "keyring";
  else
    settings.keyring = SYSTEM_KEYRING;

  debug("work dir: {}, chroot dir: {}, mirror: {}, arch: {}, keyring: {}",
        settings.work_dir, settings.chroot_dir, settings.mirror, settings.arch,
        settings.keyring);

  return settings;
}

} // namespace config
