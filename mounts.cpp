// Ordered mount table for a target tree
// Author: Max Schwarz <max.schwarz@online.de>

#include "mounts.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ranges>
#include <set>
#include <stdexcept>
#include <system_error>

#include <sys/mount.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include "config.h"
#include "errors.h"
#include "log.h"
#include "os.h"

namespace fs = std::filesystem;

namespace mounts {

namespace {
fs::path normalized(const fs::path &path) {
  auto ret = path.lexically_normal();
  if (!ret.has_filename() && ret != ret.root_path())
    ret = ret.parent_path();
  if (ret == ".")
    return {};
  return ret;
}

bool isBelow(const fs::path &path, const fs::path &parent) {
  auto prefix = parent.string();
  if (!prefix.ends_with('/'))
    prefix += '/';
  return path.string().starts_with(prefix);
}

fs::path backupOf(const fs::path &target) {
  fs::path backup = target;
  backup += config::BACKUP_SUFFIX;
  return backup;
}

fs::path recordOf(const fs::path &target) {
  fs::path record = target;
  record += config::COPY_RECORD_SUFFIX;
  return record;
}

bool present(const fs::path &path) {
  std::error_code ec;
  return fs::exists(fs::symlink_status(path, ec));
}

void refuseSymlink(const fs::path &target) {
  std::error_code ec;
  if (fs::is_symlink(fs::symlink_status(target, ec)))
    throw MountError{target,
                     fmt::format("Refusing to mount over symlink {}", target)};
}

// The most recent mount at a path is the one visible there
const os::MountEntry *visibleAt(const std::vector<os::MountEntry> &entries,
                                const fs::path &target) {
  for (auto &entry : entries | std::views::reverse) {
    if (entry.target == target)
      return &entry;
  }
  return nullptr;
}

bool hasOption(std::string_view options, std::string_view option) {
  for (auto part : options | std::views::split(',')) {
    if (std::string_view{part.begin(), part.end()} == option)
      return true;
  }
  return false;
}

bool isOwnPseudo(const MountPoint &point, const os::MountEntry &entry) {
  if (entry.fstype != point.fstype || entry.source != point.source)
    return false;

  for (auto part : point.options | std::views::split(',')) {
    std::string_view option{part.begin(), part.end()};
    if (option.starts_with("upperdir=") && !hasOption(entry.options, option))
      return false;
  }

  return true;
}
} // namespace

std::string_view kindName(MountKind kind) {
  switch (kind) {
  case MountKind::Pseudo:
    return "pseudo";
  case MountKind::Bind:
    return "bind";
  case MountKind::RecursiveBind:
    return "rbind";
  case MountKind::Copy:
    return "copy";
  }
  return "unknown";
}

// LinuxMountBackend

std::vector<os::MountEntry> LinuxMountBackend::mountEntries() {
  return os::mount_entries();
}

void LinuxMountBackend::prepareTarget(const fs::path &source,
                                      const fs::path &target) {
  refuseSymlink(target);
  if (!os::prepare_mount_target(source, target))
    throw MountError{target,
                     fmt::format("Could not create mount point {}", target)};
}

void LinuxMountBackend::prepareDirectory(const fs::path &target) {
  refuseSymlink(target);

  std::error_code ec;
  fs::create_directories(target, ec);
  if (ec)
    throw MountError{target, fmt::format("Could not create mount point {}: {}",
                                         target, ec.message())};
}

void LinuxMountBackend::bind(const fs::path &source, const fs::path &target,
                             bool recursive) {
  int flags = MS_BIND;
  if (recursive)
    flags |= MS_REC;

  if (!os::bind_mount(source, target, flags))
    throw MountError{target, fmt::format("Could not bind {} to {}: {}", source,
                                         target, strerror(errno))};
}

void LinuxMountBackend::mountFs(const std::string &fstype,
                                const std::string &source,
                                const fs::path &target, unsigned long flags,
                                const std::string &options) {
  if (!os::mount_fs(fstype.c_str(), source.c_str(), target, flags, options))
    throw MountError{target, fmt::format("Could not mount {} at {}: {}",
                                         fstype, target, strerror(errno))};
}

void LinuxMountBackend::unmount(const fs::path &target) {
  if (!os::unmount(target))
    throw UnmountError{target, strerror(errno)};
}

bool LinuxMountBackend::copyInstalled(const fs::path &target) {
  std::error_code ec;
  return fs::is_regular_file(fs::symlink_status(recordOf(target), ec));
}

void LinuxMountBackend::installCopy(const fs::path &source,
                                    const fs::path &target) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec)
    throw MountError{target, fmt::format("Could not create {}: {}",
                                         target.parent_path(), ec.message())};

  // Keep whatever the tree had there, possibly an absolute symlink that
  // must never be written through
  auto backup = backupOf(target);
  if (present(target)) {
    if (present(backup))
      fs::remove(target, ec);
    else
      fs::rename(target, backup, ec);

    if (ec)
      throw MountError{target, fmt::format("Could not move {} aside: {}",
                                           target, ec.message())};
  }

  auto restore = [&] {
    std::error_code restoreEc;
    fs::remove(target, restoreEc);
    if (present(backup))
      fs::rename(backup, target, restoreEc);
    fs::remove(recordOf(target), restoreEc);
  };

  // Written first, so an interrupted install is still cleaned up
  if (!os::write_file_atomic(recordOf(target), source.string() + "\n")) {
    auto reason = strerror(errno);
    restore();
    throw MountError{target, fmt::format("Could not record copy of {}: {}",
                                         target, reason)};
  }

  if (!os::copy_file(source, target)) {
    auto reason = strerror(errno);
    restore();
    throw MountError{target, fmt::format("Could not copy {} to {}: {}", source,
                                         target, reason)};
  }
}

void LinuxMountBackend::removeCopy(const fs::path &target) {
  std::error_code ec;
  fs::remove(target, ec);
  if (ec)
    throw UnmountError{target, ec.message()};

  auto backup = backupOf(target);
  if (present(backup)) {
    fs::rename(backup, target, ec);
    if (ec)
      throw UnmountError{
          target, fmt::format("could not restore {}: {}", backup, ec.message())};
    debug("Restored {}", target);
  }

  fs::remove(recordOf(target), ec);
  if (ec)
    throw UnmountError{target, fmt::format("could not remove copy record: {}",
                                           ec.message())};
}

// MountTable

MountTable::MountTable(fs::path root, std::vector<MountPoint> points,
                       MountBackend &backend)
    : m_root{normalized(root)}, m_points{std::move(points)},
      m_backend{backend} {
  std::set<fs::path> seen;
  for (auto &point : m_points) {
    point.target = normalized(point.target.relative_path());
    if (!seen.insert(point.target).second)
      throw std::invalid_argument{
          fmt::format("Duplicate mount target '{}'", point.target)};
  }
}

fs::path MountTable::absolute(const MountPoint &point) const {
  if (point.target.empty())
    return m_root;

  return m_root / point.target;
}

bool MountTable::isBound(const MountPoint &point) {
  auto target = absolute(point);

  if (point.kind == MountKind::Copy)
    return m_backend.copyInstalled(target);

  auto entries = m_backend.mountEntries();
  auto *visible = visibleAt(entries, target);
  if (!visible)
    return false;

  if (point.kind == MountKind::Pseudo)
    return isOwnPseudo(point, *visible);

  return true;
}

bool MountTable::isBound(const fs::path &path) {
  auto relative = normalized(path.is_absolute()
                                 ? path.lexically_relative(m_root)
                                 : path);

  auto it = std::ranges::find(m_points, relative, &MountPoint::target);
  if (it != m_points.end())
    return isBound(*it);

  auto entries = m_backend.mountEntries();
  auto target = relative.empty() ? m_root : m_root / relative;
  return visibleAt(entries, target) != nullptr;
}

bool MountTable::bind(const MountPoint &point) {
  auto target = absolute(point);

  if (isBound(point)) {
    debug("{} is already bound", target);
    return false;
  }

  debug("Binding {} ({}) at {}", point.source, kindName(point.kind), target);

  switch (point.kind) {
  case MountKind::Pseudo:
    m_backend.prepareDirectory(target);
    m_backend.mountFs(point.fstype, point.source, target, point.flags,
                      point.options);
    break;
  case MountKind::Bind:
  case MountKind::RecursiveBind:
    m_backend.prepareTarget(point.source, target);
    m_backend.bind(point.source, target,
                   point.kind == MountKind::RecursiveBind);
    break;
  case MountKind::Copy:
    m_backend.installCopy(point.source, target);
    break;
  }

  return true;
}

bool MountTable::unbind(const MountPoint &point) {
  auto target = absolute(point);

  if (!isBound(point))
    return false;

  debug("Unbinding {} ({})", target, kindName(point.kind));

  if (point.kind == MountKind::Copy) {
    m_backend.removeCopy(target);
    return true;
  }

  if (point.kind == MountKind::RecursiveBind) {
    // Mount order has parents before children, so reverse order takes the
    // deepest and most recent ones first.
    auto entries = m_backend.mountEntries();
    for (auto &child : entries | std::views::reverse) {
      if (isBelow(child.target, target))
        m_backend.unmount(child.target);
    }
  }

  m_backend.unmount(target);
  return true;
}

void MountTable::bindAll() {
  std::vector<const MountPoint *> bound;

  try {
    for (auto &point : m_points) {
      if (bind(point))
        bound.push_back(&point);
    }
  } catch (MountError &e) {
    error("{}. Unwinding {} mount(s).", e.what(), bound.size());

    for (auto *point : bound | std::views::reverse) {
      try {
        unbind(*point);
      } catch (UnmountError &unwindError) {
        error("While unwinding: {}", unwindError.what());
      }
    }

    throw;
  }
}

void MountTable::unbindAll() {
  std::vector<UnmountError::Failure> failures;

  for (auto &point : m_points | std::views::reverse) {
    try {
      unbind(point);
    } catch (UnmountError &e) {
      error("{}", e.what());
      for (auto &failure : e.failures())
        failures.push_back(failure);
    }
  }

  if (!failures.empty())
    throw UnmountError{std::move(failures)};
}

// Table construction

std::vector<MountPoint> defaultTable(const fs::path &root,
                                     const TableOptions &options) {
  std::vector<MountPoint> points;

  if (options.overlay) {
    auto upper = fs::absolute(*options.overlay).lexically_normal();
    if (!upper.has_filename())
      upper = upper.parent_path();
    auto work = upper.parent_path() /
                fmt::format("._overlay_{}", upper.filename().string());

    std::error_code ec;
    for (auto &dir : {upper, work}) {
      fs::create_directories(dir, ec);
      if (ec)
        throw ConfigError{
            fmt::format("Could not create {}: {}", dir, ec.message())};
    }

    points.push_back(MountPoint{
        .kind = MountKind::Pseudo,
        .source = "overlay",
        .target = {},
        .fstype = "overlay",
        .flags = 0,
        .options = fmt::format("lowerdir={},upperdir={},workdir={}",
                               normalized(root).string(), upper.string(),
                               work.string()),
    });
  }

  points.push_back(MountPoint{
      .kind = MountKind::Pseudo,
      .source = "proc",
      .target = "proc",
      .fstype = "proc",
      .flags = MS_NOSUID | MS_NODEV | MS_NOEXEC,
  });
  points.push_back(MountPoint{
      .kind = MountKind::RecursiveBind, .source = "/sys", .target = "sys"});
  points.push_back(MountPoint{
      .kind = MountKind::RecursiveBind, .source = "/dev", .target = "dev"});
  points.push_back(MountPoint{
      .kind = MountKind::Pseudo,
      .source = "stage_root_shm",
      .target = "dev/shm",
      .fstype = "tmpfs",
      .flags = MS_NOSUID | MS_NODEV,
      .options = "mode=1777",
  });
  points.push_back(MountPoint{
      .kind = MountKind::Pseudo,
      .source = "stage_root_tmpfs",
      .target = "tmp",
      .fstype = "tmpfs",
      .flags = MS_NOSUID | MS_NODEV,
      .options = "mode=1777",
  });
  points.push_back(MountPoint{.kind = MountKind::Copy,
                              .source = "/etc/resolv.conf",
                              .target = "etc/resolv.conf"});

  if (options.repo)
    points.push_back(MountPoint{
        .kind = MountKind::Bind,
        .source = fs::absolute(*options.repo).lexically_normal().string(),
        .target = "var/db/repos/gentoo"});

  if (options.xorg)
    points.push_back(MountPoint{.kind = MountKind::Bind,
                                .source = "/tmp/.X11-unix",
                                .target = "tmp/.X11-unix"});

  for (auto &bindArg : options.binds) {
    for (auto bindPart : bindArg | std::views::split(',')) {
      auto bind = std::string_view{bindPart};
      if (bind.empty())
        continue;

      std::string_view outside = bind;
      std::string_view inside = bind;
      auto sep = bind.find(':');
      if (sep != bind.npos) {
        outside = bind.substr(0, sep);
        inside = bind.substr(sep + 1);
      }

      if (outside.empty() || inside.empty())
        throw ConfigError{fmt::format("Invalid bind spec '{}'", bind)};

      auto target = fs::path{inside}.lexically_normal().relative_path();
      if (target.empty() || *target.begin() == "..")
        throw ConfigError{fmt::format(
            "Bind target '{}' does not lie inside the tree", inside)};

      points.push_back(MountPoint{
          .kind = MountKind::Bind,
          .source = fs::absolute(fs::path{outside}).lexically_normal().string(),
          .target = target});
    }
  }

  return points;
}

} // namespace mounts
