// Ordered mount table for a target tree
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef MOUNTS_H
#define MOUNTS_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "os.h"

namespace mounts {

enum class MountKind {
  Pseudo,        //!< fresh filesystem (proc, tmpfs, overlay)
  Bind,          //!< non-recursive bind, made a slave
  RecursiveBind, //!< rbind, made a recursive slave
  Copy,          //!< host file copied into the tree
};

std::string_view kindName(MountKind kind);

struct MountPoint {
  MountKind kind = MountKind::Bind;

  // Host path for binds and copies, device name for Pseudo mounts
  std::string source;

  // Relative to the tree root. Empty for mounts over the root itself.
  std::filesystem::path target;

  // Pseudo only
  std::string fstype;
  unsigned long flags = 0;
  std::string options;
};

// All kernel and filesystem side effects of the mount table go through
// here. Errors are reported as MountError / UnmountError.
class MountBackend {
public:
  virtual ~MountBackend() = default;

  // Current mounts in mount order
  virtual std::vector<os::MountEntry> mountEntries() = 0;

  virtual void prepareTarget(const std::filesystem::path &source,
                             const std::filesystem::path &target) = 0;
  virtual void prepareDirectory(const std::filesystem::path &target) = 0;

  virtual void bind(const std::filesystem::path &source,
                    const std::filesystem::path &target, bool recursive) = 0;
  virtual void mountFs(const std::string &fstype, const std::string &source,
                       const std::filesystem::path &target,
                       unsigned long flags, const std::string &options) = 0;
  virtual void unmount(const std::filesystem::path &target) = 0;

  // True only if @p target holds a copy this backend installed
  virtual bool copyInstalled(const std::filesystem::path &target) = 0;
  virtual void installCopy(const std::filesystem::path &source,
                           const std::filesystem::path &target) = 0;
  virtual void removeCopy(const std::filesystem::path &target) = 0;
};

class LinuxMountBackend : public MountBackend {
public:
  std::vector<os::MountEntry> mountEntries() override;

  void prepareTarget(const std::filesystem::path &source,
                     const std::filesystem::path &target) override;
  void prepareDirectory(const std::filesystem::path &target) override;

  void bind(const std::filesystem::path &source,
            const std::filesystem::path &target, bool recursive) override;
  void mountFs(const std::string &fstype, const std::string &source,
               const std::filesystem::path &target, unsigned long flags,
               const std::string &options) override;
  void unmount(const std::filesystem::path &target) override;

  bool copyInstalled(const std::filesystem::path &target) override;
  void installCopy(const std::filesystem::path &source,
                   const std::filesystem::path &target) override;
  void removeCopy(const std::filesystem::path &target) override;
};

// The fixed bind order for one tree. Bound state is never cached: every
// query asks the backend again. A Pseudo point only counts as bound if the
// mount visible at its target has the same type, source and upperdir.
class MountTable {
public:
  // Throws std::invalid_argument on duplicate targets.
  MountTable(std::filesystem::path root, std::vector<MountPoint> points,
             MountBackend &backend);

  const std::filesystem::path &root() const { return m_root; }
  const std::vector<MountPoint> &points() const { return m_points; }

  std::filesystem::path absolute(const MountPoint &point) const;

  bool isBound(const MountPoint &point);
  bool isBound(const std::filesystem::path &path);

  // Returns false if @p point was already bound. Throws MountError.
  bool bind(const MountPoint &point);

  // Returns false if @p point was not bound. Throws UnmountError.
  bool unbind(const MountPoint &point);

  // Binds in table order. On failure, everything bound by this call is
  // unbound again in reverse and the original MountError is rethrown.
  void bindAll();

  // Unbinds in reverse table order, continuing past failures.
  // Throws one UnmountError listing every failure.
  void unbindAll();

private:
  std::filesystem::path m_root;
  std::vector<MountPoint> m_points;
  MountBackend &m_backend;
};

struct TableOptions {
  std::optional<std::filesystem::path> overlay;
  std::optional<std::filesystem::path> repo;
  bool xorg = false;

  // OUTSIDE[:INSIDE]
  std::vector<std::string> binds;
};

// proc, sys, dev, dev/shm, tmp, etc/resolv.conf plus whatever @p options
// ask for. Creates the overlay upper and work directories.
// Throws ConfigError on malformed bind specs.
std::vector<MountPoint> defaultTable(const std::filesystem::path &root,
                                     const TableOptions &options = {});

} // namespace mounts

#endif
