// In-memory MountBackend for tests
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef FAKE_MOUNT_BACKEND_H
#define FAKE_MOUNT_BACKEND_H

#include <algorithm>
#include <functional>
#include <iterator>
#include <ranges>
#include <set>
#include <string>
#include <vector>

#include "errors.h"
#include "mounts.h"

namespace test {

class FakeMountBackend : public mounts::MountBackend {
public:
  std::vector<os::MountEntry> mounted;
  std::set<std::filesystem::path> copies;

  // "bind <target>", "mount <target>", "umount <target>", ...
  std::vector<std::string> calls;

  std::set<std::filesystem::path> failMount;
  std::set<std::filesystem::path> failUnmount;

  // Submounts that appear below a recursive bind of the key
  std::vector<std::filesystem::path> recursiveChildren{"fs/cgroup",
                                                       "kernel/security"};

  std::function<void(const std::filesystem::path &)> onMount;

  int mountCalls() const {
    return std::ranges::count_if(calls, [](const std::string &call) {
      return call.starts_with("bind ") || call.starts_with("mount ") ||
             call.starts_with("copy ");
    });
  }

  std::vector<os::MountEntry> mountEntries() override { return mounted; }

  bool isMounted(const std::filesystem::path &target) const {
    return std::ranges::any_of(mounted, [&](const os::MountEntry &entry) {
      return entry.target == target;
    });
  }

  void prepareTarget(const std::filesystem::path &,
                     const std::filesystem::path &) override {}
  void prepareDirectory(const std::filesystem::path &) override {}

  void bind(const std::filesystem::path &source,
            const std::filesystem::path &target, bool recursive) override {
    calls.push_back("bind " + target.string());
    mountHook(target);

    mounted.push_back({.target = target, .fstype = "bind",
                       .source = source.string()});
    if (recursive) {
      for (auto &child : recursiveChildren)
        mounted.push_back({.target = target / child, .fstype = "bind",
                           .source = (source / child).string()});
    }
  }

  void mountFs(const std::string &fstype, const std::string &source,
               const std::filesystem::path &target, unsigned long,
               const std::string &options) override {
    calls.push_back("mount " + target.string());
    mountHook(target);
    mounted.push_back({.target = target, .fstype = fstype, .source = source,
                       .options = options});
  }

  void unmount(const std::filesystem::path &target) override {
    calls.push_back("umount " + target.string());

    if (failUnmount.contains(target))
      throw UnmountError{target, "Device or resource busy"};

    // The most recent mount at a path goes first
    auto it = std::ranges::find(mounted | std::views::reverse, target,
                                &os::MountEntry::target);
    if (it == std::ranges::rend(mounted))
      throw UnmountError{target, "Invalid argument"};

    // Busy if something was mounted below it later on
    auto self = std::next(it).base();
    auto prefix = target.string() + "/";
    if (std::any_of(std::next(self), mounted.end(),
                    [&](const os::MountEntry &entry) {
                      return entry.target.string().starts_with(prefix);
                    }))
      throw UnmountError{target, "Device or resource busy"};

    mounted.erase(self);
  }

  bool copyInstalled(const std::filesystem::path &target) override {
    return copies.contains(target);
  }

  void installCopy(const std::filesystem::path &,
                   const std::filesystem::path &target) override {
    calls.push_back("copy " + target.string());
    mountHook(target);
    copies.insert(target);
  }

  void removeCopy(const std::filesystem::path &target) override {
    calls.push_back("uncopy " + target.string());
    if (failUnmount.contains(target))
      throw UnmountError{target, "Permission denied"};
    copies.erase(target);
  }

private:
  void mountHook(const std::filesystem::path &target) {
    if (onMount)
      onMount(target);
    if (failMount.contains(target))
      throw MountError{target, "Could not mount " + target.string()};
  }
};

} // namespace test

#endif
