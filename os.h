// OS Utilities
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef OS_H
#define OS_H

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <sys/capability.h>
#include <sys/mount.h>

namespace os
{

// Names of the capabilities from @p caps missing in our effective set.
[[nodiscard]]
std::vector<std::string> missing_capabilities(std::span<const cap_value_t> caps);

struct MountEntry
{
    std::filesystem::path target;
    std::string fstype;
    std::string source;

    // Per-superblock options, e.g. lowerdir/upperdir for overlayfs
    std::string options;

    bool operator==(const MountEntry&) const = default;
};

// Mounts currently listed in /proc/self/mountinfo, in mount order.
// Escaped characters (\040 and friends) are decoded.
[[nodiscard]]
std::vector<MountEntry> mount_entries();

// Parses one line of /proc/self/mountinfo
[[nodiscard]]
std::optional<MountEntry> parse_mountinfo_line(std::string_view line);

// Mounts strictly below @p path, most recently mounted first.
[[nodiscard]]
std::vector<std::filesystem::path> mounts_below(const std::filesystem::path& path);

// Creates @p target as a directory or an empty file, matching @p source.
[[nodiscard]]
bool prepare_mount_target(const std::filesystem::path& source, const std::filesystem::path& target);

// Bind-mounts @p source at @p target and makes it a slave (recursively if
// MS_REC is in @p flags), so unmounts never propagate back to the host.
[[nodiscard]]
bool bind_mount(const std::filesystem::path& source, const std::filesystem::path& target, int flags = MS_BIND);

[[nodiscard]]
bool mount_fs(const char* fstype, const char* source, const std::filesystem::path& target, unsigned long flags, const std::string& options = {});

// Lazily detaches if the mount is busy.
[[nodiscard]]
bool unmount(const std::filesystem::path& target);

// Runs @p args (args[0] searched in PATH) and waits for it.
// Returns the exit status, or -1 if the command could not be run.
[[nodiscard]]
int run(std::span<const std::string> args);

// Returns stdout of @p args if it exits with status 0.
[[nodiscard]]
std::optional<std::string> run_get_output(std::span<const std::string> args);

// Like run(), but collects stdout into @p output whatever the exit status.
[[nodiscard]]
int run_with_output(std::span<const std::string> args, std::string& output);

[[nodiscard]]
std::optional<std::filesystem::path> find_binary(const std::string_view& name);

[[nodiscard]]
bool copy_file(const std::filesystem::path& source, const std::filesystem::path& dest, mode_t mode = 0644);

// Writes to a temporary sibling, fsyncs and renames over @p path.
[[nodiscard]]
bool write_file_atomic(const std::filesystem::path& path, std::string_view content);

[[nodiscard]]
bool copy_from_to_fd(int srcFD, int dstFD, const std::optional<std::size_t>& maxSize = {});

[[nodiscard]]
bool write_to_fd(int fd, std::span<const char> data);

}

#endif
