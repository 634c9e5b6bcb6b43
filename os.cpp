// OS Utilities
// Author: Max Schwarz <max.schwarz@online.de>

#include "os.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <ranges>
#include <sstream>

#include <fmt/ranges.h>
#include <fmt/std.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <scope_guard.hpp>

#include "log.h"

namespace fs = std::filesystem;

namespace os
{

namespace
{
    // Decodes the octal escapes the kernel uses for whitespace and backslashes
    std::string unescape_mount_field(std::string_view field)
    {
        std::string out;
        out.reserve(field.size());

        for(std::size_t i = 0; i < field.size(); ++i)
        {
            if(field[i] == '\\' && i + 3 < field.size() &&
               std::all_of(field.begin() + i + 1, field.begin() + i + 4, [](char c){ return c >= '0' && c <= '7'; }))
            {
                out.push_back(static_cast<char>(
                    (field[i+1] - '0') * 64 + (field[i+2] - '0') * 8 + (field[i+3] - '0')
                ));
                i += 3;
            }
            else
                out.push_back(field[i]);
        }

        return out;
    }

    std::vector<char*> make_argv(std::span<const std::string> args)
    {
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for(auto& arg : args)
            argv.push_back(strdup(arg.c_str()));
        argv.push_back(nullptr);
        return argv;
    }

    [[noreturn]]
    void exec_child(std::span<const std::string> args)
    {
        auto argv = make_argv(args);

        debug("Running {}", args);

        execvp(argv[0], argv.data());
        sys_error("Could not run {}", args[0]);
        _exit(127);
    }

    int wait_for(pid_t pid, const std::string& cmd)
    {
        int wstatus = 0;
        while(waitpid(pid, &wstatus, 0) < 0)
        {
            if(errno == EINTR)
                continue;

            sys_error("Could not wait for cmd {}", cmd);
            return -1;
        }

        if(WIFEXITED(wstatus))
            return WEXITSTATUS(wstatus);

        error("{} failed/crashed", cmd);
        return -1;
    }
}

std::vector<std::string> missing_capabilities(std::span<const cap_value_t> caps)
{
    std::vector<std::string> missing;

    cap_t current = cap_get_proc();
    if(!current)
    {
        sys_error("Could not get caps");
        for(auto cap : caps)
            missing.push_back(std::to_string(cap));
        return missing;
    }

    auto guard = sg::make_scope_guard([&]{ cap_free(current); });

    for(auto cap : caps)
    {
        cap_flag_value_t value = CAP_CLEAR;
        if(cap_get_flag(current, cap, CAP_EFFECTIVE, &value) == 0 && value == CAP_SET)
            continue;

        char* name = cap_to_name(cap);
        missing.push_back(name ? name : std::to_string(cap));
        if(name)
            cap_free(name);
    }

    return missing;
}

std::optional<MountEntry> parse_mountinfo_line(std::string_view line)
{
    // ID PARENT MAJ:MIN ROOT TARGET OPTIONS [OPTIONAL...] - FSTYPE SOURCE SUPER_OPTIONS
    std::vector<std::string_view> fields;
    for(const auto field : std::views::split(line, ' '))
    {
        std::string_view value{field.begin(), field.end()};
        if(!value.empty())
            fields.push_back(value);
    }

    if(fields.size() < 6)
        return {};

    auto separator = std::find(fields.begin() + 6, fields.end(), std::string_view{"-"});
    if(separator == fields.end() || fields.end() - separator < 3)
        return {};

    MountEntry entry;
    entry.target = unescape_mount_field(fields[4]);
    entry.fstype = unescape_mount_field(*(separator + 1));
    entry.source = unescape_mount_field(*(separator + 2));
    if(fields.end() - separator > 3)
        entry.options = unescape_mount_field(*(separator + 3));

    return entry;
}

std::vector<MountEntry> mount_entries()
{
    std::vector<MountEntry> entries;

    std::ifstream mountfile{"/proc/self/mountinfo"};
    if(!mountfile)
    {
        sys_error("Could not open /proc/self/mountinfo");
        return entries;
    }

    for(std::string line; std::getline(mountfile, line);)
    {
        auto entry = parse_mountinfo_line(line);
        if(!entry)
        {
            error("Could not parse mount line: '{}'", line);
            continue;
        }

        entries.push_back(std::move(*entry));
    }

    return entries;
}

std::vector<fs::path> mounts_below(const fs::path& path)
{
    std::string prefix = path.lexically_normal().string();
    if(!prefix.ends_with('/'))
        prefix += '/';

    std::vector<fs::path> below;
    for(auto& entry : mount_entries())
    {
        if(entry.target.string().starts_with(prefix))
            below.push_back(entry.target);
    }

    std::ranges::reverse(below);
    return below;
}

bool prepare_mount_target(const fs::path& source, const fs::path& target)
{
    std::error_code ec;

    if(fs::is_directory(source, ec))
    {
        fs::create_directories(target, ec);
        if(ec)
        {
            error("Could not create mount point {}: {}", target, ec.message());
            return false;
        }
        return true;
    }

    fs::create_directories(target.parent_path(), ec);
    if(ec)
    {
        error("Could not create directory {}: {}", target.parent_path(), ec.message());
        return false;
    }

    if(!fs::exists(target, ec))
    {
        int fd = open(target.c_str(), O_RDWR|O_CREAT|O_CLOEXEC, 0644);
        if(fd < 0)
        {
            sys_error("Could not create mount point {}", target);
            return false;
        }
        close(fd);
    }

    return true;
}

bool bind_mount(const fs::path& source, const fs::path& target, int flags)
{
    debug("Binding {} to {}", source, target);
    if(mount(source.c_str(), target.c_str(), nullptr, flags, nullptr) != 0)
    {
        sys_error("Could not bind-mount {} to {} (flags={})", source, target, flags);
        return false;
    }
    if(mount(nullptr, target.c_str(), nullptr, (flags & MS_REC)|MS_SLAVE, nullptr) != 0)
    {
        sys_error("Could not change {} to MS_SLAVE", target);

        // A shared bind would propagate our unmounts to the host
        auto savedErrno = errno;
        umount2(target.c_str(), MNT_DETACH);
        errno = savedErrno;
        return false;
    }

    return true;
}

bool mount_fs(const char* fstype, const char* source, const fs::path& target, unsigned long flags, const std::string& options)
{
    debug("Mounting {} ({}) at {}", source, fstype, target);
    if(mount(source, target.c_str(), fstype, flags, options.empty() ? nullptr : options.c_str()) != 0)
    {
        sys_error("Could not mount {} at {}", fstype, target);
        return false;
    }

    return true;
}

bool unmount(const fs::path& target)
{
    if(umount2(target.c_str(), UMOUNT_NOFOLLOW) == 0)
    {
        debug("Unmounted {}", target);
        return true;
    }

    if(errno != EBUSY)
    {
        sys_error("Could not unmount {}", target);
        return false;
    }

    warning("{} is busy, detaching it lazily", target);
    if(umount2(target.c_str(), UMOUNT_NOFOLLOW|MNT_DETACH) != 0)
    {
        sys_error("Could not detach {}", target);
        return false;
    }

    return true;
}

int run(std::span<const std::string> args)
{
    if(args.empty())
        return -1;

    auto pid = fork();
    if(pid == 0)
        exec_child(args);
    if(pid < 0)
    {
        sys_error("Could not fork()");
        return -1;
    }

    return wait_for(pid, args[0]);
}

std::optional<std::string> run_get_output(std::span<const std::string> args)
{
    std::string output;
    int status = run_with_output(args, output);
    if(status != 0)
    {
        if(status > 0)
            error("{} failed with exit code {}", args[0], status);
        return {};
    }

    return output;
}

int run_with_output(std::span<const std::string> args, std::string& output)
{
    if(args.empty())
        return -1;

    int pipefd[2];
    if(pipe2(pipefd, O_CLOEXEC) != 0)
    {
        sys_error("Could not create pipe");
        return -1;
    }

    auto pid = fork();
    if(pid == 0)
    {
        close(pipefd[0]);
        if(dup2(pipefd[1], STDOUT_FILENO) == -1)
            _exit(127);

        exec_child(args);
    }

    close(pipefd[1]);
    auto guard = sg::make_scope_guard([&]{ close(pipefd[0]); });

    if(pid < 0)
    {
        sys_error("Could not fork()");
        return -1;
    }

    std::stringstream ss;
    std::array<char, 1024> buf;
    while(true)
    {
        auto ret = read(pipefd[0], buf.data(), buf.size());
        if(ret < 0)
        {
            if(errno == EINTR)
                continue;

            sys_error("Could not read()");
            break;
        }
        if(ret == 0)
            break;

        ss.write(buf.data(), ret);
    }

    output = ss.str();
    return wait_for(pid, args[0]);
}

std::optional<fs::path> find_binary(const std::string_view& name)
{
    std::string_view PATH = getenv("PATH") ? getenv("PATH") : "/bin:/usr/bin";

    for(const auto dir : std::views::split(PATH, ':'))
    {
        auto path = fs::path(std::string_view(&*dir.begin(), std::ranges::distance(dir))) / fs::path(name);

        std::error_code ec;
        auto stat = fs::status(path, ec);

        if(ec)
            continue;

        if(stat.type() != fs::file_type::directory && (stat.permissions() & fs::perms::owner_exec) != fs::perms::none)
            return path;
    }

    return {};
}

bool copy_file(const fs::path& source, const fs::path& dest, mode_t mode)
{
    int srcFD = open(source.c_str(), O_RDONLY|O_CLOEXEC);
    if(srcFD < 0)
    {
        sys_error("Could not open {}", source);
        return false;
    }
    auto srcGuard = sg::make_scope_guard([&]{ close(srcFD); });

    int dstFD = open(dest.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, mode);
    if(dstFD < 0)
    {
        sys_error("Could not create {}", dest);
        return false;
    }
    auto dstGuard = sg::make_scope_guard([&]{ close(dstFD); });

    if(fchmod(dstFD, mode) != 0)
    {
        sys_error("Could not set mode of {}", dest);
        return false;
    }

    return copy_from_to_fd(srcFD, dstFD);
}

bool write_file_atomic(const fs::path& path, std::string_view content)
{
    fs::path tempFile = path;
    tempFile += ".tmp";

    int fd = open(tempFile.c_str(), O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, 0644);
    if(fd < 0)
    {
        sys_error("Could not create {}", tempFile);
        return false;
    }

    bool ok = write_to_fd(fd, std::span<const char>{content.data(), content.size()});
    if(ok && fsync(fd) != 0)
    {
        sys_error("Could not fsync {}", tempFile);
        ok = false;
    }
    close(fd);

    if(ok && rename(tempFile.c_str(), path.c_str()) != 0)
    {
        sys_error("Could not rename {} to {}", tempFile, path);
        ok = false;
    }

    if(!ok)
        unlink(tempFile.c_str());

    return ok;
}

bool copy_from_to_fd(int srcFD, int dstFD, const std::optional<std::size_t>& maxSize)
{
    std::vector<char> buf(4096 * 1024);

    std::size_t remaining = maxSize.value_or(0);

    while(!maxSize || remaining != 0)
    {
        std::size_t readSize = maxSize ? std::min(buf.size(), remaining) : buf.size();
        auto bytes = read(srcFD, buf.data(), readSize);
        if(bytes < 0)
        {
            if(errno == EINTR)
                continue;

            sys_error("Could not read()");
            return false;
        }
        if(bytes == 0)
            break;

        if(!write_to_fd(dstFD, std::span<const char>{buf.data(), static_cast<std::size_t>(bytes)}))
            return false;

        if(maxSize)
            remaining -= bytes;
    }

    return true;
}

bool write_to_fd(int fd, std::span<const char> data)
{
    std::size_t toWrite = data.size();
    const char* ptr = data.data();

    while(toWrite != 0)
    {
        auto ret = write(fd, ptr, toWrite);
        if(ret < 0 && errno == EINTR)
            continue;
        if(ret <= 0)
        {
            sys_error("Could not write()");
            return false;
        }

        ptr += ret;
        toWrite -= ret;
    }

    return true;
}

}
