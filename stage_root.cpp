// Verified chroot environment manager
// Author: Max Schwarz <max.schwarz@online.de>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/capability.h>
#include <wordexp.h>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fmt/std.h>

#include <scope_guard.hpp>

#include "acquire.h"
#include "argparser.h"
#include "config.h"
#include "download.h"
#include "errors.h"
#include "executor.h"
#include "keyring.h"
#include "log.h"
#include "mounts.h"
#include "os.h"
#include "session.h"

namespace fs = std::filesystem;

LogLevel log_level = LogLevel::Info;

namespace {

using argparser::Option;

struct Args {
  Option<bool, {.shortName = 'h', .help = "This help screen."}> help = false;
  Option<bool, {.help = "Print version information."}> version = false;
  Option<bool, {.shortName = 'd', .help = "Enable debug messages."}> verbose =
      false;
  Option<bool, {.help = "Only print warnings and errors."}> quiet = false;

  Option<std::optional<std::string>,
         {.metavar = "DIR", .help = "Work directory (downloads, sessions)."}>
      work_dir;
  Option<std::optional<std::string>,
         {.metavar = "DIR", .help = "Target tree. Default: WORK_DIR/gentoo"}>
      chroot_dir;
  Option<std::optional<std::string>,
         {.metavar = "URL", .help = "Release mirror."}>
      mirror;
  Option<std::optional<std::string>,
         {.metavar = "ARCH", .help = "Release architecture."}>
      arch;
  Option<std::optional<std::string>,
         {.metavar = "DIR", .help = "Trust keyring bundle."}>
      keyring;

  argparser::PositionalArguments remaining;
};

struct BootstrapArgs {
  Option<bool, {.help = "Keep the release tarball after extraction."}>
      keep_downloads = false;
  Option<bool, {.help = "Re-acquire even if the tree is already prepared."}>
      force = false;
};

struct SessionArgs {
  Option<std::optional<std::string>,
         {.metavar = "DIR", .help = "Keep changes in DIR (overlayfs)."}>
      overlay;
  Option<std::optional<std::string>,
         {.metavar = "DIR", .help = "Bind DIR at /var/db/repos/gentoo."}>
      bind_repo;
  Option<bool, {.help = "Make the host X11 socket available."}> xorg = false;
  Option<std::vector<std::string>,
         {.metavar = "OUT[:IN]", .help = "Make OUT available as IN."}>
      bind;
  Option<std::vector<std::string>,
         {.metavar = "NAME=VALUE", .help = "Set NAME=VALUE in environment."}>
      env;
  Option<bool, {.help = "Fail instead of bootstrapping an empty tree."}>
      no_bootstrap = false;

  argparser::PositionalArguments remaining;
};

struct KeyringArgs {
  Option<std::optional<std::string>,
         {.metavar = "DIR", .help = "Install a newer keyring bundle from DIR."}>
      refresh_from;
};

void usage() {
  fmt::print(R"EOS(
Usage: stage_root [options] <command> [command options] [args...]

Commands:
  bootstrap                Download, verify and extract the latest release.
  shell                    Interactive login shell inside the tree.
  exec CMD [ARGS...]       Run CMD inside the tree.
  run                      Run a script read from stdin inside the tree.
  emerge PACKAGES...       Install packages inside the tree.
  status                   Show tree, mount and keyring state.
  umount                   Remove mounts left behind by a crashed session.
  keyring                  List trusted keys.

Options:
{}
bootstrap options:
{}
Session options (shell, exec, run, emerge, umount):
{}
keyring options:
{}
Extra options can be passed in the STAGE_ROOT_ARGS environment variable.

)EOS",
             argparser::describe<Args>(), argparser::describe<BootstrapArgs>(),
             argparser::describe<SessionArgs>(),
             argparser::describe<KeyringArgs>());
}

template <typename ArgClass>
ArgClass parseCommand(std::span<const std::string> arguments) {
  ArgClass args;
  argparser::parse(args, arguments);
  return args;
}

void requireNoArguments(std::string_view command,
                        std::span<const std::string> arguments) {
  if (!arguments.empty())
    throw argparser::ArgumentException{
        fmt::format("'{}' does not take arguments", command)};
}

void requirePrivileges(std::string_view what) {
  constexpr auto CAPS = std::to_array<cap_value_t>({CAP_SYS_ADMIN, CAP_SYS_CHROOT});

  auto missing = os::missing_capabilities(CAPS);
  if (!missing.empty())
    throw ConfigError{fmt::format(
        "{} needs the capabilities {}. Please run as root.", what, missing)};
}

bool acquireRelease(const config::Settings &settings,
                    const acquire::Options &options) {
  auto trust = keyring::TrustKeyring::load(settings.keyring);
  download::CurlFetcher fetcher;
  acquire::TrustVerifier verifier{trust};

  acquire::Pipeline pipeline{settings, fetcher, verifier, options};
  return pipeline.run();
}

mounts::TableOptions tableOptions(const SessionArgs &args) {
  mounts::TableOptions options;
  if (args.overlay)
    options.overlay = fs::path{*args.overlay};
  if (args.bind_repo)
    options.repo = fs::path{*args.bind_repo};
  options.xorg = args.xorg;
  options.binds = args.bind;
  return options;
}

int bootstrap(const config::Settings &settings,
              std::span<const std::string> arguments) {
  auto args = parseCommand<BootstrapArgs>(arguments);

  requirePrivileges("bootstrap");

  acquireRelease(settings, {.keep_downloads = args.keep_downloads,
                            .force = args.force});
  return 0;
}

int runSession(const config::Settings &settings, executor::Request request,
               const SessionArgs &args) {
  requirePrivileges("Sessions");

  request.env = args.env;

  const auto &root = settings.chroot_dir;
  mounts::LinuxMountBackend backend;
  mounts::MountTable table{root, mounts::defaultTable(root, tableOptions(args)),
                           backend};
  executor::ChrootExecutor executor;

  session::Controller controller{
      settings.sessions_dir(), table, executor, [&] {
        if (acquire::readMarker(root))
          return;

        if (args.no_bootstrap)
          throw ConfigError{fmt::format(
              "{} is not prepared. Run 'stage_root bootstrap' first.", root)};

        info("{} is not prepared yet, bootstrapping it", root);
        acquireRelease(settings, {});
      }};

  return controller.run(request);
}

int sessionCommand(const config::Settings &settings, std::string_view command,
                   std::span<const std::string> arguments) {
  auto args = parseCommand<SessionArgs>(arguments);

  executor::Request request;

  if (command == "shell" || command == "run") {
    requireNoArguments(command, args.remaining);
    request.mode =
        command == "shell" ? executor::Mode::Shell : executor::Mode::Script;
  } else if (command == "exec") {
    if (args.remaining.empty())
      throw argparser::ArgumentException{"'exec' needs a command"};

    request.mode = executor::Mode::Command;
    request.command = args.remaining;
  } else {
    if (args.remaining.empty())
      throw argparser::ArgumentException{"'emerge' needs at least one package"};

    request.mode = executor::Mode::Command;
    request.command = {"emerge", "--autounmask-write", "--quiet-build=y"};
    for (auto &package : args.remaining) {
      if (package.starts_with('-'))
        throw argparser::ArgumentException{
            fmt::format("'{}' is not a package name", package)};
      request.command.push_back(package);
    }
  }

  return runSession(settings, std::move(request), args);
}

int status(const config::Settings &settings,
           std::span<const std::string> arguments) {
  requireNoArguments("status", arguments);

  const auto &root = settings.chroot_dir;
  fmt::print("Target tree: {}\n", root);

  if (auto marker = acquire::readMarker(root))
    fmt::print("  release:   {}\n  digest:    {}\n  key:       {}\n"
               "  extracted: {}\n",
               marker->release, marker->digest, marker->key,
               marker->extracted_at);
  else
    fmt::print("  not prepared\n");

  fmt::print("\nMounts:\n");
  mounts::LinuxMountBackend backend;
  mounts::MountTable table{root, mounts::defaultTable(root), backend};
  for (auto &point : table.points()) {
    auto target = point.target.empty() ? "/" : point.target.string();
    fmt::print("  {:<20} {:<7} {}\n", target, mounts::kindName(point.kind),
               table.isBound(point) ? "bound" : "-");
  }

  auto others = os::mounts_below(root);
  std::erase_if(others, [&](const fs::path &path) {
    return std::ranges::any_of(table.points(), [&](auto &point) {
      return table.absolute(point) == path;
    });
  });
  if (!others.empty())
    fmt::print("  other mounts below the tree: {}\n", others);

  fmt::print("\nKeyring: {}\n", settings.keyring);
  try {
    auto trust = keyring::TrustKeyring::load(settings.keyring);
    fmt::print("  version {}, {} key(s), {} outside their validity window\n",
               trust.version(), trust.keys().size(),
               trust.flagged(keyring::Clock::now()).size());
  } catch (ConfigError &e) {
    fmt::print("  unusable: {}\n", e.what());
  }

  return 0;
}

int umount(const config::Settings &settings,
           std::span<const std::string> arguments) {
  auto args = parseCommand<SessionArgs>(arguments);
  requireNoArguments("umount", args.remaining);

  requirePrivileges("umount");

  const auto &root = settings.chroot_dir;
  mounts::LinuxMountBackend backend;
  mounts::MountTable table{root, mounts::defaultTable(root, tableOptions(args)),
                           backend};

  if (!session::drain(settings.sessions_dir(), table))
    return 0;

  // Binds we do not know about, e.g. from a session with other options
  std::vector<UnmountError::Failure> failures;
  for (auto &path : os::mounts_below(root)) {
    warning("Unmounting unknown mount {}", path);
    if (!os::unmount(path))
      failures.push_back({path, strerror(errno)});
  }
  if (!failures.empty())
    throw UnmountError{std::move(failures)};

  info("No mounts left below {}", root);
  return 0;
}

int keyringCommand(const config::Settings &settings,
                   std::span<const std::string> arguments) {
  auto args = parseCommand<KeyringArgs>(arguments);

  fs::path path = settings.keyring;
  if (args.refresh_from) {
    fs::path dest = settings.work_dir / "keyring";
    if (keyring::refresh(*args.refresh_from, dest))
      path = dest;

    if (path != settings.keyring)
      warning("Using {} instead of the configured keyring {}", path,
              settings.keyring);
  }

  auto trust = keyring::TrustKeyring::load(path);
  auto now = keyring::Clock::now();

  fmt::print("Keyring {} (version {})\n", path, trust.version());
  for (auto &key : trust.keys()) {
    std::string_view state = "valid";
    if (now < key.notBefore)
      state = "not yet valid";
    else if (!key.validAt(now))
      state = "expired";

    fmt::print("  {:<24} {} .. {:<20} {}\n", key.id,
               keyring::formatTimestamp(key.notBefore),
               key.notAfter ? keyring::formatTimestamp(*key.notAfter)
                            : std::string{"(no expiry)"},
               state);
  }

  return 0;
}

std::vector<std::string> argumentsFromEnvironment() {
  std::vector<std::string> ret;

  auto env = getenv("STAGE_ROOT_ARGS");
  if (!env)
    return ret;

  wordexp_t words{};
  auto guard = sg::make_scope_guard([&] { wordfree(&words); });

  if (auto result = wordexp(env, &words, WRDE_SHOWERR | WRDE_NOCMD)) {
    switch (result) {
    case WRDE_BADCHAR:
      throw argparser::ArgumentException{"Invalid character in STAGE_ROOT_ARGS"};
    case WRDE_BADVAL:
      throw argparser::ArgumentException{
          "Undefined env variable in STAGE_ROOT_ARGS"};
    case WRDE_CMDSUB:
      throw argparser::ArgumentException{
          "Command substitution is not allowed in STAGE_ROOT_ARGS"};
    case WRDE_NOSPACE:
      throw std::bad_alloc{};
    case WRDE_SYNTAX:
      throw argparser::ArgumentException{"Syntax error in STAGE_ROOT_ARGS"};
    }
    throw argparser::ArgumentException{"Unknown wordexp() error"};
  }

  for (std::size_t i = 0; i < words.we_wordc; ++i)
    ret.emplace_back(words.we_wordv[i]);

  return ret;
}

int dispatch(const Args &args) {
  if (args.remaining.empty())
    throw argparser::ArgumentException{"No command given"};

  const std::string &command = args.remaining.front();
  std::span<const std::string> arguments{args.remaining.begin() + 1,
                                         args.remaining.end()};

  // Validate the command before touching the filesystem
  constexpr auto COMMANDS = std::to_array<std::string_view>(
      {"bootstrap", "shell", "exec", "run", "emerge", "status", "umount",
       "keyring"});
  if (std::ranges::find(COMMANDS, command) == COMMANDS.end())
    throw argparser::ArgumentException{
        fmt::format("Unknown command '{}'", command)};

  auto settings = config::resolve({
      .work_dir = args.work_dir,
      .chroot_dir = args.chroot_dir,
      .mirror = args.mirror,
      .arch = args.arch,
      .keyring = args.keyring,
  });

  if (command == "bootstrap")
    return bootstrap(settings, arguments);
  if (command == "status")
    return status(settings, arguments);
  if (command == "umount")
    return umount(settings, arguments);
  if (command == "keyring")
    return keyringCommand(settings, arguments);

  return sessionCommand(settings, command, arguments);
}

} // namespace

int main(int argc, char **argv) {
  Args args;

  try {
    argparser::Parser parser{args};

    parser.parse(argumentsFromEnvironment());
    parser.parse(std::span<char *>(argv + 1, argc - 1));
    parser.checkRequired();
  } catch (argparser::ArgumentException &e) {
    error("Could not parse arguments: {}", e.what());
    error("See --help for help.");
    return exit_code::USAGE;
  }

  if (args.help) {
    usage();
    return 0;
  }

  if (args.version) {
    fmt::print("{}.{}.{}\n", VERSION_MAJOR, VERSION_MINOR, VERSION_PATCH);
    return 0;
  }

  // Logging
  if (args.verbose)
    log_level = LogLevel::Debug;
  else if (args.quiet)
    log_level = LogLevel::Warning;

  try {
    return dispatch(args);
  } catch (argparser::ArgumentException &e) {
    error("Could not parse arguments: {}", e.what());
    error("See --help for help.");
    return exit_code::USAGE;
  } catch (stage_root_error &e) {
    error("{}", e.what());
    return e.exit_code();
  } catch (std::invalid_argument &e) {
    error("Invalid mount table: {}", e.what());
    return exit_code::CONFIG;
  } catch (std::exception &e) {
    error("{}", e.what());
    return 1;
  }
}
