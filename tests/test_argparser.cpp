// Argument parser tests
// Author: Max Schwarz <max.schwarz@online.de>

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "argparser.h"
#include "log.h"
#include "test_util.h"

LogLevel log_level = LogLevel::Error;

using argparser::ArgumentException;
using argparser::Option;
using argparser::PositionalArguments;

namespace {

struct SessionArgs {
  Option<bool, {.shortName = 'v', .help = "Be verbose."}> verbose = false;
  Option<std::string, {.metavar = "DIR", .help = "Work directory."}> work_dir;
  Option<int, {.shortName = 'j', .metavar = "N"}> jobs = 1;
  Option<std::vector<std::string>, {.metavar = "NAME=VALUE"}> env;
  Option<std::optional<std::string>, {.metavar = "URL"}> mirror;
  PositionalArguments remaining;
};

struct KeyringArgs {
  Option<std::optional<std::string>, {.required = true, .metavar = "DIR"}>
      refresh_from;
};

template <typename ArgClass>
bool rejects(const std::vector<std::string> &arguments) {
  ArgClass args;
  return test::throws<ArgumentException>(
      [&] { argparser::parse(args, arguments); });
}

void testOptions() {
  SessionArgs args;
  argparser::parse(args, std::vector<std::string>{
                             "-v", "--work-dir", "/srv/work", "-j", "4",
                             "--env", "A=1", "--env=B=2", "--mirror=http://m",
                             "run", "--verbose", "ls"});

  assert(args.verbose);
  assert(args.work_dir == "/srv/work");
  assert(int(args.jobs) == 4);
  assert((std::vector<std::string>(args.env) ==
          std::vector<std::string>{"A=1", "B=2"}));
  assert(args.mirror && *args.mirror == "http://m");

  // Everything from the first positional argument on is the command
  assert((std::vector<std::string>(args.remaining) ==
          std::vector<std::string>{"run", "--verbose", "ls"}));
  assert(args.remaining.isCatchAll());
}

void testSeparator() {
  SessionArgs args;
  argparser::parse(args, std::vector<std::string>{"--jobs=2", "--", "-v"});

  assert(!args.verbose);
  assert(int(args.jobs) == 2);
  assert(!args.mirror);
  assert((std::vector<std::string>(args.remaining) ==
          std::vector<std::string>{"-v"}));
}

void testErrors() {
  assert(rejects<SessionArgs>({"--no-such-option"}));
  assert(rejects<SessionArgs>({"--work-dir"}) && "missing value");
  assert(rejects<SessionArgs>({"--verbose=yes"}) && "flags take no value");
  assert(rejects<SessionArgs>({"--jobs=four"}));
  assert(rejects<SessionArgs>({"-vj"}) && "short options are not bundled");

  assert(rejects<KeyringArgs>({}) && "required option missing");
  assert(rejects<KeyringArgs>({"positional"}));

  KeyringArgs args;
  argparser::parse(args, std::vector<std::string>{"--refresh-from", "/tmp/k"});
  assert(*args.refresh_from == "/tmp/k");
}

void testDescribe() {
  auto text = argparser::describe<SessionArgs>();

  assert(text.find("-v, --verbose") != std::string::npos);
  assert(text.find("Be verbose.") != std::string::npos);
  assert(text.find("--work-dir DIR") != std::string::npos);
  assert(text.find("-j, --jobs N") != std::string::npos);
  assert(text.find("--env NAME=VALUE") != std::string::npos);
  assert(text.find("(repeatable)") != std::string::npos);
  assert(text.find("remaining") == std::string::npos);

  auto keyring = argparser::describe<KeyringArgs>();
  assert(keyring.find("--refresh-from DIR") != std::string::npos);
  assert(keyring.find("(required)") != std::string::npos);
}

} // namespace

int main() {
  testOptions();
  testSeparator();
  testErrors();
  testDescribe();

  std::cout << "argparser tests ok\n";
  return 0;
}
