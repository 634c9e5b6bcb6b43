// OS utility tests
// Author: Max Schwarz <max.schwarz@online.de>

#include <algorithm>
#include <array>
#include <cassert>
#include <iostream>
#include <string>

#include <sys/stat.h>

#include "log.h"
#include "os.h"
#include "test_util.h"

LogLevel log_level = LogLevel::Error;

namespace fs = std::filesystem;

namespace {

void testRun() {
  assert(os::find_binary("sh"));
  assert(!os::find_binary("stage-root-no-such-binary"));

  std::array<std::string, 3> fail{"sh", "-c", "exit 3"};
  assert(os::run(fail) == 3);

  std::array<std::string, 3> print{"sh", "-c", "printf 'a b\\n'"};
  auto output = os::run_get_output(print);
  assert(output && *output == "a b\n");

  assert(!os::run_get_output(fail) && "failing commands yield no output");

  std::array<std::string, 3> both{"sh", "-c", "echo partial; exit 1"};
  std::string output;
  assert(os::run_with_output(both, output) == 1);
  assert(output == "partial\n" && "output is kept for failing commands");
}

void testFiles() {
  test::TempDir dir;
  auto a = dir.path() / "a";
  auto b = dir.path() / "b";

  assert(os::write_file_atomic(a, "nameserver 10.0.0.1\n"));
  assert(test::readFile(a) == "nameserver 10.0.0.1\n");
  assert(!fs::exists(dir.path() / "a.tmp"));

  assert(os::copy_file(a, b, 0600));
  assert(test::readFile(b) == "nameserver 10.0.0.1\n");
  struct stat st {};
  assert(stat(b.c_str(), &st) == 0);
  assert((st.st_mode & 0777) == 0600);

  assert(!os::copy_file(dir.path() / "missing", b));
  assert(!os::write_file_atomic(dir.path() / "no" / "such" / "dir", "x"));
}

void testMountEntries() {
  test::TempDir dir;

  auto src = dir.path() / "src";
  fs::create_directories(src / "sub");
  test::writeFile(src / "file", "x");

  assert(os::prepare_mount_target(src / "sub", dir.path() / "t" / "sub"));
  assert(fs::is_directory(dir.path() / "t" / "sub"));
  assert(os::prepare_mount_target(src / "file", dir.path() / "t" / "f"));
  assert(fs::is_regular_file(dir.path() / "t" / "f"));

  auto entries = os::mount_entries();
  assert(std::ranges::find(entries, fs::path{"/"}, &os::MountEntry::target) !=
         entries.end());
  assert(os::mounts_below(dir.path()).empty());
}

void testParseMountinfo() {
  auto overlay = os::parse_mountinfo_line(
      "412 29 0:51 / /srv/work/gentoo rw,relatime shared:220 - overlay "
      "overlay rw,lowerdir=/srv/work/gentoo,upperdir=/srv/my\\040changes,"
      "workdir=/srv/._overlay_my\\040changes");
  assert(overlay);
  assert(overlay->target == "/srv/work/gentoo");
  assert(overlay->fstype == "overlay");
  assert(overlay->source == "overlay");
  assert(overlay->options.find("upperdir=/srv/my changes,") !=
         std::string::npos);

  // No optional fields, escaped blank in the mount point
  auto tmp = os::parse_mountinfo_line(
      "36 35 0:30 / /srv/my\\040tree/tmp rw - tmpfs stage_root_tmpfs "
      "rw,mode=1777");
  assert(tmp);
  assert(tmp->target == "/srv/my tree/tmp");
  assert(tmp->source == "stage_root_tmpfs");

  assert(!os::parse_mountinfo_line(""));
  assert(!os::parse_mountinfo_line("36 35 0:30 / /tmp rw shared:1"));
}

} // namespace

int main() {
  testRun();
  testFiles();
  testMountEntries();
  testParseMountinfo();

  std::cout << "os tests ok\n";
  return 0;
}
