// Shared test helpers
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef TEST_UTIL_H
#define TEST_UTIL_H

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>

namespace test {

class TempDir {
public:
  TempDir() {
    std::string pattern =
        (std::filesystem::temp_directory_path() / "stage_root_test-XXXXXX")
            .string();
    if (!mkdtemp(pattern.data()))
      throw std::runtime_error{"mkdtemp() failed"};

    m_path = std::filesystem::canonical(pattern);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return m_path; }

private:
  std::filesystem::path m_path;
};

inline void writeFile(const std::filesystem::path &path,
                      const std::string &content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out{path, std::ios::binary | std::ios::trunc};
  out << content;
}

inline std::string readFile(const std::filesystem::path &path) {
  std::ifstream in{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{in},
                     std::istreambuf_iterator<char>{}};
}

// Fixture shipped under tests/data
inline std::filesystem::path dataFile(const std::string &name) {
  return std::filesystem::path{TEST_DATA_DIR} / name;
}

// Runs @p fn and reports whether it threw an exception of type E
template <typename E, typename Fn> bool throws(Fn &&fn) {
  try {
    fn();
  } catch (const E &) {
    return true;
  }
  return false;
}

} // namespace test

#endif
