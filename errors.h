// Error taxonomy
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef ERRORS_H
#define ERRORS_H

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Process exit codes for failures that happen outside the executed command.
namespace exit_code {
constexpr int USAGE = 2;
constexpr int ACQUISITION = 90;
constexpr int DIGEST_MISMATCH = 91;
constexpr int DIGEST_ALGORITHM_UNAVAILABLE = 92;
constexpr int SIGNATURE_INVALID = 93;
constexpr int SIGNATURE_KEY_EXPIRED = 94;
constexpr int MOUNT = 95;
constexpr int UNMOUNT = 96;
constexpr int EXECUTION = 97;
constexpr int CONFIG = 98;
} // namespace exit_code

class stage_root_error : public std::runtime_error {
public:
  stage_root_error(const std::string &msg, int code)
      : std::runtime_error{msg}, m_code{code} {}

  int exit_code() const noexcept { return m_code; }

private:
  int m_code;
};

// Network or storage failure while fetching the artifact. Retry by
// re-running bootstrap.
class AcquisitionError : public stage_root_error {
public:
  explicit AcquisitionError(const std::string &msg)
      : stage_root_error{msg, exit_code::ACQUISITION} {}
};

class VerificationError : public stage_root_error {
protected:
  using stage_root_error::stage_root_error;
};

class DigestMismatch : public VerificationError {
public:
  explicit DigestMismatch(const std::string &msg)
      : VerificationError{msg, exit_code::DIGEST_MISMATCH} {}
};

class DigestAlgorithmUnavailable : public VerificationError {
public:
  explicit DigestAlgorithmUnavailable(const std::string &msg)
      : VerificationError{msg, exit_code::DIGEST_ALGORITHM_UNAVAILABLE} {}
};

class SignatureInvalid : public VerificationError {
public:
  explicit SignatureInvalid(const std::string &msg)
      : VerificationError{msg, exit_code::SIGNATURE_INVALID} {}
};

// The signer's keys are all outside their validity window: the keyring
// bundle needs an update.
class SignatureKeyExpired : public VerificationError {
public:
  explicit SignatureKeyExpired(const std::string &msg)
      : VerificationError{msg, exit_code::SIGNATURE_KEY_EXPIRED} {}
};

class MountError : public stage_root_error {
public:
  MountError(const std::filesystem::path &path, const std::string &msg)
      : stage_root_error{msg, exit_code::MOUNT}, m_path{path} {}

  const std::filesystem::path &path() const noexcept { return m_path; }

private:
  std::filesystem::path m_path;
};

class UnmountError : public stage_root_error {
public:
  struct Failure {
    std::filesystem::path path;
    std::string reason;
  };

  explicit UnmountError(std::vector<Failure> failures);
  UnmountError(const std::filesystem::path &path, const std::string &reason)
      : UnmountError{std::vector<Failure>{{path, reason}}} {}

  const std::vector<Failure> &failures() const noexcept { return m_failures; }

private:
  static std::string describe(const std::vector<Failure> &failures);

  std::vector<Failure> m_failures;
};

inline UnmountError::UnmountError(std::vector<Failure> failures)
    : stage_root_error{describe(failures), exit_code::UNMOUNT},
      m_failures{std::move(failures)} {}

inline std::string UnmountError::describe(const std::vector<Failure> &failures) {
  std::string msg = "Could not unmount";
  for (std::size_t i = 0; i < failures.size(); ++i) {
    msg += (i == 0) ? " " : ", ";
    msg += failures[i].path.string() + " (" + failures[i].reason + ")";
  }
  return msg;
}

// Could not start the process. A nonzero exit status is not an error.
class ExecutionError : public stage_root_error {
public:
  explicit ExecutionError(const std::string &msg)
      : stage_root_error{msg, exit_code::EXECUTION} {}
};

class ConfigError : public stage_root_error {
public:
  explicit ConfigError(const std::string &msg)
      : stage_root_error{msg, exit_code::CONFIG} {}
};

#endif
