// Detached signature tests
// Author: Max Schwarz <max.schwarz@online.de>

#include <cassert>
#include <chrono>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "errors.h"
#include "keyring.h"
#include "log.h"
#include "openpgp.h"
#include "signature.h"
#include "test_util.h"

LogLevel log_level = LogLevel::Error;

using namespace std::chrono_literals;

namespace {

// gpgv judges OpenPGP key expiry by the real clock, so our own windows are
// placed around it as well.
const keyring::Clock::time_point NOW = keyring::Clock::now();

keyring::Key makeKey(const std::string &id, const std::string &file,
                     keyring::Clock::time_point notBefore,
                     std::optional<keyring::Clock::time_point> notAfter = {}) {
  return keyring::Key{
      .id = id,
      .material = keyring::parsePublicKey(
          test::readFile(test::dataFile("openpgp/" + file))),
      .notBefore = notBefore,
      .notAfter = notAfter,
  };
}

std::filesystem::path message() { return test::dataFile("openpgp/message"); }

signature::Detached signatureBy(const std::string &signer) {
  return signature::load(test::dataFile("openpgp/message." + signer + ".asc"));
}

void testParse() {
  auto armored = signature::load(test::dataFile("openpgp/message.release.asc"));
  auto binary = signature::load(test::dataFile("openpgp/message.release.sig"));
  assert(!armored.packets.empty());
  assert(armored.packets == binary.packets);
  assert(openpgp::firstPacketTag(armored.packets) ==
         static_cast<int>(openpgp::PacketTag::Signature));

  for (std::string bad :
       {std::string{}, std::string{"not a signature"},
        std::string{"-----BEGIN PGP SIGNATURE-----\n\n!!!!\n"
                    "-----END PGP SIGNATURE-----\n"},
        test::readFile(test::dataFile("openpgp/release.asc"))}) {
    std::istringstream stream{bad};
    bool threw =
        test::throws<SignatureInvalid>([&] { signature::parse(stream); });
    assert(threw && "Expected SignatureInvalid for a malformed signature");
  }

  bool threw = test::throws<AcquisitionError>(
      [&] { signature::load(test::dataFile("openpgp/missing.asc")); });
  assert(threw && "Expected AcquisitionError for a missing signature");
}

void testParseStatus() {
  using openpgp::Verdict;

  assert(openpgp::parseStatus("[GNUPG:] NEWSIG\n"
                              "[GNUPG:] GOODSIG 12A35C22B57369C2 Release\n"
                              "[GNUPG:] VALIDSIG 2D59A5D91DD3591D7C951D5F12A35C"
                              "22B57369C2 2026-07-01\n") == Verdict::Good);

  // GOODSIG alone is not enough
  assert(openpgp::parseStatus("[GNUPG:] GOODSIG 12A35C22B57369C2 Release\n") ==
         Verdict::NoKey);

  assert(openpgp::parseStatus("[GNUPG:] KEYEXPIRED 1578009600\n"
                              "[GNUPG:] EXPKEYSIG CC8D42DD8C2B5727 Old\n"
                              "[GNUPG:] VALIDSIG FD82 2020-01-02\n") ==
         Verdict::KeyExpired);

  assert(openpgp::parseStatus("[GNUPG:] REVKEYSIG 12A35C22B57369C2 Release\n"
                              "[GNUPG:] VALIDSIG 2D59 2026-07-01\n") ==
         Verdict::Revoked);

  assert(openpgp::parseStatus("[GNUPG:] BADSIG 12A35C22B57369C2 Release\n") ==
         Verdict::Bad);

  assert(openpgp::parseStatus("[GNUPG:] ERRSIG 9F8367BDB31C6681 22 10 00 0 9\n"
                              "[GNUPG:] NO_PUBKEY 9F8367BDB31C6681\n") ==
         Verdict::NoKey);

  // Human readable lines never count, even if they look like status lines
  assert(openpgp::parseStatus("gpgv: [GNUPG:] GOODSIG 12A35C22B57369C2 x\n"
                              "gpgv: [GNUPG:] VALIDSIG 2D59 2026-07-01\n") ==
         Verdict::NoKey);
  assert(openpgp::parseStatus("") == Verdict::NoKey);
}

void testValidKeyAccepts() {
  keyring::TrustKeyring trust{
      1, {makeKey("release", "release.asc", NOW - 24h, NOW + 24h)}};

  assert(signature::verify(message(), signatureBy("release"), trust, NOW) ==
         "release");

  // The binary key export is the same key
  keyring::TrustKeyring binary{1,
                               {makeKey("release", "release.gpg", NOW - 24h)}};
  assert(signature::verify(message(), signatureBy("release"), binary, NOW) ==
         "release");
}

void testTamperedArtifact() {
  keyring::TrustKeyring trust{1,
                              {makeKey("release", "release.asc", NOW - 24h)}};

  test::TempDir dir;
  auto artifact = dir.path() / "stage3.tar.xz";
  test::writeFile(artifact, test::readFile(message()) + "!");

  bool threw = test::throws<SignatureInvalid>(
      [&] { signature::verify(artifact, signatureBy("release"), trust, NOW); });
  assert(threw && "Expected SignatureInvalid for a modified artifact");

  threw = test::throws<AcquisitionError>([&] {
    signature::verify(dir.path() / "missing", signatureBy("release"), trust,
                      NOW);
  });
  assert(threw && "Expected AcquisitionError for a missing artifact");
}

void testUnrelatedKey() {
  keyring::TrustKeyring trust{1,
                              {makeKey("release", "release.asc", NOW - 24h)}};

  bool threw = test::throws<SignatureInvalid>([&] {
    signature::verify(message(), signatureBy("unrelated"), trust, NOW);
  });
  assert(threw && "Expected SignatureInvalid for a foreign key");
}

void testExpiredKeyIsNotInvalid() {
  keyring::TrustKeyring trust{
      1, {makeKey("release", "release.asc", NOW - 48h, NOW - 24h)}};

  bool expired = false;
  bool invalid = false;
  try {
    signature::verify(message(), signatureBy("release"), trust, NOW);
  } catch (const SignatureKeyExpired &) {
    expired = true;
  } catch (const SignatureInvalid &) {
    invalid = true;
  }
  assert(expired && !invalid && "Expected SignatureKeyExpired");

  // Not yet valid counts the same
  keyring::TrustKeyring future{1,
                               {makeKey("release", "release.asc", NOW + 24h)}};
  bool threw = test::throws<SignatureKeyExpired>([&] {
    signature::verify(message(), signatureBy("release"), future, NOW);
  });
  assert(threw && "Expected SignatureKeyExpired for a future key");

  // A current key that did not sign does not hide the stale one that did
  keyring::TrustKeyring mixed{
      1,
      {makeKey("current", "unrelated.asc", NOW - 24h),
       makeKey("release", "release.asc", NOW - 48h, NOW - 24h)}};
  threw = test::throws<SignatureKeyExpired>([&] {
    signature::verify(message(), signatureBy("release"), mixed, NOW);
  });
  assert(threw && "Expected SignatureKeyExpired with a current key present");

  // A stale key that did not sign either is no excuse
  threw = test::throws<SignatureInvalid>([&] {
    signature::verify(message(), signatureBy("unrelated"), trust, NOW);
  });
  assert(threw && "Expected SignatureInvalid for an unrelated signature");
}

void testOpenPgpExpiredKey() {
  // Our window is open, but the OpenPGP key expired in 2020
  keyring::TrustKeyring trust{1,
                              {makeKey("old", "expired.asc", NOW - 24h)}};

  bool threw = test::throws<SignatureKeyExpired>([&] {
    signature::verify(message(), signatureBy("expired"), trust, NOW);
  });
  assert(threw && "Expected SignatureKeyExpired for an expired OpenPGP key");
}

void testRotation() {
  keyring::TrustKeyring trust{
      2,
      {makeKey("release-old", "unrelated.asc", NOW - 48h, NOW - 24h),
       makeKey("release-new", "release.asc", NOW - 24h)}};

  assert(signature::verify(message(), signatureBy("release"), trust, NOW) ==
         "release-new");

  // Old artifacts signed by the retired key are reported as stale
  bool threw = test::throws<SignatureKeyExpired>([&] {
    signature::verify(message(), signatureBy("unrelated"), trust, NOW);
  });
  assert(threw && "Expected SignatureKeyExpired for the retired key");
}

} // namespace

int main() {
  testParse();
  testParseStatus();
  testValidKeyAccepts();
  testTamperedArtifact();
  testUnrelatedKey();
  testExpiredKeyIsNotInvalid();
  testOpenPgpExpiredKey();
  testRotation();

  std::cout << "signature tests ok\n";
  return 0;
}
