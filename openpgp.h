// OpenPGP packets and signature checks through gpgv
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef OPENPGP_H
#define OPENPGP_H

#include <filesystem>
#include <string>
#include <string_view>

namespace openpgp {

enum class PacketTag {
  Signature = 2,
  PublicKey = 6,
};

// Tag of the first packet in @p data, or -1 if it does not start with one
int firstPacketTag(std::string_view data);

// Returns the binary packets in @p data, removing ASCII armor if present.
// The first packet must carry @p expected.
// Throws std::invalid_argument.
std::string packets(std::string_view data, PacketTag expected);

enum class Verdict {
  Good,       //!< good signature, made by the given key
  KeyExpired, //!< good signature, but the OpenPGP key itself has expired
  Revoked,
  Bad,   //!< made by the given key, but not over this data
  NoKey, //!< not made by the given key
};

std::string_view verdictName(Verdict verdict);

// Interprets the --status-fd output of gpg / gpgv
Verdict parseStatus(std::string_view status);

// Checks the detached @p signature (binary packets) over @p data against
// the transferable public key @p key. gpgv runs in a scratch home
// directory, so no user keyring is ever consulted.
// Throws std::runtime_error if gpgv cannot be run.
Verdict verify(std::string_view key, std::string_view signature,
               const std::filesystem::path &data);

} // namespace openpgp

#endif
