// Detached OpenPGP signature verification against the trust keyring
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef SIGNATURE_H
#define SIGNATURE_H

#include <filesystem>
#include <istream>
#include <string>

#include "keyring.h"

namespace signature {

struct Detached {
  // Binary OpenPGP signature packets
  std::string packets;
};

// Accepts an armored (.asc) or binary signature.
// Throws SignatureInvalid on malformed input.
Detached parse(std::istream &stream);

// Throws AcquisitionError if unreadable, SignatureInvalid if malformed.
Detached load(const std::filesystem::path &path);

// Returns the id of the key that accepted the signature over @p artifact.
// Keys outside their validity window at @p now are never used to accept.
// Throws SignatureKeyExpired if only such keys (or keys OpenPGP itself
// considers expired) made the signature, SignatureInvalid otherwise.
std::string verify(const std::filesystem::path &artifact,
                   const Detached &signature,
                   const keyring::TrustKeyring &keyring,
                   keyring::Clock::time_point now = keyring::Clock::now());

} // namespace signature

#endif
