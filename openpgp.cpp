// OpenPGP packets and signature checks through gpgv
// Author: Max Schwarz <max.schwarz@online.de>

#include "openpgp.h"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>
#include <fmt/std.h>

#include <scope_guard.hpp>

#include <openssl/evp.h>

#include "log.h"
#include "os.h"

namespace fs = std::filesystem;

namespace openpgp {

namespace {
constexpr std::string_view STATUS_PREFIX = "[GNUPG:] ";

std::string_view armorLabel(PacketTag tag) {
  switch (tag) {
  case PacketTag::Signature:
    return "SIGNATURE";
  case PacketTag::PublicKey:
    return "PUBLIC KEY BLOCK";
  }
  return "MESSAGE";
}

std::string_view trimLine(std::string_view line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' ||
                           line.back() == '\t'))
    line.remove_suffix(1);
  return line;
}

std::string decodeBase64(std::string_view text) {
  std::unique_ptr<EVP_ENCODE_CTX, decltype(&EVP_ENCODE_CTX_free)> ctx{
      EVP_ENCODE_CTX_new(), &EVP_ENCODE_CTX_free};
  if (!ctx)
    throw std::invalid_argument{"Could not allocate base64 decoder"};

  EVP_DecodeInit(ctx.get());

  std::string out(text.size() + 3, '\0');
  auto *dst = reinterpret_cast<unsigned char *>(out.data());

  int len = 0;
  if (EVP_DecodeUpdate(ctx.get(), dst, &len,
                       reinterpret_cast<const unsigned char *>(text.data()),
                       static_cast<int>(text.size())) < 0)
    throw std::invalid_argument{"Armor body is not valid base64"};

  int tail = 0;
  if (EVP_DecodeFinal(ctx.get(), dst + len, &tail) != 1)
    throw std::invalid_argument{"Armor body is not valid base64"};

  out.resize(static_cast<std::size_t>(len + tail));
  return out;
}

// RFC 4880 section 6.2: header lines up to the first empty line, then the
// base64 body, then an optional "=XXXX" checksum line.
std::string dearmor(std::string_view text, std::string_view label) {
  auto begin = fmt::format("-----BEGIN PGP {}-----", label);
  auto end = fmt::format("-----END PGP {}-----", label);

  auto start = text.find(begin);
  if (start == text.npos)
    throw std::invalid_argument{fmt::format("No '{}' armor found", begin)};
  start += begin.size();

  auto stop = text.find(end, start);
  if (stop == text.npos)
    throw std::invalid_argument{fmt::format("Missing '{}'", end)};

  std::string body;
  bool inHeaders = true;
  std::string_view rest = text.substr(start, stop - start);

  // Remainder of the BEGIN line
  auto eol = rest.find('\n');
  rest = eol == rest.npos ? std::string_view{} : rest.substr(eol + 1);

  while (!rest.empty()) {
    eol = rest.find('\n');
    auto line = trimLine(rest.substr(0, eol));
    rest = eol == rest.npos ? std::string_view{} : rest.substr(eol + 1);

    if (inHeaders) {
      if (line.empty()) {
        inHeaders = false;
        continue;
      }
      if (line.find(": ") != line.npos)
        continue;
      inHeaders = false;
    }

    if (line.starts_with('='))
      break;

    body += line;
  }

  if (body.empty())
    throw std::invalid_argument{fmt::format("Empty {} armor", label)};

  return decodeBase64(body);
}
} // namespace

int firstPacketTag(std::string_view data) {
  if (data.empty())
    return -1;

  auto header = static_cast<unsigned char>(data.front());
  if (!(header & 0x80))
    return -1;

  // New format packets carry the tag in the low six bits
  if (header & 0x40)
    return header & 0x3F;

  return (header >> 2) & 0x0F;
}

std::string packets(std::string_view data, PacketTag expected) {
  std::string binary;
  if (data.find("-----BEGIN PGP ") != data.npos)
    binary = dearmor(data, armorLabel(expected));
  else
    binary = std::string{data};

  int tag = firstPacketTag(binary);
  if (tag != static_cast<int>(expected))
    throw std::invalid_argument{
        tag < 0 ? std::string{"Not OpenPGP data"}
                : fmt::format("Unexpected OpenPGP packet (tag {}, expected {})",
                              tag, static_cast<int>(expected))};

  return binary;
}

std::string_view verdictName(Verdict verdict) {
  switch (verdict) {
  case Verdict::Good:
    return "good";
  case Verdict::KeyExpired:
    return "key expired";
  case Verdict::Revoked:
    return "key revoked";
  case Verdict::Bad:
    return "bad signature";
  case Verdict::NoKey:
    return "no matching key";
  }
  return "unknown";
}

Verdict parseStatus(std::string_view status) {
  bool good = false;
  bool valid = false;
  bool expired = false;
  bool revoked = false;
  bool bad = false;

  while (!status.empty()) {
    auto eol = status.find('\n');
    auto line = trimLine(status.substr(0, eol));
    status = eol == status.npos ? std::string_view{} : status.substr(eol + 1);

    if (!line.starts_with(STATUS_PREFIX)) {
      if (!line.empty())
        debug("gpgv: {}", line);
      continue;
    }
    line.remove_prefix(STATUS_PREFIX.size());

    auto keyword = line.substr(0, line.find(' '));
    if (keyword == "GOODSIG")
      good = true;
    else if (keyword == "VALIDSIG")
      valid = true;
    else if (keyword == "EXPKEYSIG" || keyword == "KEYEXPIRED")
      expired = true;
    else if (keyword == "REVKEYSIG" || keyword == "KEYREVOKED")
      revoked = true;
    else if (keyword == "BADSIG" || keyword == "EXPSIG")
      bad = true;
  }

  // A good signature by an expired key still reports VALIDSIG
  if (bad)
    return Verdict::Bad;
  if (revoked)
    return Verdict::Revoked;
  if (expired)
    return Verdict::KeyExpired;
  if (good && valid)
    return Verdict::Good;

  return Verdict::NoKey;
}

Verdict verify(std::string_view key, std::string_view signature,
               const fs::path &data) {
  auto gpgv = os::find_binary("gpgv");
  if (!gpgv)
    throw std::runtime_error{"gpgv not found in PATH"};

  std::string pattern =
      (fs::temp_directory_path() / "stage_root-gpgv-XXXXXX").string();
  if (!mkdtemp(pattern.data()))
    throw std::runtime_error{fmt::format(
        "Could not create gpgv home directory: {}", strerror(errno))};

  fs::path home{pattern};
  auto cleanup = sg::make_scope_guard([&] {
    std::error_code ec;
    fs::remove_all(home, ec);
  });

  auto keyFile = home / "trusted.gpg";
  auto sigFile = home / "detached.sig";
  if (!os::write_file_atomic(keyFile, key) ||
      !os::write_file_atomic(sigFile, signature))
    throw std::runtime_error{
        fmt::format("Could not populate gpgv home directory {}", home)};

  std::array<std::string, 11> args{
      gpgv->string(), "--homedir",     home.string(), "--status-fd",
      "1",            "--logger-fd",   "1",           "--keyring",
      keyFile.string(), sigFile.string(), data.string()};

  std::string output;
  int ret = os::run_with_output(args, output);
  if (ret < 0)
    throw std::runtime_error{fmt::format("Could not run {}", *gpgv)};

  auto verdict = parseStatus(output);
  if (verdict == Verdict::Good && ret != 0) {
    warning("gpgv reported a good signature but exited with status {}", ret);
    return Verdict::Bad;
  }

  return verdict;
}

} // namespace openpgp
