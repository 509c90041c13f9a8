#include "hwcc/common/hash.hpp"

#include <openssl/evp.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace hwcc::common {

std::string sha256_hex(const std::string_view text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

Result<std::string> base64_decode(const std::string_view encoded) {
  if (encoded.empty()) {
    return Result<std::string>::success("");
  }
  if (encoded.size() % 4 != 0) {
    return Result<std::string>::failure("base64 length is not a multiple of 4");
  }

  std::vector<unsigned char> out(encoded.size() / 4 * 3);
  const int written = EVP_DecodeBlock(out.data(),
                                      reinterpret_cast<const unsigned char *>(encoded.data()),
                                      static_cast<int>(encoded.size()));
  if (written < 0) {
    return Result<std::string>::failure("invalid base64 input");
  }

  // EVP_DecodeBlock counts padding as output bytes.
  std::size_t length = static_cast<std::size_t>(written);
  for (auto it = encoded.rbegin(); it != encoded.rend() && *it == '='; ++it) {
    --length;
  }
  return Result<std::string>::success(
      std::string(reinterpret_cast<const char *>(out.data()), length));
}

} // namespace hwcc::common
