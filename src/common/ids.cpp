#include "parley/common/ids.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace parley::common {

namespace {

std::string to_hex(const unsigned char *data, const std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return Result<std::string>::failure("RAND_bytes failed");
  }
  return Result<std::string>::success(to_hex(data.data(), data.size()));
}

bool constant_time_equals(const std::string &a, const std::string &b) {
  unsigned char digest_a[SHA256_DIGEST_LENGTH];
  unsigned char digest_b[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(a.data()), a.size(), digest_a);
  SHA256(reinterpret_cast<const unsigned char *>(b.data()), b.size(), digest_b);

  unsigned char diff = 0;
  for (std::size_t i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    diff |= static_cast<unsigned char>(digest_a[i] ^ digest_b[i]);
  }
  return diff == 0;
}

} // namespace parley::common
