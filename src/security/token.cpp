#include "remotegate/security/token.hpp"

#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <vector>

namespace remotegate::security {

common::Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return common::Result<std::string>::failure("RAND_bytes failed");
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return common::Result<std::string>::success(stream.str());
}

common::Result<std::string> generate_action_token() { return random_hex(16); }

} // namespace remotegate::security
