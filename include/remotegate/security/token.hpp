#pragma once

#include "remotegate/common/result.hpp"

#include <cstddef>
#include <string>

namespace remotegate::security {

/// Hex encoding of `bytes` random bytes from the OpenSSL CSPRNG.
[[nodiscard]] common::Result<std::string> random_hex(std::size_t bytes);

/// 128-bit action token, 32 lowercase hex characters.
[[nodiscard]] common::Result<std::string> generate_action_token();

} // namespace remotegate::security
