#pragma once

#include <string>

namespace raefusion::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace raefusion::common
