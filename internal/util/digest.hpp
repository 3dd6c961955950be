#pragma once

#include <string>
#include <string_view>

namespace mediacache::util {

// Lowercase hex SHA-256 of `data`.
std::string Sha256Hex(std::string_view data);

} // namespace mediacache::util
