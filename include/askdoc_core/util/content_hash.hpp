#pragma once

#include <string>
#include <string_view>

namespace askdoc_core {

// Lower-case hex SHA-256 of the given bytes.
std::string compute_content_hash(std::string_view content);

}  // namespace askdoc_core
