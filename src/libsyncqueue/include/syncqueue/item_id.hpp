#pragma once

#include <string>

namespace syncqueue {

// "<unix-ms>-<16 hex chars>". Throws std::runtime_error if libsodium
// cannot be initialized.
std::string generate_item_id();

} // namespace syncqueue
