#include "syncqueue/item_id.hpp"
#include <sodium.h>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace syncqueue {

std::string generate_item_id() {
    if (sodium_init() < 0) throw std::runtime_error("sodium_init failed");

    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    unsigned char id_bytes[8];
    randombytes_buf(id_bytes, sizeof(id_bytes));
    char hex[17] = {0};
    for (int i = 0; i < 8; i++) {
        snprintf(hex + i*2, 3, "%02x", id_bytes[i]);
    }

    return std::to_string(now) + "-" + std::string(hex, 16);
}

} // namespace syncqueue
