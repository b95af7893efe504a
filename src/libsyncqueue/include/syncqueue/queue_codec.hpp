#pragma once

#include "syncqueue/sync_action.hpp"
#include <cstdint>
#include <vector>

namespace syncqueue {

// Binary layout of a persisted queue.
class QueueCodec {
public:
    static constexpr uint32_t kVersion = 1;

    static std::vector<uint8_t> encode(const std::vector<QueueItem>& items);

    // Throws std::runtime_error on truncated or malformed input.
    static std::vector<QueueItem> decode(const std::vector<uint8_t>& input);

    static void push_u32(std::vector<uint8_t>& out, uint32_t v);
    static uint32_t read_u32(const std::vector<uint8_t>& in, size_t& offset);
    static void push_u64(std::vector<uint8_t>& out, uint64_t v);
    static uint64_t read_u64(const std::vector<uint8_t>& in, size_t& offset);
    static void push_string(std::vector<uint8_t>& out, const std::string& s);
    static std::string read_string(const std::vector<uint8_t>& in, size_t& offset);
    static uint8_t read_u8(const std::vector<uint8_t>& in, size_t& offset);

private:
    static void push_value(std::vector<uint8_t>& out, const PayloadValue& value);
    static PayloadValue read_value(const std::vector<uint8_t>& in, size_t& offset);
};

} // namespace syncqueue
