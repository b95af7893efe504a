#include "syncqueue/queue_codec.hpp"
#include <chrono>
#include <cstring>
#include <stdexcept>

namespace syncqueue {

namespace {

enum ValueTag : uint8_t {
    kTagNull = 0,
    kTagBool = 1,
    kTagInt = 2,
    kTagDouble = 3,
    kTagString = 4
};

} // namespace

void QueueCodec::push_u32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back((v >> 24) & 0xFF);
    out.push_back((v >> 16) & 0xFF);
    out.push_back((v >> 8) & 0xFF);
    out.push_back(v & 0xFF);
}

uint32_t QueueCodec::read_u32(const std::vector<uint8_t>& in, size_t& offset) {
    if (offset + 4 > in.size())
        throw std::runtime_error("QueueCodec: invalid length");
    uint32_t v =
        (static_cast<uint32_t>(in[offset]) << 24) |
        (static_cast<uint32_t>(in[offset+1]) << 16) |
        (static_cast<uint32_t>(in[offset+2]) << 8) |
        static_cast<uint32_t>(in[offset+3]);
    offset += 4;
    return v;
}

void QueueCodec::push_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 7; i >= 0; --i) {
        out.push_back((v >> (8 * i)) & 0xFF);
    }
}

uint64_t QueueCodec::read_u64(const std::vector<uint8_t>& in, size_t& offset) {
    if (offset + 8 > in.size())
        throw std::runtime_error("QueueCodec: truncated u64");
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | in[offset++];
    }
    return v;
}

uint8_t QueueCodec::read_u8(const std::vector<uint8_t>& in, size_t& offset) {
    if (offset >= in.size())
        throw std::runtime_error("QueueCodec: truncated byte");
    return in[offset++];
}

void QueueCodec::push_string(std::vector<uint8_t>& out, const std::string& s) {
    push_u32(out, static_cast<uint32_t>(s.size()));
    out.insert(out.end(), s.begin(), s.end());
}

std::string QueueCodec::read_string(const std::vector<uint8_t>& in, size_t& offset) {
    uint32_t len = read_u32(in, offset);
    if (len > in.size() - offset)
        throw std::runtime_error("QueueCodec: string runs past end of input");
    std::string s(reinterpret_cast<const char*>(in.data() + offset), len);
    offset += len;
    return s;
}

void QueueCodec::push_value(std::vector<uint8_t>& out, const PayloadValue& value) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        out.push_back(kTagNull);
    } else if (const bool* b = std::get_if<bool>(&value)) {
        out.push_back(kTagBool);
        out.push_back(*b ? 1 : 0);
    } else if (const int64_t* i = std::get_if<int64_t>(&value)) {
        out.push_back(kTagInt);
        push_u64(out, static_cast<uint64_t>(*i));
    } else if (const double* d = std::get_if<double>(&value)) {
        uint64_t bits;
        std::memcpy(&bits, d, sizeof(bits));
        out.push_back(kTagDouble);
        push_u64(out, bits);
    } else {
        out.push_back(kTagString);
        push_string(out, std::get<std::string>(value));
    }
}

PayloadValue QueueCodec::read_value(const std::vector<uint8_t>& in, size_t& offset) {
    uint8_t tag = read_u8(in, offset);
    switch (tag) {
        case kTagNull:
            return nullptr;
        case kTagBool:
            return read_u8(in, offset) != 0;
        case kTagInt:
            return static_cast<int64_t>(read_u64(in, offset));
        case kTagDouble: {
            uint64_t bits = read_u64(in, offset);
            double d;
            std::memcpy(&d, &bits, sizeof(d));
            return d;
        }
        case kTagString:
            return read_string(in, offset);
        default:
            throw std::runtime_error("QueueCodec: unknown value tag " + std::to_string(tag));
    }
}

std::vector<uint8_t> QueueCodec::encode(const std::vector<QueueItem>& items) {
    std::vector<uint8_t> out;

    push_u32(out, kVersion);
    push_u32(out, static_cast<uint32_t>(items.size()));

    for (const auto& item : items) {
        push_string(out, item.id);
        push_string(out, item.action.type);

        push_u32(out, static_cast<uint32_t>(item.action.payload.size()));
        for (const auto& entry : item.action.payload) {
            push_string(out, entry.first);
            push_value(out, entry.second);
        }

        auto created_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            item.created_at.time_since_epoch()).count();
        push_u64(out, static_cast<uint64_t>(created_ms));
        push_u32(out, static_cast<uint32_t>(item.attempts));
        push_u32(out, static_cast<uint32_t>(item.max_attempts));
        out.push_back(static_cast<uint8_t>(item.status));

        out.push_back(item.error ? 1 : 0);
        if (item.error) {
            push_string(out, *item.error);
        }
    }

    return out;
}

std::vector<QueueItem> QueueCodec::decode(const std::vector<uint8_t>& input) {
    size_t offset = 0;

    uint32_t version = read_u32(input, offset);
    if (version != kVersion)
        throw std::runtime_error("QueueCodec: unsupported version " + std::to_string(version));

    uint32_t count = read_u32(input, offset);
    std::vector<QueueItem> items;

    for (uint32_t n = 0; n < count; ++n) {
        QueueItem item;
        item.id = read_string(input, offset);
        item.action.type = read_string(input, offset);

        uint32_t fields = read_u32(input, offset);
        for (uint32_t f = 0; f < fields; ++f) {
            std::string key = read_string(input, offset);
            item.action.payload[key] = read_value(input, offset);
        }

        item.created_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(static_cast<int64_t>(read_u64(input, offset))));
        item.attempts = static_cast<int>(read_u32(input, offset));
        item.max_attempts = static_cast<int>(read_u32(input, offset));

        uint8_t status = read_u8(input, offset);
        if (status > static_cast<uint8_t>(ItemStatus::Failed))
            throw std::runtime_error("QueueCodec: unknown status " + std::to_string(status));
        item.status = static_cast<ItemStatus>(status);

        if (read_u8(input, offset) != 0) {
            item.error = read_string(input, offset);
        }

        items.push_back(std::move(item));
    }

    if (offset != input.size())
        throw std::runtime_error("QueueCodec: trailing bytes after queue");

    return items;
}

} // namespace syncqueue
