/**
 * devsnap Wire Protocol
 *
 * Framed protocol for broker <-> agent communication.
 * Header: 9 bytes (magic + event + payload_size), payload is UTF-8 JSON.
 */
#pragma once
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <optional>

namespace devsnap::ipc {

// Magic bytes for protocol validation
constexpr uint32_t MAGIC_BYTES = 0x534E4150; // "SNAP" in hex
constexpr size_t HEADER_SIZE = 9;
constexpr size_t MAX_PAYLOAD_SIZE = 16 * 1024 * 1024; // 16MB max, screenshots are large

// Channel events
enum class EventType : uint8_t {
    HELLO       = 0x01,  // agent -> broker: announce session
    ACK         = 0x02,  // broker -> agent: session registered
    PONG        = 0x03,  // agent -> broker: heartbeat
    BYE         = 0x04,  // agent -> broker: page unloading
    DUMP        = 0x10,  // broker -> agent: gather data kinds
    DUMP_RESULT = 0x11,  // agent -> broker: dump reply
    PING        = 0x12,  // broker -> agent: liveness probe
    PING_RESULT = 0x13   // agent -> broker: ping reply
};

// Wire protocol header (9 bytes, packed)
struct __attribute__((packed)) MessageHeader {
    uint32_t magic;         // Must be MAGIC_BYTES
    EventType event;        // Which event this frame carries
    uint32_t payload_size;  // Bytes following this header
};

static_assert(sizeof(MessageHeader) == HEADER_SIZE, "Header size mismatch");

// Application-level message
struct Message {
    EventType event;
    std::vector<uint8_t> payload;

    Message() : event(EventType::PONG) {}

    Message(EventType ev, const std::vector<uint8_t>& data = {})
        : event(ev), payload(data) {}

    Message(EventType ev, const std::string& data)
        : event(ev), payload(data.begin(), data.end()) {}

    // Get payload as string
    std::string payload_str() const {
        return std::string(payload.begin(), payload.end());
    }

    // Serialize message to wire format
    std::vector<uint8_t> serialize() const {
        std::vector<uint8_t> buffer(HEADER_SIZE + payload.size());

        MessageHeader header;
        header.magic = MAGIC_BYTES;
        header.event = event;
        header.payload_size = static_cast<uint32_t>(payload.size());

        std::memcpy(buffer.data(), &header, HEADER_SIZE);
        if (!payload.empty()) {
            std::memcpy(buffer.data() + HEADER_SIZE, payload.data(), payload.size());
        }

        return buffer;
    }

    // Deserialize message from wire format
    static std::optional<Message> deserialize(const uint8_t* data, size_t len) {
        auto total = get_message_size(data, len);
        if (!total || len < *total) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        Message msg;
        msg.event = header.event;
        if (header.payload_size > 0) {
            msg.payload.assign(data + HEADER_SIZE, data + HEADER_SIZE + header.payload_size);
        }

        return msg;
    }

    // Total frame size announced by the header, nullopt if incomplete or invalid
    static std::optional<size_t> get_message_size(const uint8_t* data, size_t len) {
        if (len < HEADER_SIZE) {
            return std::nullopt;
        }

        MessageHeader header;
        std::memcpy(&header, data, HEADER_SIZE);

        if (header.magic != MAGIC_BYTES) {
            return std::nullopt;
        }

        if (header.payload_size > MAX_PAYLOAD_SIZE) {
            return std::nullopt;
        }

        return HEADER_SIZE + header.payload_size;
    }

    // True if the buffer starts with something that can never become a valid frame
    static bool is_corrupt(const uint8_t* data, size_t len) {
        if (len < HEADER_SIZE) {
            return false;
        }
        return !get_message_size(data, len).has_value();
    }
};

// Convert event to string for logging
inline const char* event_to_string(EventType ev) {
    switch (ev) {
        case EventType::HELLO:       return "HELLO";
        case EventType::ACK:         return "ACK";
        case EventType::PONG:        return "PONG";
        case EventType::BYE:         return "BYE";
        case EventType::DUMP:        return "DUMP";
        case EventType::DUMP_RESULT: return "DUMP_RESULT";
        case EventType::PING:        return "PING";
        case EventType::PING_RESULT: return "PING_RESULT";
        default: return "UNKNOWN";
    }
}

} // namespace devsnap::ipc
