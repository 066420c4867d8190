#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace webrepl {

struct TextMessage {
    std::string text;
};

struct BinaryMessage {
    std::vector<uint8_t> data;
};

// What the connection delivers: console text or transfer bytes.
using Message = std::variant<TextMessage, BinaryMessage>;

// Ordered, message-oriented connection to the device.
class Transport {
public:
    virtual ~Transport() = default;
    virtual void send_text(const std::string& text) = 0;
    virtual void send_binary(std::vector<uint8_t> data) = 0;
    virtual void close() = 0;
};

} // namespace webrepl
