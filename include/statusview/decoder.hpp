#pragma once

#include "message.hpp"

#include <istream>
#include <optional>

namespace statusview {

// Reads consecutive JSON objects from a byte stream, one Message each.
class MessageDecoder {
public:
    explicit MessageDecoder(std::istream& in) : in_(in) {}

    // std::nullopt at a clean end of input. Malformed input raises
    // nlohmann::json::exception.
    [[nodiscard]] std::optional<Message> next();

private:
    std::istream& in_;
};

} // namespace statusview
