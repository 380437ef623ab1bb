#pragma once

#include "progress.hpp"

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace statusview {

struct MessageError {
    int code{0};
    std::string message;
};

// One decoded status event. String fields are absent when empty, numeric
// timestamps when zero.
struct Message {
    std::string stream;
    std::string status;
    std::optional<Progress> progress;
    std::string progress_message;   // deprecated, preformatted progress text
    std::string id;
    std::string from;
    std::int64_t time{0};
    std::int64_t time_nano{0};
    std::optional<MessageError> error;
    std::string error_message;      // deprecated text, only errorDetail fails the operation
    std::optional<nlohmann::json> aux;  // out-of-band data, never displayed

    [[nodiscard]] bool hasProgress() const { return progress.has_value() || !progress_message.empty(); }
};

void from_json(const nlohmann::json& j, Progress& progress);
void from_json(const nlohmann::json& j, MessageError& error);
void from_json(const nlohmann::json& j, Message& message);

} // namespace statusview
