#pragma once

#include <stdexcept>
#include <string>

namespace statusview {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised when the sink rejects a write.
class WriteError : public Error {
public:
    using Error::Error;
};

// An operation in the stream reported failure through its error field.
class MessageFailure : public Error {
public:
    MessageFailure(int code, const std::string& message)
        : Error(message), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

class AuthenticationRequired final : public MessageFailure {
public:
    AuthenticationRequired() : MessageFailure(401, "authentication is required") {}
};

} // namespace statusview
