#include "statusview/decoder.hpp"
#include "statusview/errors.hpp"

namespace statusview {

std::optional<Message> MessageDecoder::next() {
    in_ >> std::ws;
    if (in_.bad()) {
        throw Error("failed to read message stream");
    }
    if (in_.peek() == std::istream::traits_type::eof()) {
        return std::nullopt;
    }

    nlohmann::json value;
    in_ >> value;
    return value.get<Message>();
}

} // namespace statusview
