#include "statusview/line_renderer.hpp"
#include "statusview/cursor.hpp"
#include "statusview/detail/units.hpp"
#include "statusview/errors.hpp"

#include <fmt/format.h>

namespace statusview {

void displayMessage(const Message& message, std::ostream& out, const TermInfo* term_info) {
    if (message.error) {
        if (message.error->code == 401) {
            throw AuthenticationRequired();
        }
        throw MessageFailure(message.error->code, message.error->message);
    }

    std::string endl;
    if (term_info != nullptr && message.stream.empty() && message.progress) {
        clearLine(out, *term_info);
        endl = "\r";
        detail::write(out, endl);
    } else if (message.progress && !formatProgress(*message.progress).empty()) {
        return;
    }

    if (message.time_nano != 0) {
        detail::write(out, detail::formatTimestamp(0, message.time_nano) + " ");
    } else if (message.time != 0) {
        detail::write(out, detail::formatTimestamp(message.time, 0) + " ");
    }
    if (!message.id.empty()) {
        detail::write(out, fmt::format("{}: ", message.id));
    }
    if (!message.from.empty()) {
        detail::write(out, fmt::format("(from {}) ", message.from));
    }

    if (message.progress && term_info != nullptr) {
        detail::write(out, fmt::format("{} {}{}", message.status, formatProgress(*message.progress), endl));
    } else if (!message.progress_message.empty()) {
        detail::write(out, fmt::format("{} {}{}", message.status, message.progress_message,
                                       term_info != nullptr ? endl : std::string("\n")));
    } else if (!message.stream.empty()) {
        detail::write(out, message.stream + endl);
    } else {
        detail::write(out, message.status + endl + "\n");
    }
}

} // namespace statusview
