#pragma once

#include "message.hpp"
#include "term_info.hpp"

#include <ostream>

namespace statusview {

// Writes one message to `out`. `term_info` is null unless `out` is a
// terminal; in that case a progress line clears the current row and ends in
// a carriage return so the next render overwrites it.
//
// Throws MessageFailure (AuthenticationRequired for code 401) for messages
// carrying an error, and WriteError when the sink fails. On a non-terminal
// sink, messages whose progress would render a bar or counters are skipped.
void displayMessage(const Message& message, std::ostream& out, const TermInfo* term_info);

} // namespace statusview
