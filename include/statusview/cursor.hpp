#pragma once

#include "term_info.hpp"

#include <ostream>
#include <string_view>

namespace statusview {

// Erases the whole current line: el1 then el, since terminfo has no
// capability for both at once.
void clearLine(std::ostream& out, const TermInfo& term_info);

// Zero is a no-op.
void cursorUp(std::ostream& out, const TermInfo& term_info, int lines);
void cursorDown(std::ostream& out, const TermInfo& term_info, int lines);

namespace detail {

// Throws WriteError when the sink rejects the text.
void write(std::ostream& out, std::string_view text);

} // namespace detail

} // namespace statusview
