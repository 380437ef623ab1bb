#include "statusview/cursor.hpp"
#include "statusview/errors.hpp"

#include <fmt/format.h>

namespace statusview {

namespace detail {

void write(std::ostream& out, std::string_view text) {
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out) {
        throw WriteError("failed to write to output");
    }
}

} // namespace detail

namespace {

void emit(std::ostream& out, const TermInfo& term_info, const std::string& capability,
          const std::vector<int>& params, const std::string& fallback) {
    const auto sequence = term_info.parse(capability, params);
    detail::write(out, sequence ? *sequence : fallback);
}

} // namespace

void clearLine(std::ostream& out, const TermInfo& term_info) {
    emit(out, term_info, "el1", {}, "\x1b[1K");
    emit(out, term_info, "el", {}, "\x1b[K");
}

void cursorUp(std::ostream& out, const TermInfo& term_info, int lines) {
    if (lines == 0) {
        return;
    }
    emit(out, term_info, "cuu", {lines}, fmt::format("\x1b[{}A", lines));
}

void cursorDown(std::ostream& out, const TermInfo& term_info, int lines) {
    if (lines == 0) {
        return;
    }
    emit(out, term_info, "cud", {lines}, fmt::format("\x1b[{}B", lines));
}

} // namespace statusview
