#pragma once

#include "message.hpp"
#include "output_stream.hpp"
#include "term_info.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>

namespace statusview {

struct DisplayOptions {
    NowFunc now;                // clock for time-left estimates, system clock when empty
    int window_width{0};        // 0 queries the terminal
    std::string term_name;      // empty means $TERM
};

using AuxCallback = std::function<void(const Message&)>;

// Renders a sequence of messages onto one sink. On a terminal every id that
// carries progress is pinned to its own row and rewritten in place; any
// other message ends the current grid.
//
// Not thread-safe: the row ledger mirrors the cursor position of `out`.
class StreamDisplay {
public:
    StreamDisplay(std::ostream& out, int terminal_fd, bool is_terminal, DisplayOptions options = {});

    // Terminal display using the given capability set.
    StreamDisplay(std::ostream& out, int terminal_fd, std::unique_ptr<TermInfo> term_info,
                  DisplayOptions options = {});

    // Renders one message, or hands it to `aux_callback` when it carries
    // out-of-band data.
    void render(Message message, const AuxCallback& aux_callback = {});

    // Decodes and renders `in` until end of input.
    void run(std::istream& in, const AuxCallback& aux_callback = {});

    [[nodiscard]] std::size_t rowCount() const { return rows_.size(); }
    [[nodiscard]] const TermInfo* termInfo() const { return term_info_.get(); }

private:
    void bindContext(Progress& progress) const;

    std::ostream& out_;
    int terminal_fd_;
    std::unique_ptr<TermInfo> term_info_;
    DisplayOptions options_;
    std::unordered_map<std::string, int> rows_;
};

void displayMessagesStream(std::istream& in, std::ostream& out, int terminal_fd, bool is_terminal,
                           const AuxCallback& aux_callback = {}, const DisplayOptions& options = {});

// Takes fd and interactivity from the stream itself.
void displayMessagesToStream(std::istream& in, OutputStream& stream,
                             const AuxCallback& aux_callback = {}, const DisplayOptions& options = {});

} // namespace statusview
