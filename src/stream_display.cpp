#include "statusview/stream_display.hpp"
#include "statusview/cursor.hpp"
#include "statusview/decoder.hpp"
#include "statusview/errors.hpp"
#include "statusview/line_renderer.hpp"

#include <utility>

namespace statusview {

StreamDisplay::StreamDisplay(std::ostream& out, int terminal_fd, bool is_terminal, DisplayOptions options)
    : out_(out),
      terminal_fd_(terminal_fd),
      options_(std::move(options)) {
    if (is_terminal) {
        const auto name = options_.term_name.empty() ? resolveTermName() : options_.term_name;
        term_info_ = openTermInfo(name, terminal_fd_);
    }
}

StreamDisplay::StreamDisplay(std::ostream& out, int terminal_fd, std::unique_ptr<TermInfo> term_info,
                             DisplayOptions options)
    : out_(out),
      terminal_fd_(terminal_fd),
      term_info_(term_info ? std::move(term_info) : std::make_unique<NoTermInfo>()),
      options_(std::move(options)) {}

void StreamDisplay::bindContext(Progress& progress) const {
    progress.terminal_fd = terminal_fd_;
    if (options_.window_width != 0) {
        progress.win_size = options_.window_width;
    }
    if (options_.now) {
        progress.now_func = options_.now;
    }
}

void StreamDisplay::render(Message message, const AuxCallback& aux_callback) {
    if (message.aux) {
        if (aux_callback) {
            aux_callback(message);
        }
        return;
    }

    if (message.progress) {
        bindContext(*message.progress);
    }

    int diff = 0;
    if (!message.id.empty() && message.hasProgress()) {
        const auto [row, inserted] = rows_.try_emplace(message.id, static_cast<int>(rows_.size()));
        if (inserted && term_info_) {
            // reserve a fresh row at the bottom of the grid
            detail::write(out_, "\n");
        }
        // rows_.size() only works as the cursor's offset while rows_ is
        // cleared by every line that is not part of the grid
        diff = static_cast<int>(rows_.size()) - row->second;
        if (term_info_) {
            cursorUp(out_, *term_info_, diff);
        }
    } else {
        rows_.clear();
    }

    const bool restore = !message.id.empty() && term_info_;
    try {
        displayMessage(message, out_, term_info_.get());
    } catch (const MessageFailure&) {
        if (restore) {
            cursorDown(out_, *term_info_, diff);
        }
        throw;
    }
    if (restore) {
        cursorDown(out_, *term_info_, diff);
    }
}

void StreamDisplay::run(std::istream& in, const AuxCallback& aux_callback) {
    MessageDecoder decoder(in);
    while (auto message = decoder.next()) {
        render(std::move(*message), aux_callback);
    }
}

void displayMessagesStream(std::istream& in, std::ostream& out, int terminal_fd, bool is_terminal,
                           const AuxCallback& aux_callback, const DisplayOptions& options) {
    StreamDisplay display(out, terminal_fd, is_terminal, options);
    display.run(in, aux_callback);
}

void displayMessagesToStream(std::istream& in, OutputStream& stream,
                             const AuxCallback& aux_callback, const DisplayOptions& options) {
    displayMessagesStream(in, stream.stream(), stream.fd(), stream.isTerminal(), aux_callback, options);
}

} // namespace statusview
