#include "statusview/term_info.hpp"
#include "statusview/errors.hpp"

#include <cstdlib>

#include <fmt/format.h>
#include <unistd.h>

#include <ncurses.h>
#include <term.h>

namespace statusview {

namespace {

// Removes terminfo delay specifications such as "$<3>" or "$<5.5*/>".
std::string stripPadding(const std::string& sequence) {
    std::string out;
    out.reserve(sequence.size());
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        if (sequence[i] == '$' && i + 1 < sequence.size() && sequence[i + 1] == '<') {
            const auto close = sequence.find('>', i + 2);
            if (close != std::string::npos) {
                i = close;
                continue;
            }
        }
        out.push_back(sequence[i]);
    }
    return out;
}

} // namespace

std::optional<std::string> NoTermInfo::parse(const std::string&, const std::vector<int>&) const {
    return std::nullopt;
}

class TerminfoDatabase::Impl {
public:
    Impl(const std::string& term_name, int fd) {
        TERMINAL* previous = cur_term;
        int status = 0;
        const int result = setupterm(term_name.c_str(), fd >= 0 ? fd : STDOUT_FILENO, &status);
        if (result != OK || status != 1) {
            set_curterm(previous);
            throw Error(fmt::format("no terminfo entry for '{}'", term_name));
        }
        terminal_ = cur_term;
        set_curterm(previous);
    }

    ~Impl() {
        if (terminal_) {
            del_curterm(terminal_);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    [[nodiscard]] std::optional<std::string> parse(const std::string& capability,
                                                   const std::vector<int>& params) const {
        TERMINAL* previous = set_curterm(terminal_);

        std::optional<std::string> result;
        // tigetstr's marker for a capability that is not a string
        const auto* const cancelled = reinterpret_cast<const char*>(-1);
        const char* sequence = tigetstr(capability.c_str());
        if (sequence != nullptr && sequence != cancelled) {
            const char* expanded = nullptr;
            switch (params.size()) {
            case 0:
                expanded = tiparm(sequence);
                break;
            case 1:
                expanded = tiparm(sequence, params[0]);
                break;
            case 2:
                expanded = tiparm(sequence, params[0], params[1]);
                break;
            default:
                break;
            }
            if (expanded != nullptr) {
                result = stripPadding(expanded);
            }
        }

        set_curterm(previous);
        return result;
    }

private:
    TERMINAL* terminal_{nullptr};
};

TerminfoDatabase::TerminfoDatabase(const std::string& term_name, int fd)
    : impl_(std::make_unique<Impl>(term_name, fd)) {}

TerminfoDatabase::~TerminfoDatabase() = default;

std::optional<std::string> TerminfoDatabase::parse(const std::string& capability,
                                                   const std::vector<int>& params) const {
    return impl_->parse(capability, params);
}

std::string resolveTermName() {
    const char* term = std::getenv("TERM");
    if (term == nullptr || *term == '\0') {
        return "vt102";
    }
    return term;
}

std::unique_ptr<TermInfo> openTermInfo(const std::string& term_name, int fd) {
    try {
        return std::make_unique<TerminfoDatabase>(term_name, fd);
    } catch (const Error&) {
        return std::make_unique<NoTermInfo>();
    }
}

} // namespace statusview
