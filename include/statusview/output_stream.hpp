#pragma once

#include <ostream>

namespace statusview {

// A sink that also knows its file descriptor and whether it is interactive.
class OutputStream {
public:
    virtual ~OutputStream() = default;

    virtual std::ostream& stream() = 0;
    [[nodiscard]] virtual int fd() const = 0;
    [[nodiscard]] virtual bool isTerminal() const = 0;
};

class StdoutStream final : public OutputStream {
public:
    StdoutStream();

    std::ostream& stream() override;
    [[nodiscard]] int fd() const override;
    [[nodiscard]] bool isTerminal() const override { return is_terminal_; }

private:
    bool is_terminal_;
};

} // namespace statusview
