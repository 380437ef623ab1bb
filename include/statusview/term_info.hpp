#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace statusview {

// Lookup of terminal escape sequences by terminfo capability name.
class TermInfo {
public:
    virtual ~TermInfo() = default;

    // The expanded sequence, or std::nullopt when the capability is unknown.
    [[nodiscard]] virtual std::optional<std::string> parse(const std::string& capability,
                                                           const std::vector<int>& params) const = 0;
};

// Canary used when no terminfo entry could be loaded; every lookup fails.
class NoTermInfo final : public TermInfo {
public:
    [[nodiscard]] std::optional<std::string> parse(const std::string& capability,
                                                   const std::vector<int>& params) const override;
};

// Backed by the system terminfo database through ncurses.
class TerminfoDatabase final : public TermInfo {
public:
    // Throws Error when no entry exists for term_name.
    TerminfoDatabase(const std::string& term_name, int fd);
    ~TerminfoDatabase() override;

    TerminfoDatabase(const TerminfoDatabase&) = delete;
    TerminfoDatabase& operator=(const TerminfoDatabase&) = delete;

    [[nodiscard]] std::optional<std::string> parse(const std::string& capability,
                                                   const std::vector<int>& params) const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// $TERM, or "vt102" when unset.
[[nodiscard]] std::string resolveTermName();

// Never throws: falls back to NoTermInfo when the entry cannot be loaded.
[[nodiscard]] std::unique_ptr<TermInfo> openTermInfo(const std::string& term_name, int fd);

} // namespace statusview
