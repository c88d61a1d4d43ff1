#pragma once
#include <ostream>
#include <string>

#include "cli/terminal_input.hpp"

namespace tr {

// Console seam between the review loop and the terminal.
class Prompter {
public:
    virtual ~Prompter() = default;

    // One keystroke: a character or a tr::Key code.
    virtual int ReadKey() = 0;
    // A full line in line-buffered mode, without the trailing newline.
    virtual std::string ReadLine(const std::string& prompt) = 0;
    virtual void ClearScreen() = 0;
    virtual std::ostream& Out() = 0;
};

class TerminalPrompter : public Prompter {
public:
    TerminalPrompter(TerminalInput& term, std::ostream& out) : term_(term), out_(out) {}

    int ReadKey() override;
    std::string ReadLine(const std::string& prompt) override;
    void ClearScreen() override;
    std::ostream& Out() override { return out_; }

private:
    TerminalInput& term_;
    std::ostream& out_;
};

} // namespace tr
