#include "cli/prompter.hpp"

#include <iostream>

#include "tr_types.hpp"

namespace tr {

int TerminalPrompter::ReadKey() {
    out_.flush();
    return term_.GetChar();
}

std::string TerminalPrompter::ReadLine(const std::string& prompt) {
    term_.Restore();
    out_ << prompt << std::flush;
    std::string s;
    bool ok = static_cast<bool>(std::getline(std::cin, s));
    term_.SetSingleKey();
    if (!ok) {
        throw ReviewError(ReviewErrc::Io, "Input closed while reading '" + prompt + "'");
    }
    return s;
}

void TerminalPrompter::ClearScreen() {
    out_ << "\x1B[2J\x1B[H" << "\n" << std::flush;
}

} // namespace tr
