#include "cli/terminal_input.hpp"

#include <unistd.h>

namespace tr {

namespace {

bool read_byte(char& c) {
    return read(STDIN_FILENO, &c, 1) == 1;
}

} // namespace

TerminalInput::TerminalInput() {
    if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &original_termios_) == 0) {
        has_termios_ = true;
        SetSingleKey();
    }
}

TerminalInput::~TerminalInput() {
    Restore();
}

void TerminalInput::SetSingleKey() {
    if (!has_termios_ || single_key_) return;
    struct termios mode = original_termios_;
    // Output processing stays on so "\n" still returns the carriage.
    // ISIG is off: Ctrl-C arrives as a key and the loops decide what it means.
    mode.c_iflag &= ~(ICRNL | IXON);
    mode.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    mode.c_cc[VMIN] = 1;
    mode.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &mode) == 0) single_key_ = true;
}

void TerminalInput::Restore() {
    if (!has_termios_ || !single_key_) return;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_) == 0) single_key_ = false;
}

int TerminalInput::GetChar() {
    char c;
    if (!read_byte(c)) return END_OF_INPUT;
    switch (c) {
        case 3: return CTRL_C;
        case 4: return END_OF_INPUT;
        case '\r':
        case '\n': return ENTER;
        case '\x1b': return DecodeEscape();
        default: return static_cast<unsigned char>(c);
    }
}

// Arrow keys arrive as ESC [ X in normal cursor mode and ESC O X in
// application mode. Anything else after ESC is reported as UNKNOWN.
int TerminalInput::DecodeEscape() {
    char intro;
    if (!read_byte(intro)) return ESC;
    if (intro != '[' && intro != 'O') return UNKNOWN;
    char final_byte;
    if (!read_byte(final_byte)) return UNKNOWN;
    switch (final_byte) {
        case 'A': return UP;
        case 'B': return DOWN;
        case 'C': return RIGHT;
        case 'D': return LEFT;
        default: return UNKNOWN;
    }
}

} // namespace tr
