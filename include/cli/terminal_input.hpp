#pragma once

#include <termios.h>

namespace tr {

// Codes returned by GetChar for non-printable input. Printable keys come back
// as their unsigned char value, so every code here sits above 255.
enum Key {
    UP = 1000,
    DOWN,
    LEFT,
    RIGHT,
    ENTER,
    ESC,
    CTRL_C,
    END_OF_INPUT,
    UNKNOWN
};

// Owns the stdin terminal mode: single-key input without echo while alive,
// the original mode restored on destruction. When stdin is not a terminal
// the mode calls do nothing and GetChar still reads bytes.
class TerminalInput {
public:
    TerminalInput();
    ~TerminalInput();
    TerminalInput(const TerminalInput&) = delete;
    TerminalInput& operator=(const TerminalInput&) = delete;

    int GetChar();

    // Line-buffered input with echo, for free-text prompts.
    void Restore();
    void SetSingleKey();

    bool is_terminal() const { return has_termios_; }

private:
    int DecodeEscape();

    struct termios original_termios_{};
    bool has_termios_ = false;
    bool single_key_ = false;
};

} // namespace tr
