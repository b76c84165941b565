#pragma once
#include <string>

// Position token embedded in view strings: CSI <row>;<col> H, 1-based.
// The text after it starts at cell (x, y); TerminalRenderer::compose()
// turns a view full of these into screen lines.
inline std::string cursorTo(int x, int y) {
    return "\x1b[" + std::to_string(y + 1) + ";" + std::to_string(x + 1) + "H";
}
