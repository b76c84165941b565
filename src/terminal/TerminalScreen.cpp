#include "terminal/TerminalScreen.hpp"
#include <ftxui/screen/terminal.hpp>

ScreenSize TerminalScreen::size() const {
    auto dims = ftxui::Terminal::Size();
    return {dims.dimx, dims.dimy};
}
