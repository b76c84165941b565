#pragma once
#include "IScreen.hpp"

// Current size of the controlling terminal, as ftxui sees it
class TerminalScreen : public IScreen {
public:
    ScreenSize size() const override;
};
