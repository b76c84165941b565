#pragma once
#include "terminal/IScreen.hpp"
#include <memory>

// Ambient collaborators handed down the tree during construction
struct BuildContext {
    std::shared_ptr<const IScreen> screen;   // null = IScreen defaults

    ScreenSize screenSize() const {
        return screen ? screen->size()
                      : ScreenSize{IScreen::kDefaultWidth,
                                   IScreen::kDefaultHeight};
    }
};
