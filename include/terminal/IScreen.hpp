#pragma once

struct ScreenSize {
    int width  = 0;
    int height = 0;
};

// Ambient terminal size, consulted by containers built without geometry.
// Implementations: TerminalScreen (ftxui), FixedScreen (tests, headless).
class IScreen {
public:
    static constexpr int kDefaultWidth  = 80;
    static constexpr int kDefaultHeight = 24;

    virtual ~IScreen() = default;
    virtual ScreenSize size() const = 0;
};

class FixedScreen : public IScreen {
public:
    FixedScreen(int width = kDefaultWidth, int height = kDefaultHeight)
        : size_{width, height} {}

    ScreenSize size() const override { return size_; }

private:
    ScreenSize size_;
};
