#pragma once
#include "IRenderer.hpp"
#include <ftxui/dom/elements.hpp>
#include <string>
#include <vector>

// Non-interactive renderer: paints each frame to stdout with ftxui,
// overwriting the previous one in place. Used in headless mode.
class TerminalRenderer : public IRenderer {
public:
    void setupScreen() override;
    void render(const Model& model) override;
    void restoreScreen() override;

    // Lay `view` out on a width x height cell grid and return its rows.
    // Cursor tokens (see Cursor.hpp) move the write position, '\n' moves
    // to column 0 of the next row, other escape sequences are skipped and
    // anything outside the grid is clipped.
    static std::vector<std::string> compose(const std::string& view,
                                            int width, int height);

    // One text element per composed row
    static ftxui::Element toElement(const std::string& view,
                                    int width, int height);

private:
    std::string resetPosition_;
};
