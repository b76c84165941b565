#include "terminal/TerminalRenderer.hpp"
#include <ftxui/dom/node.hpp>
#include <ftxui/screen/screen.hpp>
#include <ftxui/screen/string.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace ftxui;

namespace {

using Grid = std::vector<std::vector<std::string>>;

void put(Grid& grid, int& row, int& col, const std::string& run) {
    for (auto& glyph : Utf8ToGlyphs(run)) {
        if (row >= 0 && row < (int)grid.size() &&
            col >= 0 && col < (int)grid[row].size())
            grid[row][col] = glyph;
        col++;
    }
}

}

std::vector<std::string> TerminalRenderer::compose(const std::string& view,
                                                   int width, int height) {
    width  = std::max(0, width);
    height = std::max(0, height);
    Grid grid(height, std::vector<std::string>(width, " "));

    int row = 0;
    int col = 0;
    std::string run;
    size_t i = 0;
    while (i < view.size()) {
        char c = view[i];
        if (c != '\x1b' && c != '\n') {
            run += c;
            i++;
            continue;
        }

        put(grid, row, col, run);
        run.clear();

        if (c == '\n') {
            row++;
            col = 0;
            i++;
            continue;
        }

        // ESC: only CSI sequences carry anything we act on
        if (i + 1 >= view.size() || view[i + 1] != '[') {
            i += 2;
            continue;
        }

        size_t end = i + 2;
        while (end < view.size() &&
               !(view[end] >= 0x40 && view[end] <= 0x7e))
            end++;
        if (end >= view.size()) break;

        if (view[end] == 'H') {
            std::string params = view.substr(i + 2, end - i - 2);
            auto semi = params.find(';');
            int r = 1, k = 1;
            try {
                if (semi == std::string::npos) {
                    if (!params.empty()) r = std::stoi(params);
                } else {
                    if (semi > 0) r = std::stoi(params.substr(0, semi));
                    if (semi + 1 < params.size())
                        k = std::stoi(params.substr(semi + 1));
                }
            } catch (const std::exception&) {
                r = 1;
                k = 1;
            }
            row = r - 1;
            col = k - 1;
        }
        i = end + 1;
    }
    put(grid, row, col, run);

    std::vector<std::string> lines;
    lines.reserve(grid.size());
    for (auto& cells : grid) {
        std::string line;
        for (auto& cell : cells)
            line += cell;
        lines.push_back(std::move(line));
    }
    return lines;
}

Element TerminalRenderer::toElement(const std::string& view, int width,
                                    int height) {
    Elements rows;
    for (auto& line : compose(view, width, height))
        rows.push_back(text(line));
    return vbox(std::move(rows));
}

void TerminalRenderer::setupScreen() {
    resetPosition_.clear();
}

void TerminalRenderer::render(const Model& model) {
    auto screen = Screen::Create(Dimension::Full(), Dimension::Full());
    Render(screen, toElement(model.view(), screen.dimx(), screen.dimy()));

    std::cout << resetPosition_;
    screen.Print();
    std::cout << std::flush;
    resetPosition_ = screen.ResetPosition();
}

void TerminalRenderer::restoreScreen() {
    std::cout << std::endl;
    resetPosition_.clear();
}
