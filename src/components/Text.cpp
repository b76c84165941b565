#include "components/Text.hpp"
#include "terminal/Cursor.hpp"
#include <ftxui/screen/string.hpp>
#include <sstream>

namespace {

struct Glyph {
    std::string text;
    int         width;
};

// ftxui reserves the second cell of a full-width glyph with an empty entry
std::vector<Glyph> glyphsOf(const std::string& s) {
    std::vector<Glyph> out;
    for (auto& g : ftxui::Utf8ToGlyphs(s)) {
        if (g.empty() && !out.empty()) {
            out.back().width++;
            continue;
        }
        out.push_back({g, 1});
    }
    return out;
}

}

std::string Text::view() const {
    auto text = content();
    if (text.empty()) return "";
    return place(wrap(text, bounds().width));
}

std::string Text::place(std::vector<std::string> lines) const {
    auto& b = bounds();
    if ((int)lines.size() > b.height)
        lines.resize(b.height > 0 ? b.height : 0);

    std::string out;
    for (size_t i = 0; i < lines.size(); i++)
        out += cursorTo(b.x, b.y + (int)i) + lines[i];
    return out;
}

std::vector<std::string> Text::wrap(const std::string& text, int width) {
    std::vector<std::string> lines;
    if (width <= 0) return lines;

    std::istringstream paragraphs(text);
    std::string paragraph;
    while (std::getline(paragraphs, paragraph)) {
        std::istringstream words(paragraph);
        std::string word;
        std::string line;
        int lineWidth = 0;
        bool emitted = false;

        while (words >> word) {
            int wordWidth = ftxui::string_width(word);

            if (wordWidth > width) {
                if (!line.empty()) lines.push_back(line);

                // Split between glyphs; the last piece opens the next line
                std::string piece;
                int pieceWidth = 0;
                for (auto& g : glyphsOf(word)) {
                    if (pieceWidth > 0 && pieceWidth + g.width > width) {
                        lines.push_back(piece);
                        piece.clear();
                        pieceWidth = 0;
                    }
                    piece += g.text;
                    pieceWidth += g.width;
                }
                line = piece;
                lineWidth = pieceWidth;
                emitted = true;
                continue;
            }

            if (line.empty()) {
                line = word;
                lineWidth = wordWidth;
            } else if (lineWidth + 1 + wordWidth <= width) {
                line += ' ' + word;
                lineWidth += 1 + wordWidth;
            } else {
                lines.push_back(line);
                line = word;
                lineWidth = wordWidth;
            }
        }

        if (!line.empty() || !emitted)
            lines.push_back(line);
    }
    return lines;
}
