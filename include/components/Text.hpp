#pragma once
#include "model/Container.hpp"
#include <string>
#include <vector>

// Word-wrapped text confined to its bounds.
// State: content (string). Each wrapped line is placed at
// (bounds().x, bounds().y + line) with a cursor token, so sibling Texts in
// a row or column land where the layout put them. Lines past
// bounds().height are dropped.
class Text : public Container {
public:
    std::string view() const override;
    UpdateResult update(const Message&) const override { return unchanged(); }

    // Subclasses may derive the text from other state keys
    virtual std::string content() const { return state().value("content", ""); }

    // Greedy word wrap measured in terminal cells, not bytes. Words wider
    // than `width` are split between glyphs. Embedded newlines start a
    // new line.
    static std::vector<std::string> wrap(const std::string& text, int width);

protected:
    State defaultState() const override { return {{"content", ""}}; }

    // Position `lines` inside bounds(), one per row, cut to the height
    std::string place(std::vector<std::string> lines) const;
};
