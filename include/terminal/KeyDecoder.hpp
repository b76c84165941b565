#pragma once
#include "runtime/Message.hpp"
#include <string>

// Maps raw terminal input (one key's worth of bytes) to a KeyPress.
//
// Printable text: key == value == the text, shift set for upper-case ASCII.
// Named keys (enter, tab, backspace, escape, up, down, left, right, home,
// end, delete, page_up, page_down): key is the name, value is empty.
// Control characters: ctrl set, key is the lower-case letter.
// ESC followed by a key: alt set on the decoded key.
// Anything unrecognised decodes to None.
class KeyDecoder {
public:
    static Message decode(const std::string& input);

private:
    static Message decodeEscape(const std::string& input);
    static Message named(const std::string& key, bool ctrl = false,
                         bool alt = false, bool shift = false);
};
