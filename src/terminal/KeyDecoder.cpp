#include "terminal/KeyDecoder.hpp"
#include <cctype>
#include <stdexcept>

namespace {

// Final byte of a CSI / SS3 cursor sequence -> key name
const char* cursorKey(char final) {
    switch (final) {
        case 'A': return "up";
        case 'B': return "down";
        case 'C': return "right";
        case 'D': return "left";
        case 'H': return "home";
        case 'F': return "end";
        default:  return nullptr;
    }
}

// Numeric CSI "n~" sequences
const char* tildeKey(int code) {
    switch (code) {
        case 1: case 7: return "home";
        case 3:         return "delete";
        case 4: case 8: return "end";
        case 5:         return "page_up";
        case 6:         return "page_down";
        default:        return nullptr;
    }
}

}

Message KeyDecoder::named(const std::string& key, bool ctrl, bool alt,
                          bool shift) {
    return Message::keyPress(key, "", ctrl, alt, shift);
}

Message KeyDecoder::decode(const std::string& input) {
    if (input.empty()) return Message::none();

    if (input.size() == 1) {
        unsigned char c = static_cast<unsigned char>(input[0]);
        switch (c) {
            case '\r': case '\n': return named("enter");
            case '\t':            return named("tab");
            case 0x7f: case '\b': return named("backspace");
            case 0x1b:            return named("escape");
            case 0x00:            return named("space", true);
            default: break;
        }
        if (c < 0x20) {
            std::string letter(1, static_cast<char>('a' + c - 1));
            return Message::keyPress(letter, "", true);
        }
        bool upper = std::isupper(c) != 0;
        return Message::keyPress(input, input, false, false, upper);
    }

    if (static_cast<unsigned char>(input[0]) == 0x1b)
        return decodeEscape(input);

    // Multi-byte UTF-8 text
    return Message::keyPress(input, input);
}

Message KeyDecoder::decodeEscape(const std::string& input) {
    // ESC <key>: alt-modified key
    if (input.size() == 2 && input[1] != '[' && input[1] != 'O') {
        Message inner = decode(input.substr(1));
        if (inner.is(Message::Type::KeyPress))
            inner.alt = true;
        return inner;
    }

    if (input.size() < 3) return Message::none();

    // SS3: ESC O A
    if (input[1] == 'O') {
        if (auto key = cursorKey(input[2])) return named(key);
        return Message::none();
    }

    if (input[1] != '[') return Message::none();

    std::string body = input.substr(2);
    char final = body.back();
    std::string params = body.substr(0, body.size() - 1);

    if (final == 'Z') return named("tab", false, false, true);

    // Parameters: "<code>" or "<code>;<modifier>"
    int code = 0;
    int modifier = 1;
    auto semi = params.find(';');
    try {
        if (!params.empty())
            code = std::stoi(params.substr(0, semi));
        if (semi != std::string::npos)
            modifier = std::stoi(params.substr(semi + 1));
    } catch (const std::exception&) {
        return Message::none();
    }

    int bits  = modifier - 1;
    bool shift = (bits & 1) != 0;
    bool alt   = (bits & 2) != 0;
    bool ctrl  = (bits & 4) != 0;

    if (final == '~') {
        if (auto key = tildeKey(code)) return named(key, ctrl, alt, shift);
        return Message::none();
    }
    if (auto key = cursorKey(final)) return named(key, ctrl, alt, shift);

    return Message::none();
}
