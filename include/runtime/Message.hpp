#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Events consumed by Model::update. The same tagged value is returned from
// update as a command describing a side effect for the Runtime.
// Messages are plain values: copied into the queue, compared structurally.
struct Message {
    enum class Type {
        None,       // no-op, never triggers a render
        Exit,       // stop the runtime
        Tick,       // timer tick
        KeyPress,   // decoded keyboard input
        Batch,      // several messages, re-enqueued for the next tick
        Reload,     // component definitions were swapped
        Resize,     // terminal size changed
        Custom      // application-defined
    };

    Type type = Type::None;

    // KeyPress
    std::string key;        // "a", "enter", "up", ...
    std::string value;      // printable text, empty for named keys
    bool        ctrl  = false;
    bool        alt   = false;
    bool        shift = false;

    // Batch
    std::vector<Message> messages;

    // Resize
    int width  = 0;
    int height = 0;

    // Custom
    std::string    name;
    nlohmann::json payload;

    static Message none() { return {}; }

    static Message exit() {
        Message m;
        m.type = Type::Exit;
        return m;
    }

    static Message tick() {
        Message m;
        m.type = Type::Tick;
        return m;
    }

    static Message reload() {
        Message m;
        m.type = Type::Reload;
        return m;
    }

    static Message keyPress(std::string key, std::string value,
                            bool ctrl = false, bool alt = false,
                            bool shift = false) {
        Message m;
        m.type  = Type::KeyPress;
        m.key   = std::move(key);
        m.value = std::move(value);
        m.ctrl  = ctrl;
        m.alt   = alt;
        m.shift = shift;
        return m;
    }

    // Printable key: key and value are the same character
    static Message character(const std::string& ch) {
        return keyPress(ch, ch);
    }

    static Message batch(std::vector<Message> messages) {
        Message m;
        m.type     = Type::Batch;
        m.messages = std::move(messages);
        return m;
    }

    static Message resize(int width, int height) {
        Message m;
        m.type   = Type::Resize;
        m.width  = width;
        m.height = height;
        return m;
    }

    static Message custom(std::string name,
                          nlohmann::json payload = nullptr) {
        Message m;
        m.type    = Type::Custom;
        m.name    = std::move(name);
        m.payload = std::move(payload);
        return m;
    }

    bool is(Type t) const { return type == t; }
    bool isNone() const { return type == Type::None; }

    // True for a KeyPress carrying exactly this text, without modifiers
    bool isKey(const std::string& text) const {
        return type == Type::KeyPress && value == text && !ctrl && !alt;
    }

    bool isCustom(const std::string& customName) const {
        return type == Type::Custom && name == customName;
    }

    bool operator==(const Message& o) const;
    bool operator!=(const Message& o) const { return !(*this == o); }

    std::string describe() const;
    nlohmann::json toJson() const;
};

// What update() hands back to the Runtime
using Command = Message;

std::string messageTypeToString(Message::Type t);
