#include "runtime/Message.hpp"

std::string messageTypeToString(Message::Type t) {
    switch (t) {
        case Message::Type::None:     return "None";
        case Message::Type::Exit:     return "Exit";
        case Message::Type::Tick:     return "Tick";
        case Message::Type::KeyPress: return "KeyPress";
        case Message::Type::Batch:    return "Batch";
        case Message::Type::Reload:   return "Reload";
        case Message::Type::Resize:   return "Resize";
        case Message::Type::Custom:   return "Custom";
    }
    return "Unknown";
}

bool Message::operator==(const Message& o) const {
    if (type != o.type) return false;

    // Only the payload of the active variant takes part in equality
    switch (type) {
        case Type::KeyPress:
            return key == o.key && value == o.value && ctrl == o.ctrl &&
                   alt == o.alt && shift == o.shift;
        case Type::Batch:
            return messages == o.messages;
        case Type::Resize:
            return width == o.width && height == o.height;
        case Type::Custom:
            return name == o.name && payload == o.payload;
        default:
            return true;
    }
}

std::string Message::describe() const {
    switch (type) {
        case Type::KeyPress: {
            std::string mods;
            if (ctrl)  mods += "ctrl+";
            if (alt)   mods += "alt+";
            if (shift) mods += "shift+";
            return "KeyPress(" + mods + key + ")";
        }
        case Type::Batch:
            return "Batch(" + std::to_string(messages.size()) + " messages)";
        case Type::Resize:
            return "Resize(" + std::to_string(width) + "x" +
                   std::to_string(height) + ")";
        case Type::Custom:
            return "Custom(" + name + ")";
        default:
            return messageTypeToString(type);
    }
}

nlohmann::json Message::toJson() const {
    nlohmann::json j = {{"type", messageTypeToString(type)}};

    switch (type) {
        case Type::KeyPress:
            j["key"]   = key;
            j["value"] = value;
            j["ctrl"]  = ctrl;
            j["alt"]   = alt;
            j["shift"] = shift;
            break;
        case Type::Batch:
            j["messages"] = nlohmann::json::array();
            for (auto& m : messages)
                j["messages"].push_back(m.toJson());
            break;
        case Type::Resize:
            j["width"]  = width;
            j["height"] = height;
            break;
        case Type::Custom:
            j["name"]    = name;
            j["payload"] = payload;
            break;
        default:
            break;
    }
    return j;
}
