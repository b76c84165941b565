#include "app/Application.hpp"
#include "app/Logging.hpp"
#include "components/Text.hpp"
#include "terminal/TerminalScreen.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

// Demo: a weighted dashboard whose body panel is picked from state.
//   +/-  change the counter      h  toggle help
//   0    reset (via a batched command)      q  quit

static Runtime* g_runtime = nullptr;

static void signalHandler(int) {
    if (g_runtime) g_runtime->stop();
}

class Header : public Text {
public:
    std::string content() const override {
        return "== " + state().value("title", std::string()) + " ==";
    }
};

class CounterPanel : public Text {
public:
    std::string content() const override {
        return "Count: " + std::to_string(state().value("count", 0)) + "\n\n"
               "[+] increment  [-] decrement  [0] reset";
    }

protected:
    State defaultState() const override { return {{"count", 0}}; }
};

class TipsPanel : public Text {
protected:
    State defaultState() const override {
        return {{"content", "Tips\n\nThis column gets a third of the width. "
                            "Resize the terminal to watch it reflow."}};
    }
};

class HelpPanel : public Text {
protected:
    State defaultState() const override {
        return {{"content",
                 "Every key press becomes a message. The dashboard folds it "
                 "into a new immutable state and the whole tree is rebuilt "
                 "from there. Press h to go back."}};
    }
};

class StatusBar : public Text {
public:
    std::string content() const override {
        auto& b = bounds();
        return std::to_string(b.width) + "x" + std::to_string(b.height) +
               " @(" + std::to_string(b.x) + "," + std::to_string(b.y) + ")" +
               "  keys: " + std::to_string(state().value("presses", 0)) +
               "  [h] help  [q] quit";
    }
};

static const ComponentTypePtr& headerType() {
    static auto type = ComponentType::of<Header>("Header");
    return type;
}

static const ComponentTypePtr& counterType() {
    static auto type = ComponentType::of<CounterPanel>("CounterPanel");
    return type;
}

static const ComponentTypePtr& tipsType() {
    static auto type = ComponentType::of<TipsPanel>("TipsPanel");
    return type;
}

// Counter and tips side by side
class CounterBody : public Container {
public:
    Direction direction() const override { return Direction::Row; }
    UpdateResult update(const Message&) const override { return unchanged(); }

protected:
    std::vector<ChildSpec> childSpecs() const override {
        return {
            {counterType(), [](const State& s) {
                 return State{{"count", s.value("count", 0)}};
             }, 2},
            {tipsType(), {}, 1},
        };
    }
};

static const ComponentTypePtr& counterBodyType() {
    static auto type = ComponentType::of<CounterBody>("CounterBody");
    return type;
}

static const ComponentTypePtr& helpType() {
    static auto type = ComponentType::of<HelpPanel>("HelpPanel");
    return type;
}

static const ComponentTypePtr& statusType() {
    static auto type = ComponentType::of<StatusBar>("StatusBar");
    return type;
}

class Dashboard : public Container {
public:
    UpdateResult update(const Message& m) const override {
        switch (m.type) {
            case Message::Type::KeyPress:
                return handleKey(m);
            case Message::Type::Resize:
                return changed({{"width", m.width}, {"height", m.height}});
            case Message::Type::Reload:
                return changed({});  // rebuild through the redefined types
            case Message::Type::Custom:
                if (m.isCustom("reset"))
                    return changed({{"count", 0}});
                return unchanged();
            default:
                return unchanged();
        }
    }

protected:
    State defaultState() const override {
        return {
            {"title",   "Teacup dashboard"},
            {"count",   0},
            {"screen",  "counter"},
            {"presses", 0}
        };
    }

    std::vector<ChildSpec> childSpecs() const override {
        return {
            {headerType(), [](const State& s) {
                 return State{{"title", s.value("title", std::string())}};
             }, 1},
            {ChildMethod{"body"}, [](const State& s) {
                 return State{{"count", s.value("count", 0)}};
             }, 3},
            {statusType(), [](const State& s) {
                 return State{{"presses", s.value("presses", 0)}};
             }, 1},
        };
    }

    ChildMethods childMethods() const override {
        return {{"body", [this] {
            return state().value("screen", std::string()) == "help"
                ? helpType() : counterBodyType();
        }}};
    }

private:
    UpdateResult handleKey(const Message& m) const {
        int presses = state().value("presses", 0) + 1;
        int count   = state().value("count", 0);

        if (m.isKey("q") || (m.ctrl && m.key == "c"))
            return {shared_from_this(), Command::exit()};
        if (m.isKey("+"))
            return changed({{"count", count + 1}, {"presses", presses}});
        if (m.isKey("-"))
            return changed({{"count", count - 1}, {"presses", presses}});
        if (m.isKey("h")) {
            bool help = state().value("screen", std::string()) == "help";
            return changed({{"screen", help ? "counter" : "help"},
                            {"presses", presses}});
        }
        if (m.isKey("0"))
            return changed({{"presses", presses}},
                           Command::batch({Message::custom("reset")}));

        return changed({{"presses", presses}});
    }
};

static void registerDemoComponents(ComponentRegistry& registry) {
    registry.add(headerType());
    registry.add(counterType());
    registry.add(tipsType());
    registry.add(counterBodyType());
    registry.add(helpType());
    registry.add(statusType());
    registry.define<Dashboard>("Dashboard");
}

int main(int argc, char* argv[]) {
    loadDotEnv(".env");

    AppConfig config;
    try {
        if (argc > 1) config = AppConfig::load(argv[1]);
        config.applyEnvironment();
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    if (config.root.empty()) config.root = "Dashboard";

    setupLogging(config, !config.headless);
    spdlog::info("Teacup demo v0.1.0 ({})", config.env);

    ComponentRegistry registry(BuildContext{std::make_shared<TerminalScreen>()});
    registerDemoComponents(registry);

    Application app(config, registry);
    g_runtime = &app.runtime();
    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        app.run();
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
