#pragma once
#include "AppConfig.hpp"
#include "model/ComponentRegistry.hpp"
#include "runtime/Runtime.hpp"
#include <spdlog/spdlog.h>
#include <string>

// Wires configuration, component registry and runtime together and runs
// the terminal front end (or the headless Program) on the root model.
class Application {
public:
    Application(AppConfig config, ComponentRegistry& registry);

    // Build the root named by config.root with config.rootState.
    // Throws ConfigError when no root is configured and
    // ComponentNotFoundError when the name is not registered.
    ModelPtr rootModel() const;

    // Swap the definition of a registered type and queue a Reload so the
    // next tick re-renders. Refused (returns false) unless hot reloading
    // is enabled.
    template <typename T>
    bool redefine(const std::string& name) {
        if (!config_.hotReloadingEnabled()) {
            spdlog::warn("Hot reloading disabled; '{}' not redefined", name);
            return false;
        }
        registry_.redefine<T>(name);
        reload();
        return true;
    }

    void reload() { runtime_.enqueue(Message::reload()); }

    // Blocks until the runtime stops
    void run();

    Runtime& runtime() { return runtime_; }
    const AppConfig& config() const { return config_; }
    ComponentRegistry& registry() { return registry_; }

private:
    AppConfig          config_;
    ComponentRegistry& registry_;
    Runtime            runtime_;
};
