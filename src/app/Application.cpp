#include "app/Application.hpp"
#include "app/Program.hpp"
#include "terminal/TerminalProgram.hpp"
#include "terminal/TerminalRenderer.hpp"

Application::Application(AppConfig config, ComponentRegistry& registry)
    : config_(std::move(config))
    , registry_(registry) {}

ModelPtr Application::rootModel() const {
    if (config_.root.empty())
        throw ConfigError("No root component configured (set \"root\")");
    return registry_.create(config_.root, config_.rootState);
}

void Application::run() {
    auto root = rootModel();

    spdlog::info("Teacup starting: root={} env={} fps={} hot_reloading={}",
                 config_.root, config_.env, config_.fps,
                 config_.hotReloadingEnabled());

    if (config_.headless) {
        TerminalRenderer renderer;
        Program program(root, runtime_, renderer, config_.fps);
        program.run();
    } else {
        TerminalProgram terminal(root, runtime_, config_.fps);
        terminal.run();
    }

    spdlog::info("Teacup exited cleanly");
}
