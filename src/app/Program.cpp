#include "app/Program.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

Program::Program(ModelPtr model, Runtime& runtime, IRenderer& renderer,
                 int fps)
    : model_(std::move(model))
    , runtime_(runtime)
    , renderer_(renderer)
    , interval_(std::max(1, 1000 / (fps > 0 ? fps : kDefaultFps)))
{
    if (!model_)
        throw TeacupError("Program needs a root model");
}

void Program::start() {
    runtime_.start();
    renderer_.setupScreen();
    renderer_.render(*model_);
    frames_++;
    spdlog::info("Program started: root {} at {}ms per tick",
                 model_->typeName(), interval_.count());
}

bool Program::step() {
    model_ = runtime_.tick(model_);
    if (!runtime_.render())
        return false;

    renderer_.render(*model_);
    frames_++;
    return true;
}

void Program::run() {
    try {
        start();
        while (runtime_.running()) {
            auto begin = std::chrono::steady_clock::now();

            step();

            // Sleep for remainder of interval
            auto elapsed = std::chrono::steady_clock::now() - begin;
            if (elapsed < interval_)
                std::this_thread::sleep_for(interval_ - elapsed);
        }
    } catch (const std::exception& e) {
        spdlog::error("Program aborted: {}", e.what());
        renderer_.restoreScreen();
        throw;
    }

    renderer_.restoreScreen();
    spdlog::info("Program stopped after {} frames", frames_);
}
