#pragma once
#include "runtime/Runtime.hpp"
#include "terminal/IRenderer.hpp"
#include <chrono>

// Drives a Runtime on a fixed period and hands due frames to a renderer.
// The Program is the only caller of Runtime::tick().
class Program {
public:
    static constexpr int kDefaultFps = 60;

    Program(ModelPtr model, Runtime& runtime, IRenderer& renderer,
            int fps = kDefaultFps);

    // Start the runtime and draw the first frame
    void start();

    // One tick; renders if the runtime says so. Returns whether it rendered.
    bool step();

    // start(), then step() every refresh interval until the runtime stops.
    // The screen is restored on the way out, including on errors.
    void run();

    void stop() { runtime_.stop(); }
    bool running() const { return runtime_.running(); }

    void enqueue(Message message) { runtime_.enqueue(std::move(message)); }

    const ModelPtr& model() const { return model_; }
    std::chrono::milliseconds refreshInterval() const { return interval_; }
    int framesRendered() const { return frames_; }

private:
    ModelPtr   model_;
    Runtime&   runtime_;
    IRenderer& renderer_;
    std::chrono::milliseconds interval_;
    int        frames_ = 0;
};
