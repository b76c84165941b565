#include "terminal/TerminalProgram.hpp"
#include "terminal/KeyDecoder.hpp"
#include "terminal/TerminalRenderer.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace ftxui;

namespace {

// Posts a custom event every interval until destroyed
class Ticker {
public:
    Ticker(ScreenInteractive& screen, std::chrono::milliseconds interval)
        : thread_([this, &screen, interval] {
              while (running_) {
                  std::this_thread::sleep_for(interval);
                  if (running_) screen.PostEvent(Event::Custom);
              }
          }) {}

    ~Ticker() {
        running_ = false;
        if (thread_.joinable()) thread_.join();
    }

private:
    std::atomic<bool> running_{true};
    std::thread       thread_;
};

}

TerminalProgram::TerminalProgram(ModelPtr model, Runtime& runtime, int fps)
    : program_(std::move(model), runtime, *this, fps) {}

void TerminalProgram::render(const Model& model) {
    auto frame = model.view();
    std::lock_guard lock(frameMtx_);
    frame_ = std::move(frame);
}

void TerminalProgram::run() {
    auto screen = ScreenInteractive::Fullscreen();

    program_.start();
    auto lastSize = Terminal::Size();

    auto renderer = Renderer([&] {
        auto size = Terminal::Size();
        if (size.dimx != lastSize.dimx || size.dimy != lastSize.dimy) {
            lastSize = size;
            program_.enqueue(Message::resize(size.dimx, size.dimy));
        }

        std::lock_guard lock(frameMtx_);
        return TerminalRenderer::toElement(frame_, size.dimx, size.dimy);
    });

    auto component = CatchEvent(renderer, [&](Event event) {
        if (event == Event::Custom) {
            program_.step();
            if (!program_.running()) {
                spdlog::info("Runtime stopped, leaving terminal loop");
                screen.Exit();
            }
            return true;
        }
        if (event.is_mouse())
            return false;

        auto message = KeyDecoder::decode(event.input());
        if (!message.isNone())
            program_.enqueue(std::move(message));
        return true;
    });

    Ticker ticker(screen, program_.refreshInterval());
    screen.Loop(component);

    if (program_.running())
        program_.stop();
}
