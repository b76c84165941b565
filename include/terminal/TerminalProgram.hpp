#pragma once
#include "IRenderer.hpp"
#include "app/Program.hpp"
#include <mutex>
#include <string>

namespace ftxui { class ScreenInteractive; }

// Interactive terminal front end built on ftxui::ScreenInteractive.
//
// A ticker thread posts a custom event every refresh interval; the event
// handler steps the Program on the ftxui loop thread, so tick(), update()
// and drawing all stay on one thread. Keys are decoded into KeyPress
// messages, terminal size changes into Resize. The loop exits once the
// runtime stops.
class TerminalProgram : public IRenderer {
public:
    TerminalProgram(ModelPtr model, Runtime& runtime,
                    int fps = Program::kDefaultFps);

    // Blocks until the runtime stops
    void run();

    // IRenderer: cache the frame; ftxui draws it on its next redraw
    void setupScreen() override {}
    void render(const Model& model) override;
    void restoreScreen() override {}

private:
    Program     program_;
    std::string frame_;
    std::mutex  frameMtx_;
};
