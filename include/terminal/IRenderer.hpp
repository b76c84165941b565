#pragma once
#include "model/Model.hpp"

// Draws a model's view() somewhere. The Program calls render() only when
// the runtime reports a render is due.
class IRenderer {
public:
    virtual ~IRenderer() = default;

    virtual void setupScreen() = 0;
    virtual void render(const Model& model) = 0;
    virtual void restoreScreen() = 0;
};
