#pragma once
#include <nlohmann/json.hpp>

// Position and size of a component, in terminal cells
struct Bounds {
    int width  = 0;
    int height = 0;
    int x      = 0;
    int y      = 0;

    bool operator==(const Bounds& o) const {
        return width == o.width && height == o.height && x == o.x && y == o.y;
    }
    bool operator!=(const Bounds& o) const { return !(*this == o); }

    nlohmann::json toJson() const {
        return {
            {"width",  width},
            {"height", height},
            {"x",      x},
            {"y",      y}
        };
    }
};
