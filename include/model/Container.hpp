#pragma once
#include "Bounds.hpp"
#include "Model.hpp"
#include <vector>

enum class Direction {
    Row,      // children side by side, sharing the width
    Column    // children stacked, sharing the height
};

// A model that owns a rectangle and splits it between its children.
//
// Geometry comes from the reserved state keys width/height/x/y, which are
// removed from the state. Missing width/height fall back to the ambient
// screen size, missing x/y to 0. Each child receives its slice of the
// rectangle through the same four keys, overriding whatever its mapper
// produced for them.
class Container : public Model {
public:
    const Bounds& bounds() const { return bounds_; }

    virtual Direction direction() const { return Direction::Column; }

    // Transparent layout shell unless a subclass draws something itself
    std::string view() const override { return childrenViews(); }

    // Split `area` along `direction` in proportion to `weights`.
    // Sizes are floor(extent * weight / total); the rounding remainder is
    // left unassigned. A non-positive total gives every child zero extent.
    // Throws TeacupError for a negative width or height.
    static std::vector<Bounds> layout(const Bounds& area,
                                      Direction direction,
                                      const std::vector<int>& weights);

protected:
    State prepareState(const State& overrides) override;
    std::vector<ModelPtr> buildChildren(const State& parentState) const override;
    State carriedState() const override;

private:
    Bounds bounds_;
};

std::string directionToString(Direction d);
