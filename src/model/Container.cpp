#include "model/Container.hpp"
#include <numeric>

namespace {
const char* const kGeometryKeys[] = {"width", "height", "x", "y"};

int geometryValue(const State& state, const char* key, int fallback) {
    auto it = state.find(key);
    if (it == state.end() || it->is_null())
        return fallback;
    if (!it->is_number())
        throw TeacupError(std::string("container geometry '") + key +
                          "' must be a number, got " + it->type_name());
    return it->get<int>();
}

int extentValue(const State& state, const char* key, int fallback) {
    int value = geometryValue(state, key, fallback);
    if (value < 0)
        throw TeacupError(std::string("container ") + key +
                          " must not be negative, got " + std::to_string(value));
    return value;
}
}

std::string directionToString(Direction d) {
    return d == Direction::Row ? "row" : "column";
}

std::vector<Bounds> Container::layout(const Bounds& area,
                                      Direction direction,
                                      const std::vector<int>& weights) {
    if (area.width < 0 || area.height < 0)
        throw TeacupError("layout area must not have a negative extent");

    int total = std::accumulate(weights.begin(), weights.end(), 0);

    std::vector<Bounds> slices;
    slices.reserve(weights.size());

    int offset = direction == Direction::Column ? area.y : area.x;
    for (int weight : weights) {
        int extent = 0;
        if (total > 0) {
            int axis = direction == Direction::Column ? area.height : area.width;
            extent = static_cast<int>(
                static_cast<long long>(axis) * weight / total);
        }

        Bounds b;
        if (direction == Direction::Column) {
            b = {area.width, extent, area.x, offset};
        } else {
            b = {extent, area.height, offset, area.y};
        }
        slices.push_back(b);
        offset += extent;
    }
    return slices;
}

State Container::prepareState(const State& overrides) {
    auto screen = context().screenSize();
    bounds_.width  = extentValue(overrides, "width",  screen.width);
    bounds_.height = extentValue(overrides, "height", screen.height);
    bounds_.x      = geometryValue(overrides, "x", 0);
    bounds_.y      = geometryValue(overrides, "y", 0);

    State rest = overrides;
    for (const char* key : kGeometryKeys)
        rest.erase(key);
    return rest;
}

std::vector<ModelPtr> Container::buildChildren(const State& parentState) const {
    auto specs = childSpecs();
    if (specs.empty())
        return {};

    std::vector<int> weights;
    weights.reserve(specs.size());
    for (auto& spec : specs) {
        if (spec.weight < 0)
            throw TeacupError(typeName() + ": child weight must not be negative");
        weights.push_back(spec.weight);
    }

    auto slices = layout(bounds_, direction(), weights);

    std::vector<ModelPtr> built;
    built.reserve(specs.size());
    for (size_t i = 0; i < specs.size(); i++) {
        // Geometry wins over whatever the mapper put in these keys
        State childState = mergeState(mapState(specs[i], parentState),
                                      slices[i].toJson());
        built.push_back(buildChild(specs[i], childState));
    }
    return built;
}

State Container::carriedState() const {
    return mergeState(state(), bounds_.toJson());
}
