#include "model/ComponentType.hpp"

ComponentType::ComponentType(std::string name, Factory factory)
    : name_(std::move(name))
    , factory_(std::move(factory)) {}

ModelPtr ComponentType::create(const State& state,
                               const BuildContext& context) const {
    Factory factory;
    {
        std::lock_guard lock(mtx_);
        factory = factory_;
    }

    if (!factory)
        throw InvalidChildTypeError("component type '" + name_ +
                                    "' has no factory");

    std::unique_ptr<Model> model = factory();
    if (!model)
        throw InvalidChildTypeError("component type '" + name_ +
                                    "' produced no model");

    model->construct(shared_from_this(), state, context);
    return ModelPtr(std::move(model));
}

void ComponentType::replace(Factory factory) {
    std::lock_guard lock(mtx_);
    factory_ = std::move(factory);
    revision_++;
}

int ComponentType::revision() const {
    std::lock_guard lock(mtx_);
    return revision_;
}
