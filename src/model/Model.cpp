#include "model/Model.hpp"
#include "model/ComponentType.hpp"

namespace {
const std::string kUnboundTypeName = "<unbound>";
}

State mergeState(const State& base, const State& overrides) {
    State merged = base.is_null() ? State::object() : base;
    if (overrides.is_null())
        return merged;
    if (!merged.is_object() || !overrides.is_object())
        throw TeacupError("model state must be a JSON object, got " +
                          std::string(merged.is_object() ? overrides.type_name()
                                                         : merged.type_name()));
    merged.update(overrides);
    return merged;
}

const std::string& Model::typeName() const {
    return type_ ? type_->name() : kUnboundTypeName;
}

std::string Model::view() const {
    throw NotImplementedError(typeName() + " must implement view()");
}

UpdateResult Model::update(const Message&) const {
    throw NotImplementedError(typeName() + " must implement update()");
}

ModelPtr Model::with(const State& partial) const {
    if (!type_)
        throw TeacupError("model was not built through a ComponentType");
    return type_->create(mergeState(carriedState(), partial), context_);
}

std::string Model::childrenViews() const {
    std::string out;
    for (auto& child : children_)
        out += child->view();
    return out;
}

void Model::construct(std::shared_ptr<const ComponentType> type,
                      const State& overrides,
                      const BuildContext& context) {
    type_    = std::move(type);
    context_ = context;

    State prepared = prepareState(overrides.is_null() ? State::object()
                                                      : overrides);
    state_    = mergeState(defaultState(), prepared);
    children_ = buildChildren(state_);
}

State Model::prepareState(const State& overrides) {
    return overrides;
}

std::vector<ModelPtr> Model::buildChildren(const State& parentState) const {
    std::vector<ModelPtr> built;
    for (auto& spec : childSpecs())
        built.push_back(buildChild(spec, mapState(spec, parentState)));
    return built;
}

State Model::mapState(const ChildSpec& spec, const State& parentState) {
    if (!spec.mapper)
        return State::object();
    State mapped = spec.mapper(parentState);
    return mapped.is_null() ? State::object() : mapped;
}

ModelPtr Model::buildChild(const ChildSpec& spec, const State& childState) const {
    return resolveChildType(spec.selector)->create(childState, context_);
}

ComponentTypePtr Model::resolveChildType(const ChildSelector& selector) const {
    if (auto direct = std::get_if<ComponentTypePtr>(&selector)) {
        if (!*direct)
            throw InvalidChildTypeError(
                typeName() + ": child selector is a null component type");
        return *direct;
    }

    const auto& method = std::get<ChildMethod>(selector);
    auto methods = childMethods();
    auto it = methods.find(method.name);
    if (it == methods.end())
        throw MethodNotFoundError(
            typeName() + " has no child method '" + method.name + "'");

    if (!it->second)
        throw InvalidChildTypeError(
            typeName() + "::" + method.name + " is declared but not callable");

    ComponentTypePtr resolved = it->second();
    if (!resolved)
        throw InvalidChildTypeError(
            typeName() + "::" + method.name +
            " returned null instead of a component type");
    return resolved;
}
