#include "model/ComponentRegistry.hpp"
#include <spdlog/spdlog.h>

ComponentTypePtr ComponentRegistry::add(ComponentTypePtr type) {
    if (!type)
        throw InvalidChildTypeError("cannot register a null component type");

    std::unique_lock lock(mtx_);
    auto [it, inserted] = types_.emplace(type->name(), type);
    if (!inserted)
        throw TeacupError("component type '" + type->name() +
                          "' is already defined");

    spdlog::debug("Defined component type '{}'", type->name());
    return it->second;
}

ComponentTypePtr ComponentRegistry::redefine(const std::string& name,
                                             ComponentType::Factory factory) {
    ComponentTypePtr type = get(name);
    type->replace(std::move(factory));
    spdlog::info("Component type '{}' redefined (revision {})",
                 name, type->revision());
    return type;
}

ComponentTypePtr ComponentRegistry::get(const std::string& name) const {
    std::shared_lock lock(mtx_);
    auto it = types_.find(name);
    if (it == types_.end())
        throw ComponentNotFoundError("no component type named '" + name + "'");
    return it->second;
}

bool ComponentRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mtx_);
    return types_.count(name) > 0;
}

std::vector<std::string> ComponentRegistry::names() const {
    std::shared_lock lock(mtx_);
    std::vector<std::string> result;
    result.reserve(types_.size());
    for (auto& [name, type] : types_)
        result.push_back(name);
    return result;
}

ModelPtr ComponentRegistry::create(const std::string& name,
                                   const State& state) const {
    return get(name)->create(state, context_);
}
