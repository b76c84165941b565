#pragma once
#include "ComponentType.hpp"
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

// Name -> ComponentType table owned by the application.
//
// redefine() swaps the factory inside the existing ComponentType rather
// than registering a new object, so models already holding the handle
// pick up the new definition on their next with().
class ComponentRegistry {
public:
    explicit ComponentRegistry(BuildContext context = {})
        : context_(std::move(context)) {}

    template <typename T>
    ComponentTypePtr define(const std::string& name) {
        return add(ComponentType::of<T>(name));
    }

    template <typename T>
    ComponentTypePtr redefine(const std::string& name) {
        static_assert(std::is_base_of<Model, T>::value,
                      "component types must derive from Model");
        return redefine(name, [] { return std::make_unique<T>(); });
    }

    // Register an existing type handle. Throws if the name is taken.
    ComponentTypePtr add(ComponentTypePtr type);

    ComponentTypePtr redefine(const std::string& name,
                              ComponentType::Factory factory);

    ComponentTypePtr get(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;

    // Build a model of the named type with this registry's context
    ModelPtr create(const std::string& name,
                    const State& state = State::object()) const;

    const BuildContext& context() const { return context_; }

private:
    BuildContext context_;
    std::map<std::string, ComponentTypePtr> types_;
    mutable std::shared_mutex mtx_;
};
