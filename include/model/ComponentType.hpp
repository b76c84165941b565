#pragma once
#include "Model.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>

// A named component definition. Every model is built through one, and
// models keep a handle to it so with() reconstructs through whatever
// factory is current. replace() swaps the definition in place, which is
// how a hot reload reaches instances that already exist.
class ComponentType : public std::enable_shared_from_this<ComponentType> {
public:
    using Factory = std::function<std::unique_ptr<Model>()>;

    ComponentType(std::string name, Factory factory);

    template <typename T>
    static ComponentTypePtr of(std::string name) {
        static_assert(std::is_base_of<Model, T>::value,
                      "component types must derive from Model");
        return std::make_shared<ComponentType>(
            std::move(name), [] { return std::make_unique<T>(); });
    }

    const std::string& name() const { return name_; }

    // Run the current factory, then the construction protocol:
    // merge defaults, freeze, build the child tree.
    ModelPtr create(const State& state = State::object(),
                    const BuildContext& context = {}) const;

    void replace(Factory factory);

    template <typename T>
    void replace() {
        static_assert(std::is_base_of<Model, T>::value,
                      "component types must derive from Model");
        replace([] { return std::make_unique<T>(); });
    }

    int revision() const;

private:
    std::string     name_;
    Factory         factory_;
    int             revision_ = 1;
    mutable std::mutex mtx_;
};
