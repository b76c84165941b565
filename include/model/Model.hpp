#pragma once
#include "BuildContext.hpp"
#include "Errors.hpp"
#include "runtime/Message.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

class Model;
class ComponentType;

using State            = nlohmann::json;
using ModelPtr         = std::shared_ptr<const Model>;
using ComponentTypePtr = std::shared_ptr<ComponentType>;

// Pure function from parent state to a partial child state
using StateMapper = std::function<State(const State&)>;

// Names an entry of the parent's childMethods() table. The method picks
// the child's component type from the parent's state at construction.
struct ChildMethod {
    std::string name;
};

using ChildSelector = std::variant<ComponentTypePtr, ChildMethod>;

// One declared child: what to build, what state it gets, how much room.
struct ChildSpec {
    ChildSelector selector;
    StateMapper   mapper;       // empty = isolated child state
    int           weight = 1;   // share of the layout axis (Container only)
};

struct UpdateResult {
    ModelPtr model;
    Command  command;
};

// Immutable unit of state + behaviour in the component tree.
//
// Models are only ever built by ComponentType::create(), which merges
// defaultState() with the caller's overrides and builds the whole child
// tree from childSpecs(). Nothing changes after that: update() and with()
// return new instances and leave this one untouched.
class Model : public std::enable_shared_from_this<Model> {
public:
    virtual ~Model() = default;

    Model(const Model&)            = delete;
    Model& operator=(const Model&) = delete;

    const State& state() const { return state_; }
    const std::vector<ModelPtr>& children() const { return children_; }
    const ComponentType& componentType() const { return *type_; }
    const std::string& typeName() const;

    // Render to a string. The base type throws NotImplementedError.
    virtual std::string view() const;

    // Pure state transition. The base type throws NotImplementedError.
    virtual UpdateResult update(const Message& message) const;

    // New model of the same component type with `partial` shallow-merged
    // over the current state. The type is looked up through the live
    // ComponentType, so a replaced definition applies here.
    ModelPtr with(const State& partial = State::object()) const;

    // Each child's view() in declaration order, no separator
    std::string childrenViews() const;

protected:
    Model() = default;

    using ChildMethods =
        std::unordered_map<std::string, std::function<ComponentTypePtr()>>;

    virtual State defaultState() const { return State::object(); }
    virtual std::vector<ChildSpec> childSpecs() const { return {}; }
    virtual ChildMethods childMethods() const { return {}; }

    // Construction hooks. prepareState() sees the raw overrides before the
    // default-state merge; buildChildren() turns childSpecs() into models.
    virtual State prepareState(const State& overrides);
    virtual std::vector<ModelPtr> buildChildren(const State& parentState) const;

    // State that with() merges over; containers add their geometry
    virtual State carriedState() const { return state_; }

    ComponentTypePtr resolveChildType(const ChildSelector& selector) const;
    ModelPtr buildChild(const ChildSpec& spec, const State& childState) const;
    static State mapState(const ChildSpec& spec, const State& parentState);

    const BuildContext& context() const { return context_; }

    UpdateResult unchanged(Command command = Command::none()) const {
        return {shared_from_this(), std::move(command)};
    }

    UpdateResult changed(const State& partial,
                         Command command = Command::none()) const {
        return {with(partial), std::move(command)};
    }

private:
    friend class ComponentType;

    void construct(std::shared_ptr<const ComponentType> type,
                   const State& overrides,
                   const BuildContext& context);

    std::shared_ptr<const ComponentType> type_;
    BuildContext          context_;
    State                 state_;
    std::vector<ModelPtr> children_;
};

// Shallow merge of two JSON objects; null counts as empty
State mergeState(const State& base, const State& overrides);
