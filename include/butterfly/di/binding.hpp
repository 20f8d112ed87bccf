#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "butterfly/di/factory_chain.hpp"

namespace butterfly::di {

/**
 * @brief Binding lifetime scope
 */
enum class Scope {
    SINGLETON,  // Built once, cached, disposed at shutdown
    PROTOTYPE   // Built on every resolution, owned by the caller
};

inline std::ostream& operator<<(std::ostream& os, Scope scope) {
    switch (scope) {
        case Scope::SINGLETON:
            return os << "singleton";
        case Scope::PROTOTYPE:
            return os << "prototype";
        default:
            return os << "unknown";
    }
}

/**
 * @brief Cleanup run once per singleton instance
 *
 * Either a zero-argument method of the instance's type or an action taking
 * the instance.
 */
class DisposeHook {
public:
    using Action = std::function<void(const Value& instance)>;

    static DisposeHook method(std::string method_name) {
        DisposeHook hook;
        hook.method_name_ = std::move(method_name);
        return hook;
    }

    static DisposeHook action(Action action) {
        DisposeHook hook;
        hook.action_ = std::move(action);
        return hook;
    }

    bool is_method() const { return !method_name_.empty(); }
    const std::string& method_name() const { return method_name_; }
    const Action& closure() const { return action_; }

    std::string describe() const {
        return is_method() ? method_name_ + "()" : std::string("<action>");
    }

private:
    DisposeHook() = default;

    std::string method_name_;
    Action action_;
};

/**
 * @brief What a binding builds: main chain, configure chain, dispose hook
 */
struct BindingDefinition {
    FactoryChain chain;
    FactoryChain configure;
    std::optional<DisposeHook> dispose;
};

/**
 * @brief Immutable registered recipe
 *
 * replace() never edits a Binding; it installs a new one with the next
 * version, so a resolution holding the old pointer finishes on one chain.
 */
struct Binding {
    std::string name;
    Scope scope = Scope::SINGLETON;
    BindingDefinition definition;
    bool eager = false;
    uint64_t version = 1;

    const FactoryChain& chain() const { return definition.chain; }
    const FactoryChain& configure() const { return definition.configure; }
    const std::optional<DisposeHook>& dispose() const {
        return definition.dispose;
    }
};

using BindingPtr = std::shared_ptr<const Binding>;

}  // namespace butterfly::di
