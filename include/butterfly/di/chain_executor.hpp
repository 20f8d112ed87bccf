#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "butterfly/di/binding.hpp"
#include "butterfly/di/factory_chain.hpp"
#include "butterfly/di/type_registry.hpp"

namespace butterfly::di {

// Turns a binding name met in an argument or ConfigureRef into its value
using Resolver = std::function<Value(const std::string& binding_name)>;

/**
 * @brief Runs factory chains against a TypeRegistry
 *
 * Steps run strictly left to right with no reordering. Apart from what the
 * steps themselves do, the result depends only on the chain and the
 * resolver. Failures abort the chain and no partial value escapes.
 */
class ChainExecutor {
public:
    explicit ChainExecutor(std::shared_ptr<const TypeRegistry> types);

    /**
     * @brief Run a main chain
     * @throws ConstructionError when a step fails; container errors raised
     *         while resolving arguments propagate unchanged
     */
    Value run(const std::string& binding_name, const FactoryChain& chain,
              const Resolver& resolve) const;

    /**
     * @brief Run a configure chain against a freshly built instance
     *
     * Invoke results are discarded; the instance never changes.
     * @throws ConfigurationError when a step fails
     */
    void run_configure(const std::string& binding_name, const Value& instance,
                       const FactoryChain& configure,
                       const Resolver& resolve) const;

    // Runs a dispose hook; exceptions from the hook propagate as is
    void dispose(const Value& instance, const DisposeHook& hook) const;

    // The hook a cached singleton is disposed with: the binding's own, else
    // the disposer its type designates
    std::optional<DisposeHook> dispose_hook_for(const Binding& binding,
                                                const Value& instance) const;

    const TypeRegistry& types() const { return *types_; }

private:
    Arguments resolve_args(const std::vector<Arg>& args,
                           const Resolver& resolve) const;
    Value construct(const Construct& step, const Arguments& args) const;
    Value invoke(const Value& current, const Invoke& step,
                 const Arguments& args) const;
    const MethodHandle& find_method(const Value& target,
                                    const std::string& name,
                                    std::size_t arity) const;

    std::shared_ptr<const TypeRegistry> types_;
};

}  // namespace butterfly::di
