#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "butterfly/di/binding_registry.hpp"
#include "butterfly/di/chain_executor.hpp"
#include "butterfly/di/container_config.hpp"
#include "butterfly/di/errors.hpp"
#include "butterfly/di/lifecycle_manager.hpp"
#include "butterfly/di/resolution_graph.hpp"
#include "butterfly/di/type_registry.hpp"

namespace butterfly::di {

/**
 * @brief Chained-factory dependency injection container
 *
 * Resolves named bindings to instances built by factory chains. Singletons
 * are built at most once and disposed at shutdown in reverse construction
 * order; prototypes are built on every resolution and belong to the caller.
 * Any binding can be replaced at runtime: holders of an old instance keep
 * it, and the container's own resolution point moves to the new chain
 * either immediately or at refresh().
 *
 * All operations are safe to call from several threads.
 */
class Container {
public:
    explicit Container(std::shared_ptr<TypeRegistry> types,
                       ContainerConfig config = {});

    // Shuts down if shutdown() was never called; dispose failures are logged
    ~Container();

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    /**
     * @brief Register a binding
     * @param eager Built by preinstantiate() (singletons only)
     * @throws DuplicateBindingError if the name is taken
     * @throws std::invalid_argument for an empty name or a malformed chain
     */
    void register_binding(const std::string& name, Scope scope,
                          BindingDefinition definition, bool eager = false);

    void register_singleton(const std::string& name, FactoryChain chain,
                            std::optional<DisposeHook> dispose = std::nullopt);

    void register_prototype(const std::string& name, FactoryChain chain);

    /**
     * @brief Resolve a binding to its value
     * @throws UnknownBindingError, CircularDependencyError,
     *         ConstructionError, ConfigurationError,
     *         ContainerShuttingDownError
     */
    Value resolve(const std::string& name);

    // Resolve and convert, e.g. resolve_as<std::shared_ptr<Service>>("svc")
    template <typename T>
    T resolve_as(const std::string& name) {
        Value value = resolve(name);
        try {
            return types_->convert<T>(value);
        } catch (const std::invalid_argument& e) {
            throw ConstructionError(name, e.what());
        }
    }

    template <typename T>
    std::shared_ptr<T> resolve_object(const std::string& name) {
        return resolve_as<std::shared_ptr<T>>(name);
    }

    /**
     * @brief Replace the chain and dispose hook, keeping the configure chain
     * @param policy Defaults to the configured default_replace_policy
     * @throws UnknownBindingError
     * @throws DisposalError if disposing the old instance failed; the new
     *         chain is installed regardless
     */
    void replace(const std::string& name, FactoryChain chain,
                 std::optional<DisposeHook> dispose = std::nullopt,
                 std::optional<ReplacePolicy> policy = std::nullopt);

    void replace(const std::string& name, BindingDefinition definition,
                 std::optional<ReplacePolicy> policy = std::nullopt);

    /**
     * @brief Cut over a deferred replacement
     *
     * Installs the staged definition (if any), disposes the cached
     * singleton and clears the cache so the next resolve rebuilds.
     * @throws UnknownBindingError, DisposalError
     */
    void refresh(const std::string& name);

    /**
     * @brief Remove a binding, disposing its live singleton first
     * @throws UnknownBindingError, DisposalError
     */
    void unregister(const std::string& name);

    /**
     * @brief Build eager singletons in registration order
     *
     * With eager_singletons configured, builds every singleton.
     * @return Number of singletons resolved
     */
    std::size_t preinstantiate();

    /**
     * @brief Stop resolving and dispose every cached singleton
     *
     * Waits for in-flight operations first. Later calls do nothing.
     * @throws DisposalError listing every failed hook
     */
    void shutdown();

    // Applies a reloaded "container" section
    void apply_config(const ContainerConfig& config);

    bool contains(const std::string& name) const;
    std::size_t binding_count() const;
    bool is_cached(const std::string& name) const;
    bool has_pending(const std::string& name) const;
    bool is_shutting_down() const;
    Scope scope_of(const std::string& name) const;
    ReplacePolicy default_replace_policy() const;

    TypeRegistry& types() { return *types_; }

private:
    void validate_definition(const std::string& name, Scope scope,
                             const BindingDefinition& definition) const;
    void dispose_evicted(const std::string& name,
                         std::optional<DisposalFailure>& failure);

    std::shared_ptr<TypeRegistry> types_;
    std::atomic<ReplacePolicy> default_policy_;
    std::atomic<bool> eager_singletons_;

    BindingRegistry registry_;
    ChainExecutor executor_;
    LifecycleManager lifecycle_;
    ResolutionGraph graph_;
};

}  // namespace butterfly::di
