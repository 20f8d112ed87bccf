#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "butterfly/di/binding_registry.hpp"
#include "butterfly/di/chain_executor.hpp"
#include "butterfly/di/lifecycle_manager.hpp"

namespace butterfly::di {

/**
 * @brief Names being resolved on the current call stack
 */
class ResolutionContext {
public:
    // Throws CircularDependencyError if name is already being resolved
    void push_resolution(const std::string& name);
    void pop_resolution(const std::string& name);

    bool is_resolving(const std::string& name) const {
        return resolution_stack_.count(name) > 0;
    }

    // The cycle that requesting name again would close
    std::vector<std::string> cycle_to(const std::string& name) const;

    const std::vector<std::string>& resolution_chain() const {
        return resolution_order_;
    }

private:
    std::unordered_set<std::string> resolution_stack_;
    std::vector<std::string> resolution_order_;
};

/**
 * @brief RAII guard for resolution tracking
 */
class ResolutionGuard {
public:
    ResolutionGuard(ResolutionContext& ctx, const std::string& name)
        : context_(ctx), name_(name) {
        context_.push_resolution(name_);
    }

    ~ResolutionGuard() { context_.pop_resolution(name_); }

    ResolutionGuard(const ResolutionGuard&) = delete;
    ResolutionGuard& operator=(const ResolutionGuard&) = delete;

private:
    ResolutionContext& context_;
    std::string name_;
};

/**
 * @brief Indirection cell of one singleton binding
 *
 * Dependents receive the constructed instance, not the cell; the cell is
 * the container's own resolution point. The construction mutex serializes
 * miss -> construct -> configure -> cache, and replacement of the binding.
 * Cache reads only take the short state lock.
 */
class ProxyCell {
public:
    explicit ProxyCell(std::string binding_name)
        : binding_name_(std::move(binding_name)) {}

    const std::string& binding_name() const { return binding_name_; }

    // The cached instance if it was built from this binding version
    std::optional<Value> cached(uint64_t version) const;

    bool has_instance() const;
    void store(Value instance, uint64_t version);
    std::optional<Value> clear();

    std::mutex& construction_mutex() { return construction_mutex_; }

private:
    std::string binding_name_;
    std::mutex construction_mutex_;

    mutable std::mutex state_mutex_;
    std::optional<Value> instance_;
    uint64_t version_ = 0;
};

/**
 * @brief Turns binding names into values
 *
 * Prototypes are built on every call. Singletons are built at most once per
 * binding version and cached in their ProxyCell, which is created lazily on
 * first use. Cycles are rejected with CircularDependencyError before any
 * construction lock is taken.
 */
class ResolutionGraph {
public:
    ResolutionGraph(BindingRegistry& registry, const ChainExecutor& executor,
                    LifecycleManager& lifecycle);
    ResolutionGraph(const ResolutionGraph&) = delete;
    ResolutionGraph& operator=(const ResolutionGraph&) = delete;

    Value resolve(const std::string& name, ResolutionContext& ctx);

    /**
     * @brief Walk the bindings reachable from name through argument and
     *        configure references
     * @throws CircularDependencyError on the first cycle found
     */
    void check_acyclic(const std::string& name) const;

    /**
     * @brief Run fn while no construction of name can start or finish
     *
     * Used by replace, refresh and unregister so a resolution either
     * completes before the change or starts after it.
     */
    void with_exclusive(const std::string& name,
                        const std::function<void()>& fn);

    // Drops the cached instance, if any; the caller disposes it
    std::optional<Value> evict(const std::string& name);

    // Forgets the cell of an unregistered binding
    void drop(const std::string& name);

    bool is_cached(const std::string& name) const;

    // Forgets every cell; used once the container has shut down
    void clear();

    void set_trace(bool enabled) { trace_.store(enabled); }

private:
    std::shared_ptr<ProxyCell> cell_for(const std::string& name);
    std::shared_ptr<ProxyCell> find_cell(const std::string& name) const;

    Value resolve_singleton(const BindingPtr& binding, ResolutionContext& ctx);
    Value build(const BindingPtr& binding, ResolutionContext& ctx);
    // ConfigureRef may only name singleton bindings
    void check_configure_targets(const Binding& binding) const;

    void visit(const std::string& name, ResolutionContext& path,
               std::unordered_set<std::string>& done) const;

    BindingRegistry& registry_;
    const ChainExecutor& executor_;
    LifecycleManager& lifecycle_;
    std::atomic<bool> trace_{false};

    mutable std::mutex cells_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ProxyCell>> cells_;
};

}  // namespace butterfly::di
