#include "butterfly/di/resolution_graph.hpp"

#include <algorithm>

#include "butterfly/di/errors.hpp"
#include "butterfly/log/logger.hpp"

namespace butterfly::di {

void ResolutionContext::push_resolution(const std::string& name) {
    if (is_resolving(name)) {
        throw CircularDependencyError(cycle_to(name));
    }
    resolution_stack_.insert(name);
    resolution_order_.push_back(name);
}

void ResolutionContext::pop_resolution(const std::string& name) {
    resolution_stack_.erase(name);
    if (!resolution_order_.empty() && resolution_order_.back() == name) {
        resolution_order_.pop_back();
    }
}

std::vector<std::string> ResolutionContext::cycle_to(
    const std::string& name) const {
    auto it = std::find(resolution_order_.begin(), resolution_order_.end(),
                        name);
    std::vector<std::string> cycle(it, resolution_order_.end());
    cycle.push_back(name);
    return cycle;
}

std::optional<Value> ProxyCell::cached(uint64_t version) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (instance_ && version_ == version) {
        return instance_;
    }
    return std::nullopt;
}

bool ProxyCell::has_instance() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return instance_.has_value();
}

void ProxyCell::store(Value instance, uint64_t version) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    instance_ = std::move(instance);
    version_ = version;
}

std::optional<Value> ProxyCell::clear() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::optional<Value> old = std::move(instance_);
    instance_.reset();
    version_ = 0;
    return old;
}

ResolutionGraph::ResolutionGraph(BindingRegistry& registry,
                                 const ChainExecutor& executor,
                                 LifecycleManager& lifecycle)
    : registry_(registry), executor_(executor), lifecycle_(lifecycle) {}

std::shared_ptr<ProxyCell> ResolutionGraph::cell_for(const std::string& name) {
    std::lock_guard<std::mutex> lock(cells_mutex_);
    auto& cell = cells_[name];
    if (!cell) {
        cell = std::make_shared<ProxyCell>(name);
    }
    return cell;
}

std::shared_ptr<ProxyCell> ResolutionGraph::find_cell(
    const std::string& name) const {
    std::lock_guard<std::mutex> lock(cells_mutex_);
    auto it = cells_.find(name);
    return it == cells_.end() ? nullptr : it->second;
}

Value ResolutionGraph::resolve(const std::string& name,
                               ResolutionContext& ctx) {
    if (ctx.is_resolving(name)) {
        auto cycle = ctx.cycle_to(name);
        BUTTERFLY_LOG_ERROR << "Circular dependency while resolving '" << name
                            << "'";
        throw CircularDependencyError(std::move(cycle));
    }

    BindingPtr binding = registry_.lookup(name);
    if (binding->scope == Scope::PROTOTYPE) {
        if (trace_) {
            BUTTERFLY_LOG_TRACE << "Building prototype '" << name << "'";
        }
        ResolutionGuard guard(ctx, name);
        return build(binding, ctx);
    }
    return resolve_singleton(binding, ctx);
}

Value ResolutionGraph::resolve_singleton(const BindingPtr& binding,
                                         ResolutionContext& ctx) {
    const std::string& name = binding->name;
    auto cell = cell_for(name);
    if (auto hit = cell->cached(binding->version)) {
        if (trace_) {
            BUTTERFLY_LOG_TRACE << "Singleton '" << name << "' served from cache";
        }
        return *hit;
    }

    check_acyclic(name);
    ResolutionGuard guard(ctx, name);
    std::lock_guard<std::mutex> lock(cell->construction_mutex());

    // Another thread may have built it, or replaced the binding, meanwhile
    BindingPtr current = registry_.lookup(name);
    if (auto hit = cell->cached(current->version)) {
        return *hit;
    }

    if (trace_) {
        BUTTERFLY_LOG_TRACE << "Constructing singleton '" << name
                            << "' (version " << current->version
                            << "): " << current->chain().describe();
    }
    Value instance = build(current, ctx);

    cell->store(instance, current->version);
    if (auto hook = executor_.dispose_hook_for(*current, instance)) {
        lifecycle_.track(
            DisposableInstance{name, instance, *hook, current->version});
    }
    BUTTERFLY_LOG_DEBUG << "Cached singleton '" << name << "' (version "
                        << current->version << ")";
    return instance;
}

Value ResolutionGraph::build(const BindingPtr& binding,
                             ResolutionContext& ctx) {
    Resolver resolver = [this, &ctx](const std::string& dependency) {
        return resolve(dependency, ctx);
    };
    Value instance = executor_.run(binding->name, binding->chain(), resolver);
    check_configure_targets(*binding);
    lifecycle_.run_configure_chain(*binding, instance, resolver);
    return instance;
}

void ResolutionGraph::check_configure_targets(const Binding& binding) const {
    for (const auto& step : binding.configure().steps()) {
        const auto* configure_step = std::get_if<ConfigureRef>(&step);
        if (!configure_step) {
            continue;
        }
        // Unknown targets are reported when the step resolves them
        BindingPtr target = registry_.find(configure_step->binding_name);
        if (target && target->scope == Scope::PROTOTYPE) {
            BUTTERFLY_LOG_ERROR << "Configuration of '" << binding.name
                                << "' refers to prototype '" << target->name
                                << "'";
            throw ConfigurationError(
                binding.name, "ConfigureRef target '" + target->name +
                                  "' is a prototype, not a singleton");
        }
    }
}

void ResolutionGraph::check_acyclic(const std::string& name) const {
    ResolutionContext path;
    std::unordered_set<std::string> done;
    visit(name, path, done);
}

void ResolutionGraph::visit(const std::string& name, ResolutionContext& path,
                            std::unordered_set<std::string>& done) const {
    if (done.count(name)) {
        return;
    }
    if (path.is_resolving(name)) {
        auto cycle = path.cycle_to(name);
        BUTTERFLY_LOG_ERROR << "Circular dependency through '" << name << "'";
        throw CircularDependencyError(std::move(cycle));
    }

    BindingPtr binding = registry_.find(name);
    if (!binding) {
        // Reported as UnknownBindingError once resolution reaches it
        done.insert(name);
        return;
    }
    if (binding->scope == Scope::SINGLETON) {
        auto cell = find_cell(name);
        if (cell && cell->cached(binding->version)) {
            // Served from cache, so nothing behind it is constructed
            done.insert(name);
            return;
        }
    }

    ResolutionGuard guard(path, name);
    for (const auto& dependency : binding->chain().references()) {
        visit(dependency, path, done);
    }
    for (const auto& dependency : binding->configure().references()) {
        visit(dependency, path, done);
    }
    done.insert(name);
}

void ResolutionGraph::with_exclusive(const std::string& name,
                                     const std::function<void()>& fn) {
    BindingPtr binding = registry_.lookup(name);
    if (binding->scope == Scope::PROTOTYPE) {
        fn();
        return;
    }
    auto cell = cell_for(name);
    std::lock_guard<std::mutex> lock(cell->construction_mutex());
    fn();
}

std::optional<Value> ResolutionGraph::evict(const std::string& name) {
    auto cell = find_cell(name);
    if (!cell) {
        return std::nullopt;
    }
    return cell->clear();
}

void ResolutionGraph::drop(const std::string& name) {
    std::lock_guard<std::mutex> lock(cells_mutex_);
    cells_.erase(name);
}

void ResolutionGraph::clear() {
    std::lock_guard<std::mutex> lock(cells_mutex_);
    cells_.clear();
}

bool ResolutionGraph::is_cached(const std::string& name) const {
    auto cell = find_cell(name);
    return cell && cell->has_instance();
}

}  // namespace butterfly::di
