#include "butterfly/di/container.hpp"

#include <stdexcept>
#include <variant>

#include "butterfly/log/logger.hpp"

namespace butterfly::di {

namespace {

void validate_args(const std::string& name, const std::vector<Arg>& args) {
    for (const auto& arg : args) {
        if (arg.is_ref() && arg.binding_name().empty()) {
            throw std::invalid_argument("Binding '" + name +
                                        "' refers to an empty binding name");
        }
    }
}

}  // namespace

Container::Container(std::shared_ptr<TypeRegistry> types,
                     ContainerConfig config)
    : types_(std::move(types)),
      default_policy_(config.default_replace_policy),
      eager_singletons_(config.eager_singletons),
      executor_(types_),
      lifecycle_(executor_),
      graph_(registry_, executor_, lifecycle_) {
    config.validate();
    graph_.set_trace(config.trace_resolution);
    BUTTERFLY_LOG_DEBUG << "Container created, default replace policy "
                        << config.default_replace_policy;
}

Container::~Container() {
    try {
        shutdown();
    } catch (const DisposalError& e) {
        BUTTERFLY_LOG_ERROR << "Disposal failed while destroying container: "
                            << e.what();
    }
}

void Container::validate_definition(const std::string& name, Scope scope,
                                    const BindingDefinition& definition) const {
    if (name.empty()) {
        throw std::invalid_argument("Binding name cannot be empty");
    }

    const auto& steps = definition.chain.steps();
    if (steps.empty()) {
        throw std::invalid_argument("Binding '" + name +
                                    "' has an empty factory chain");
    }
    if (!std::holds_alternative<Construct>(steps.front())) {
        throw std::invalid_argument("Factory chain of '" + name +
                                    "' must start with a Construct step");
    }
    for (const auto& step : steps) {
        if (const auto* construct = std::get_if<Construct>(&step)) {
            if (construct->type_id.empty() && !construct->factory) {
                throw std::invalid_argument(
                    "Construct step of '" + name +
                    "' needs a type id or a factory");
            }
            validate_args(name, construct->args);
        } else if (const auto* invoke = std::get_if<Invoke>(&step)) {
            if (invoke->method.empty()) {
                throw std::invalid_argument("Invoke step of '" + name +
                                            "' has no method name");
            }
            validate_args(name, invoke->args);
        } else {
            throw std::invalid_argument(
                "ConfigureRef steps of '" + name +
                "' belong in the configure chain");
        }
    }

    for (const auto& step : definition.configure.steps()) {
        if (std::holds_alternative<Construct>(step)) {
            throw std::invalid_argument("Configure chain of '" + name +
                                        "' cannot contain Construct steps");
        }
        if (const auto* invoke = std::get_if<Invoke>(&step)) {
            if (invoke->method.empty()) {
                throw std::invalid_argument("Invoke step of '" + name +
                                            "' has no method name");
            }
            validate_args(name, invoke->args);
        }
        if (const auto* configure = std::get_if<ConfigureRef>(&step)) {
            if (configure->binding_name.empty() || !configure->action) {
                throw std::invalid_argument(
                    "ConfigureRef step of '" + name +
                    "' needs a binding name and an action");
            }
        }
    }

    if (definition.dispose) {
        if (scope != Scope::SINGLETON) {
            throw std::invalid_argument(
                "Dispose hook on '" + name +
                "': only singletons are disposed by the container");
        }
        if (!definition.dispose->is_method() &&
            !definition.dispose->closure()) {
            throw std::invalid_argument("Dispose hook of '" + name +
                                        "' is empty");
        }
    }
}

void Container::register_binding(const std::string& name, Scope scope,
                                 BindingDefinition definition, bool eager) {
    lifecycle_.ensure_running("register('" + name + "')");
    validate_definition(name, scope, definition);
    if (eager && scope != Scope::SINGLETON) {
        throw std::invalid_argument("Only singletons can be eager: '" + name +
                                    "'");
    }

    std::string chain_desc = definition.chain.describe();
    try {
        registry_.add(name, scope, std::move(definition), eager);
    } catch (const DuplicateBindingError& e) {
        BUTTERFLY_LOG_ERROR << e.what();
        throw;
    }
    BUTTERFLY_LOG_DEBUG << "Registered " << scope << " '" << name
                        << "': " << chain_desc;
}

void Container::register_singleton(const std::string& name,
                                   FactoryChain chain,
                                   std::optional<DisposeHook> dispose) {
    register_binding(name, Scope::SINGLETON,
                     BindingDefinition{std::move(chain), {}, std::move(dispose)});
}

void Container::register_prototype(const std::string& name,
                                   FactoryChain chain) {
    register_binding(name, Scope::PROTOTYPE,
                     BindingDefinition{std::move(chain), {}, std::nullopt});
}

Value Container::resolve(const std::string& name) {
    if (name.empty()) {
        throw std::invalid_argument("Binding name cannot be empty");
    }

    ResolutionTicket ticket(lifecycle_, "resolve('" + name + "')");
    ResolutionContext ctx;
    try {
        return graph_.resolve(name, ctx);
    } catch (const UnknownBindingError& e) {
        BUTTERFLY_LOG_ERROR << "Cannot resolve '" << name << "': " << e.what();
        throw;
    }
}

void Container::dispose_evicted(const std::string& name,
                                std::optional<DisposalFailure>& failure) {
    graph_.evict(name);
    if (auto record = lifecycle_.untrack(name)) {
        try {
            lifecycle_.dispose_now(*record);
        } catch (const DisposalError& e) {
            // Raised once the binding change is in place
            failure = e.failures().front();
        }
    }
}

void Container::replace(const std::string& name, FactoryChain chain,
                        std::optional<DisposeHook> dispose,
                        std::optional<ReplacePolicy> policy) {
    lifecycle_.ensure_running("replace('" + name + "')");
    BindingPtr current = registry_.lookup(name);
    BindingDefinition definition{
        std::move(chain), current->configure(),
        dispose ? std::move(dispose) : current->dispose()};
    replace(name, std::move(definition), policy);
}

void Container::replace(const std::string& name, BindingDefinition definition,
                        std::optional<ReplacePolicy> policy) {
    ResolutionTicket ticket(lifecycle_, "replace('" + name + "')");
    BindingPtr current = registry_.lookup(name);
    validate_definition(name, current->scope, definition);

    const ReplacePolicy effective = policy.value_or(default_policy_.load());
    if (effective == ReplacePolicy::DEFERRED) {
        registry_.stage(name, std::move(definition));
        BUTTERFLY_LOG_INFO << "Staged replacement of '" << name
                           << "', old instance serves until refresh";
        return;
    }

    std::optional<DisposalFailure> failure;
    graph_.with_exclusive(name, [&] {
        dispose_evicted(name, failure);
        BindingPtr installed = registry_.replace(name, std::move(definition));
        BUTTERFLY_LOG_INFO << "Replaced '" << name << "' (version "
                           << installed->version
                           << "): " << installed->chain().describe();
    });

    if (failure) {
        throw DisposalError({*failure});
    }
}

void Container::refresh(const std::string& name) {
    ResolutionTicket ticket(lifecycle_, "refresh('" + name + "')");

    std::optional<DisposalFailure> failure;
    graph_.with_exclusive(name, [&] {
        dispose_evicted(name, failure);
        if (BindingPtr promoted = registry_.promote(name)) {
            BUTTERFLY_LOG_INFO << "Cut over '" << name << "' to version "
                               << promoted->version;
        } else {
            BUTTERFLY_LOG_DEBUG << "Refreshed '" << name
                                << "', next resolution rebuilds it";
        }
    });

    if (failure) {
        throw DisposalError({*failure});
    }
}

void Container::unregister(const std::string& name) {
    ResolutionTicket ticket(lifecycle_, "unregister('" + name + "')");

    std::optional<DisposalFailure> failure;
    graph_.with_exclusive(name, [&] {
        dispose_evicted(name, failure);
        registry_.remove(name);
    });
    graph_.drop(name);
    BUTTERFLY_LOG_INFO << "Unregistered '" << name << "'";

    if (failure) {
        throw DisposalError({*failure});
    }
}

std::size_t Container::preinstantiate() {
    const bool all_singletons = eager_singletons_.load();
    std::size_t count = 0;
    for (const auto& name : registry_.names()) {
        BindingPtr binding = registry_.find(name);
        if (!binding || binding->scope != Scope::SINGLETON) {
            continue;
        }
        if (binding->eager || all_singletons) {
            resolve(name);
            ++count;
        }
    }
    BUTTERFLY_LOG_INFO << "Preinstantiated " << count << " singleton(s)";
    return count;
}

void Container::shutdown() {
    bool first_call = false;
    try {
        first_call = lifecycle_.shutdown();
    } catch (const DisposalError& e) {
        BUTTERFLY_LOG_ERROR << "Container shut down with errors: " << e.what();
        graph_.clear();
        registry_.clear();
        throw;
    }

    if (first_call) {
        graph_.clear();
        registry_.clear();
        BUTTERFLY_LOG_INFO << "Container shut down";
    }
}

void Container::apply_config(const ContainerConfig& config) {
    config.validate();
    default_policy_.store(config.default_replace_policy);
    eager_singletons_.store(config.eager_singletons);
    graph_.set_trace(config.trace_resolution);
    BUTTERFLY_LOG_INFO << "Container config applied, default replace policy "
                       << config.default_replace_policy;
}

bool Container::contains(const std::string& name) const {
    return registry_.contains(name);
}

std::size_t Container::binding_count() const { return registry_.size(); }

bool Container::is_cached(const std::string& name) const {
    return graph_.is_cached(name);
}

bool Container::has_pending(const std::string& name) const {
    return registry_.has_pending(name);
}

bool Container::is_shutting_down() const {
    return lifecycle_.is_shutting_down();
}

Scope Container::scope_of(const std::string& name) const {
    return registry_.lookup(name)->scope;
}

ReplacePolicy Container::default_replace_policy() const {
    return default_policy_.load();
}

}  // namespace butterfly::di
