#include "butterfly/di/chain_executor.hpp"

#include <stdexcept>

#include "butterfly/di/errors.hpp"
#include "butterfly/log/logger.hpp"

namespace butterfly::di {

namespace {

std::string step_context(std::size_t index, const Step& step) {
    return "step " + std::to_string(index + 1) + " " + describe_step(step);
}

}  // namespace

ChainExecutor::ChainExecutor(std::shared_ptr<const TypeRegistry> types)
    : types_(std::move(types)) {
    if (!types_) {
        throw std::invalid_argument("ChainExecutor requires a TypeRegistry");
    }
}

Arguments ChainExecutor::resolve_args(const std::vector<Arg>& args,
                                      const Resolver& resolve) const {
    Arguments values;
    values.reserve(args.size());
    for (const auto& arg : args) {
        if (arg.is_ref()) {
            values.push_back(resolve(arg.binding_name()));
        } else {
            values.push_back(arg.literal_value());
        }
    }
    return values;
}

Value ChainExecutor::construct(const Construct& step,
                               const Arguments& args) const {
    if (step.factory) {
        Value built = step.factory(args);
        if (built.empty()) {
            throw std::runtime_error("factory '" + step.type_id +
                                     "' returned no value");
        }
        return built;
    }

    const auto* descriptor = types_->find(step.type_id);
    if (!descriptor) {
        throw std::invalid_argument("unknown type '" + step.type_id + "'");
    }
    const auto* constructor = descriptor->find_constructor(args.size());
    if (!constructor) {
        throw std::invalid_argument("type '" + step.type_id +
                                    "' has no constructor taking " +
                                    std::to_string(args.size()) +
                                    " argument(s)");
    }
    return constructor->create(args);
}

const MethodHandle& ChainExecutor::find_method(const Value& target,
                                               const std::string& name,
                                               std::size_t arity) const {
    if (target.empty()) {
        throw std::invalid_argument("no current value to call '" + name +
                                    "' on");
    }
    const auto* handle = types_->find_method(target.type(), name, arity);
    if (!handle) {
        throw std::invalid_argument("type " + target.type_name() +
                                    " has no method '" + name + "' taking " +
                                    std::to_string(arity) + " argument(s)");
    }
    return *handle;
}

Value ChainExecutor::invoke(const Value& current, const Invoke& step,
                            const Arguments& args) const {
    const auto& handle = find_method(current, step.method, args.size());
    Value result = handle.call(current, args);
    if (handle.returns_void) {
        return current;
    }
    return result;
}

Value ChainExecutor::run(const std::string& binding_name,
                         const FactoryChain& chain,
                         const Resolver& resolve) const {
    Value current;
    const auto& steps = chain.steps();
    for (std::size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];
        try {
            if (const auto* construct_step = std::get_if<Construct>(&step)) {
                current = construct(*construct_step,
                                    resolve_args(construct_step->args, resolve));
            } else if (const auto* invoke_step = std::get_if<Invoke>(&step)) {
                Arguments args = resolve_args(invoke_step->args, resolve);
                current = invoke(current, *invoke_step, args);
            } else {
                throw std::invalid_argument(
                    "ConfigureRef is only allowed in a configure chain");
            }
        } catch (const ContainerError&) {
            throw;
        } catch (const std::exception& e) {
            BUTTERFLY_LOG_ERROR << "Construction of '" << binding_name
                                << "' failed at " << step_context(i, step)
                                << ": " << e.what();
            throw ConstructionError(binding_name,
                                    step_context(i, step) + ": " + e.what());
        } catch (...) {
            BUTTERFLY_LOG_ERROR << "Construction of '" << binding_name
                                << "' failed at " << step_context(i, step)
                                << ": non-standard exception";
            throw ConstructionError(binding_name, step_context(i, step) +
                                                      ": unknown exception");
        }
    }

    if (current.empty()) {
        throw ConstructionError(binding_name, "chain produced no value");
    }
    return current;
}

void ChainExecutor::run_configure(const std::string& binding_name,
                                  const Value& instance,
                                  const FactoryChain& configure,
                                  const Resolver& resolve) const {
    const auto& steps = configure.steps();
    for (std::size_t i = 0; i < steps.size(); ++i) {
        const auto& step = steps[i];
        try {
            if (const auto* invoke_step = std::get_if<Invoke>(&step)) {
                Arguments args = resolve_args(invoke_step->args, resolve);
                invoke(instance, *invoke_step, args);
            } else if (const auto* configure_step =
                           std::get_if<ConfigureRef>(&step)) {
                Value referenced = resolve(configure_step->binding_name);
                configure_step->action(instance, referenced);
            } else {
                throw std::invalid_argument(
                    "Construct is not allowed in a configure chain");
            }
        } catch (const CircularDependencyError&) {
            throw;
        } catch (const UnknownBindingError&) {
            throw;
        } catch (const ContainerShuttingDownError&) {
            throw;
        } catch (const ConfigurationError&) {
            throw;
        } catch (const std::exception& e) {
            BUTTERFLY_LOG_ERROR << "Configuration of '" << binding_name
                                << "' failed at " << step_context(i, step)
                                << ": " << e.what();
            throw ConfigurationError(binding_name,
                                     step_context(i, step) + ": " + e.what());
        } catch (...) {
            BUTTERFLY_LOG_ERROR << "Configuration of '" << binding_name
                                << "' failed at " << step_context(i, step)
                                << ": non-standard exception";
            throw ConfigurationError(binding_name, step_context(i, step) +
                                                       ": unknown exception");
        }
    }
}

void ChainExecutor::dispose(const Value& instance,
                            const DisposeHook& hook) const {
    if (hook.is_method()) {
        const auto& handle = find_method(instance, hook.method_name(), 0);
        handle.call(instance, {});
    } else if (hook.closure()) {
        hook.closure()(instance);
    }
}

std::optional<DisposeHook> ChainExecutor::dispose_hook_for(
    const Binding& binding, const Value& instance) const {
    if (binding.dispose()) {
        return binding.dispose();
    }
    if (instance.is_object()) {
        if (auto method = types_->find_disposer(instance.type())) {
            return DisposeHook::method(*method);
        }
    }
    return std::nullopt;
}

}  // namespace butterfly::di
