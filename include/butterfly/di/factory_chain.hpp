#pragma once

#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "butterfly/di/value.hpp"

namespace butterfly::di {

/**
 * @brief Argument of a Construct or Invoke step
 *
 * Either a literal passed through as is, or a reference to another binding
 * resolved when the step runs.
 */
class Arg {
public:
    static Arg ref(std::string binding_name) {
        Arg arg;
        arg.binding_name_ = std::move(binding_name);
        return arg;
    }

    template <typename T>
    static Arg literal(T value) {
        Arg arg;
        arg.literal_ = Value::from(std::move(value));
        return arg;
    }

    bool is_ref() const { return binding_name_.has_value(); }
    const std::string& binding_name() const { return *binding_name_; }
    const Value& literal_value() const { return literal_; }

private:
    Arg() = default;

    std::optional<std::string> binding_name_;
    Value literal_;
};

inline Arg ref(std::string binding_name) {
    return Arg::ref(std::move(binding_name));
}

template <typename T>
Arg lit(T value) {
    return Arg::literal(std::move(value));
}

// Builds an object from already resolved arguments
using ObjectFactory = std::function<Value(const Arguments& args)>;

// Receives the instance being configured and the referenced binding's value
using ConfigureAction =
    std::function<void(const Value& instance, const Value& referenced)>;

/**
 * @brief Build a new instance; the chain's current value becomes it
 *
 * Uses the constructor of the described type matching the argument count,
 * or the factory when one is given (type_id then only labels the step).
 */
struct Construct {
    std::string type_id;
    std::vector<Arg> args;
    ObjectFactory factory;
};

/**
 * @brief Call a method on the chain's current value
 *
 * A void method leaves the current value on the receiver; any other method
 * makes its return value the current value.
 */
struct Invoke {
    std::string method;
    std::vector<Arg> args;
};

// Configure phase only: hand the instance and another binding to an action
struct ConfigureRef {
    std::string binding_name;
    ConfigureAction action;
};

using Step = std::variant<Construct, Invoke, ConfigureRef>;

/**
 * @brief Ordered steps producing one binding's value
 *
 * Built fluently before registration and copied into the binding, which
 * never changes it afterwards.
 */
class FactoryChain {
public:
    FactoryChain() = default;
    explicit FactoryChain(std::vector<Step> steps) : steps_(std::move(steps)) {}

    FactoryChain& construct(std::string type_id, std::vector<Arg> args = {});
    FactoryChain& construct_with(std::string label, ObjectFactory factory,
                                 std::vector<Arg> args = {});
    FactoryChain& invoke(std::string method, std::vector<Arg> args = {});
    FactoryChain& configure_ref(std::string binding_name,
                                ConfigureAction action);

    const std::vector<Step>& steps() const { return steps_; }
    bool empty() const { return steps_.empty(); }
    std::size_t size() const { return steps_.size(); }

    // Names of every binding the steps refer to, in step order
    std::vector<std::string> references() const;

    std::string describe() const;

private:
    std::vector<Step> steps_;
};

std::string describe_step(const Step& step);

}  // namespace butterfly::di
