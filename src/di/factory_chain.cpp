#include "butterfly/di/factory_chain.hpp"

#include <sstream>

namespace butterfly::di {

namespace {

void collect_refs(const std::vector<Arg>& args,
                  std::vector<std::string>& names) {
    for (const auto& arg : args) {
        if (arg.is_ref()) {
            names.push_back(arg.binding_name());
        }
    }
}

}  // namespace

FactoryChain& FactoryChain::construct(std::string type_id,
                                      std::vector<Arg> args) {
    steps_.emplace_back(Construct{std::move(type_id), std::move(args), {}});
    return *this;
}

FactoryChain& FactoryChain::construct_with(std::string label,
                                           ObjectFactory factory,
                                           std::vector<Arg> args) {
    steps_.emplace_back(
        Construct{std::move(label), std::move(args), std::move(factory)});
    return *this;
}

FactoryChain& FactoryChain::invoke(std::string method, std::vector<Arg> args) {
    steps_.emplace_back(Invoke{std::move(method), std::move(args)});
    return *this;
}

FactoryChain& FactoryChain::configure_ref(std::string binding_name,
                                          ConfigureAction action) {
    steps_.emplace_back(ConfigureRef{std::move(binding_name), std::move(action)});
    return *this;
}

std::vector<std::string> FactoryChain::references() const {
    std::vector<std::string> names;
    for (const auto& step : steps_) {
        if (const auto* construct = std::get_if<Construct>(&step)) {
            collect_refs(construct->args, names);
        } else if (const auto* invoke = std::get_if<Invoke>(&step)) {
            collect_refs(invoke->args, names);
        } else if (const auto* configure = std::get_if<ConfigureRef>(&step)) {
            names.push_back(configure->binding_name);
        }
    }
    return names;
}

std::string describe_step(const Step& step) {
    std::ostringstream oss;
    if (const auto* construct = std::get_if<Construct>(&step)) {
        oss << "Construct(" << construct->type_id << "/"
            << construct->args.size() << ")";
    } else if (const auto* invoke = std::get_if<Invoke>(&step)) {
        oss << "Invoke(" << invoke->method << "/" << invoke->args.size()
            << ")";
    } else if (const auto* configure = std::get_if<ConfigureRef>(&step)) {
        oss << "ConfigureRef(" << configure->binding_name << ")";
    }
    return oss.str();
}

std::string FactoryChain::describe() const {
    std::ostringstream oss;
    for (std::size_t i = 0; i < steps_.size(); ++i) {
        if (i > 0) {
            oss << " -> ";
        }
        oss << describe_step(steps_[i]);
    }
    return oss.str();
}

}  // namespace butterfly::di
