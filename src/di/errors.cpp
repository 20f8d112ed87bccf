#include "butterfly/di/errors.hpp"

#include <sstream>

namespace butterfly::di {

namespace {

std::string join_cycle(const std::vector<std::string>& cycle) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) {
            oss << " -> ";
        }
        oss << "'" << cycle[i] << "'";
    }
    return oss.str();
}

}  // namespace

DuplicateBindingError::DuplicateBindingError(const std::string& binding_name)
    : ContainerError("Binding already registered: '" + binding_name + "'"),
      binding_name_(binding_name) {}

UnknownBindingError::UnknownBindingError(const std::string& binding_name)
    : ContainerError("Binding not registered: '" + binding_name + "'"),
      binding_name_(binding_name) {}

CircularDependencyError::CircularDependencyError(
    std::vector<std::string> cycle)
    : ContainerError("Circular dependency detected: " + join_cycle(cycle)),
      cycle_(std::move(cycle)) {}

ConstructionError::ConstructionError(const std::string& binding_name,
                                     const std::string& reason)
    : ContainerError("Failed to construct '" + binding_name + "': " + reason),
      binding_name_(binding_name) {}

ConfigurationError::ConfigurationError(const std::string& binding_name,
                                       const std::string& reason)
    : ContainerError("Failed to configure '" + binding_name + "': " + reason),
      binding_name_(binding_name) {}

DisposalError::DisposalError(std::vector<DisposalFailure> failures)
    : ContainerError(build_message(failures)), failures_(std::move(failures)) {}

std::string DisposalError::build_message(
    const std::vector<DisposalFailure>& failures) {
    std::ostringstream oss;
    oss << failures.size() << " dispose hook(s) failed";
    for (const auto& failure : failures) {
        oss << "; '" << failure.binding_name << "': " << failure.message;
    }
    return oss.str();
}

ContainerShuttingDownError::ContainerShuttingDownError(
    const std::string& operation)
    : ContainerError("Container is shutting down, rejected " + operation) {}

}  // namespace butterfly::di
