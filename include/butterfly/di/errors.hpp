#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace butterfly::di {

/**
 * @brief Base class of every failure raised by the container
 */
class ContainerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DuplicateBindingError : public ContainerError {
public:
    explicit DuplicateBindingError(const std::string& binding_name);

    const std::string& binding_name() const noexcept { return binding_name_; }

private:
    std::string binding_name_;
};

class UnknownBindingError : public ContainerError {
public:
    explicit UnknownBindingError(const std::string& binding_name);

    const std::string& binding_name() const noexcept { return binding_name_; }

private:
    std::string binding_name_;
};

/**
 * @brief A binding requires itself, directly or through other bindings
 *
 * cycle() lists the names from the first occurrence of the repeated binding
 * to the point where it was requested again, e.g. {"a", "b", "a"}.
 */
class CircularDependencyError : public ContainerError {
public:
    explicit CircularDependencyError(std::vector<std::string> cycle);

    const std::vector<std::string>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::string> cycle_;
};

// A Construct or Invoke step failed; nothing was cached
class ConstructionError : public ContainerError {
public:
    ConstructionError(const std::string& binding_name,
                      const std::string& reason);

    const std::string& binding_name() const noexcept { return binding_name_; }

private:
    std::string binding_name_;
};

// A configure-phase step failed; the instance was discarded
class ConfigurationError : public ContainerError {
public:
    ConfigurationError(const std::string& binding_name,
                       const std::string& reason);

    const std::string& binding_name() const noexcept { return binding_name_; }

private:
    std::string binding_name_;
};

struct DisposalFailure {
    std::string binding_name;
    std::string message;
};

/**
 * @brief One or more dispose hooks failed
 *
 * Every hook is attempted before this is raised; failures() holds one entry
 * per hook that threw, in the order the hooks ran.
 */
class DisposalError : public ContainerError {
public:
    explicit DisposalError(std::vector<DisposalFailure> failures);

    const std::vector<DisposalFailure>& failures() const noexcept {
        return failures_;
    }

private:
    std::vector<DisposalFailure> failures_;

    static std::string build_message(
        const std::vector<DisposalFailure>& failures);
};

class ContainerShuttingDownError : public ContainerError {
public:
    explicit ContainerShuttingDownError(const std::string& operation);
};

}  // namespace butterfly::di
