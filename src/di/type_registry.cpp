#include "butterfly/di/type_registry.hpp"

#include <mutex>

namespace butterfly::di {

void TypeRegistry::insert(const std::string& type_id, std::type_index type) {
    if (type_id.empty()) {
        throw std::invalid_argument("Type id cannot be empty");
    }

    std::unique_lock lock(mutex_);
    if (by_id_.count(type_id)) {
        throw std::invalid_argument("Type already described: '" + type_id +
                                    "'");
    }
    if (by_type_.count(type)) {
        throw std::invalid_argument(
            "Type " + boost::core::demangle(type.name()) +
            " already described as '" + by_type_.at(type)->type_id() + "'");
    }

    auto descriptor = std::make_shared<TypeDescriptor>(type_id, type);
    by_id_.emplace(type_id, descriptor);
    by_type_.emplace(type, std::move(descriptor));
}

TypeDescriptor& TypeRegistry::descriptor_locked(const std::string& type_id) {
    auto it = by_id_.find(type_id);
    if (it == by_id_.end()) {
        throw std::invalid_argument("Type not described: '" + type_id + "'");
    }
    return *it->second;
}

void TypeRegistry::add_constructor(const std::string& type_id,
                                   ConstructorHandle handle) {
    std::unique_lock lock(mutex_);
    auto& descriptor = descriptor_locked(type_id);
    if (descriptor.constructors_.count(handle.arity)) {
        throw std::invalid_argument("Type '" + type_id +
                                    "' already has a constructor taking " +
                                    std::to_string(handle.arity) +
                                    " argument(s)");
    }
    descriptor.constructors_.emplace(handle.arity, std::move(handle));
}

void TypeRegistry::add_method(const std::string& type_id,
                              MethodHandle handle) {
    std::unique_lock lock(mutex_);
    auto& descriptor = descriptor_locked(type_id);
    if (descriptor.find_method(handle.name, handle.arity)) {
        throw std::invalid_argument("Type '" + type_id +
                                    "' already has a method '" + handle.name +
                                    "' taking " +
                                    std::to_string(handle.arity) +
                                    " argument(s)");
    }
    std::string name = handle.name;
    descriptor.methods_.emplace(std::move(name), std::move(handle));
}

void TypeRegistry::add_base(const std::string& type_id, std::type_index base,
                            UpcastFn upcast) {
    std::unique_lock lock(mutex_);
    descriptor_locked(type_id).bases_.emplace_back(base, std::move(upcast));
}

void TypeRegistry::set_disposer(const std::string& type_id,
                                const std::string& method_name) {
    std::unique_lock lock(mutex_);
    descriptor_locked(type_id).disposer_ = method_name;
}

const TypeDescriptor* TypeRegistry::find(const std::string& type_id) const {
    std::shared_lock lock(mutex_);
    auto it = by_id_.find(type_id);
    return it == by_id_.end() ? nullptr : it->second.get();
}

const TypeDescriptor* TypeRegistry::find(std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = by_type_.find(type);
    return it == by_type_.end() ? nullptr : it->second.get();
}

const MethodHandle* TypeRegistry::find_method(std::type_index type,
                                              const std::string& name,
                                              std::size_t arity) const {
    std::shared_lock lock(mutex_);
    return find_method_locked(type, name, arity);
}

const MethodHandle* TypeRegistry::find_method_locked(std::type_index type,
                                                     const std::string& name,
                                                     std::size_t arity) const {
    auto it = by_type_.find(type);
    if (it == by_type_.end()) {
        return nullptr;
    }
    if (const auto* handle = it->second->find_method(name, arity)) {
        return handle;
    }
    for (const auto& [base, upcast] : it->second->bases_) {
        if (const auto* handle = find_method_locked(base, name, arity)) {
            return handle;
        }
    }
    return nullptr;
}

std::optional<std::string> TypeRegistry::find_disposer(
    std::type_index type) const {
    std::shared_lock lock(mutex_);
    auto it = by_type_.find(type);
    if (it == by_type_.end()) {
        return std::nullopt;
    }
    if (it->second->disposer_) {
        return it->second->disposer_;
    }
    for (const auto& [base, upcast] : it->second->bases_) {
        auto base_it = by_type_.find(base);
        if (base_it != by_type_.end() && base_it->second->disposer_) {
            return base_it->second->disposer_;
        }
    }
    return std::nullopt;
}

bool TypeRegistry::contains(const std::string& type_id) const {
    std::shared_lock lock(mutex_);
    return by_id_.count(type_id) > 0;
}

std::size_t TypeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return by_id_.size();
}

Value TypeRegistry::upcast(const Value& value, std::type_index target) const {
    std::shared_lock lock(mutex_);
    return upcast_locked(value, target);
}

Value TypeRegistry::upcast_locked(const Value& value,
                                  std::type_index target) const {
    if (value.type() == target) {
        return value;
    }
    auto it = by_type_.find(value.type());
    if (it == by_type_.end()) {
        return Value();
    }
    for (const auto& [base, upcast] : it->second->bases_) {
        Value cast = upcast(value);
        if (base == target) {
            return cast;
        }
        Value further = upcast_locked(cast, target);
        if (!further.empty()) {
            return further;
        }
    }
    return Value();
}

}  // namespace butterfly::di
