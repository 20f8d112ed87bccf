#include "butterfly/di/binding_registry.hpp"

#include <algorithm>
#include <mutex>

#include "butterfly/di/errors.hpp"
#include "butterfly/log/logger.hpp"

namespace butterfly::di {

namespace {

BindingPtr make_binding(const std::string& name, Scope scope,
                        BindingDefinition definition, bool eager,
                        uint64_t version) {
    auto binding = std::make_shared<Binding>();
    binding->name = name;
    binding->scope = scope;
    binding->definition = std::move(definition);
    binding->eager = eager;
    binding->version = version;
    return binding;
}

}  // namespace

BindingRegistry::Entry& BindingRegistry::entry_locked(const std::string& name) {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw UnknownBindingError(name);
    }
    return it->second;
}

const BindingRegistry::Entry& BindingRegistry::entry_locked(
    const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw UnknownBindingError(name);
    }
    return it->second;
}

BindingPtr BindingRegistry::add(const std::string& name, Scope scope,
                                BindingDefinition definition, bool eager) {
    std::unique_lock lock(mutex_);
    if (entries_.count(name)) {
        throw DuplicateBindingError(name);
    }

    auto binding = make_binding(name, scope, std::move(definition), eager, 1);
    entries_.emplace(name, Entry{binding, std::nullopt});
    order_.push_back(name);
    return binding;
}

BindingPtr BindingRegistry::lookup(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return entry_locked(name).active;
}

BindingPtr BindingRegistry::find(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : it->second.active;
}

BindingPtr BindingRegistry::replace(const std::string& name,
                                    BindingDefinition definition) {
    std::unique_lock lock(mutex_);
    auto& entry = entry_locked(name);
    if (entry.pending) {
        BUTTERFLY_LOG_WARN << "Dropping staged replacement of '" << name
                           << "' in favour of an immediate one";
        entry.pending.reset();
    }

    const auto& current = *entry.active;
    entry.active = make_binding(name, current.scope, std::move(definition),
                                current.eager, current.version + 1);
    return entry.active;
}

void BindingRegistry::stage(const std::string& name,
                            BindingDefinition definition) {
    std::unique_lock lock(mutex_);
    auto& entry = entry_locked(name);
    if (entry.pending) {
        BUTTERFLY_LOG_DEBUG << "Overwriting staged replacement of '" << name
                            << "'";
    }
    entry.pending = std::move(definition);
}

BindingPtr BindingRegistry::promote(const std::string& name) {
    std::unique_lock lock(mutex_);
    auto& entry = entry_locked(name);
    if (!entry.pending) {
        return nullptr;
    }

    const auto& current = *entry.active;
    entry.active = make_binding(name, current.scope, std::move(*entry.pending),
                                current.eager, current.version + 1);
    entry.pending.reset();
    return entry.active;
}

bool BindingRegistry::has_pending(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return entry_locked(name).pending.has_value();
}

BindingPtr BindingRegistry::remove(const std::string& name) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw UnknownBindingError(name);
    }

    BindingPtr removed = it->second.active;
    entries_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), name),
                 order_.end());
    return removed;
}

bool BindingRegistry::contains(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return entries_.count(name) > 0;
}

std::vector<std::string> BindingRegistry::names() const {
    std::shared_lock lock(mutex_);
    return order_;
}

std::size_t BindingRegistry::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void BindingRegistry::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    order_.clear();
}

}  // namespace butterfly::di
