#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "butterfly/di/binding.hpp"

namespace butterfly::di {

/**
 * @brief Name to Binding map
 *
 * Stores definitions only; nothing here constructs objects. Each entry holds
 * the active binding and, for deferred replacement, a staged definition that
 * promote() installs.
 */
class BindingRegistry {
public:
    BindingRegistry() = default;
    BindingRegistry(const BindingRegistry&) = delete;
    BindingRegistry& operator=(const BindingRegistry&) = delete;

    /**
     * @brief Register a new binding
     * @throws DuplicateBindingError if the name is taken; nothing changes
     */
    BindingPtr add(const std::string& name, Scope scope,
                   BindingDefinition definition, bool eager = false);

    /**
     * @throws UnknownBindingError
     */
    BindingPtr lookup(const std::string& name) const;

    // nullptr when absent
    BindingPtr find(const std::string& name) const;

    /**
     * @brief Install a new definition under the same name and scope
     *
     * Drops any staged definition.
     * @return The new active binding
     * @throws UnknownBindingError
     */
    BindingPtr replace(const std::string& name, BindingDefinition definition);

    /**
     * @brief Keep a definition aside until promote()
     * @throws UnknownBindingError
     */
    void stage(const std::string& name, BindingDefinition definition);

    /**
     * @brief Install the staged definition, if any
     * @return The new active binding, or nullptr when nothing was staged
     * @throws UnknownBindingError
     */
    BindingPtr promote(const std::string& name);

    bool has_pending(const std::string& name) const;

    /**
     * @throws UnknownBindingError
     */
    BindingPtr remove(const std::string& name);

    bool contains(const std::string& name) const;

    // Registration order
    std::vector<std::string> names() const;

    std::size_t size() const;
    void clear();

private:
    struct Entry {
        BindingPtr active;
        std::optional<BindingDefinition> pending;
    };

    Entry& entry_locked(const std::string& name);
    const Entry& entry_locked(const std::string& name) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::vector<std::string> order_;
};

}  // namespace butterfly::di
