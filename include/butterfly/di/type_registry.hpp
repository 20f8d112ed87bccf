#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "butterfly/di/value.hpp"

namespace butterfly::di {

struct ConstructorHandle {
    std::size_t arity = 0;
    std::function<Value(const Arguments& args)> create;
};

struct MethodHandle {
    std::string name;
    std::size_t arity = 0;
    bool returns_void = false;
    std::function<Value(const Value& self, const Arguments& args)> call;
};

// Converts an object value to a shared_ptr of one of its bases
using UpcastFn = std::function<Value(const Value& object)>;

/**
 * @brief Capabilities a user type exposes to factory chains
 */
class TypeDescriptor {
public:
    TypeDescriptor(std::string type_id, std::type_index type)
        : type_id_(std::move(type_id)), type_(type) {}

    const std::string& type_id() const { return type_id_; }
    std::type_index type() const { return type_; }

    const ConstructorHandle* find_constructor(std::size_t arity) const {
        auto it = constructors_.find(arity);
        return it == constructors_.end() ? nullptr : &it->second;
    }

    const MethodHandle* find_method(const std::string& name,
                                    std::size_t arity) const {
        auto range = methods_.equal_range(name);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second.arity == arity) {
                return &it->second;
            }
        }
        return nullptr;
    }

    bool has_method(const std::string& name) const {
        return methods_.count(name) > 0;
    }

    const std::optional<std::string>& disposer() const { return disposer_; }

private:
    friend class TypeRegistry;

    std::string type_id_;
    std::type_index type_;
    std::map<std::size_t, ConstructorHandle> constructors_;
    std::unordered_multimap<std::string, MethodHandle> methods_;
    std::vector<std::pair<std::type_index, UpcastFn>> bases_;
    std::optional<std::string> disposer_;
};

template <typename T>
class TypeBuilder;

/**
 * @brief Registry of the types factory chains may construct and call
 *
 * Types opt in by describing their constructors and methods through
 * add_type<T>(); chains then refer to them by type id and method name.
 * Objects always travel as std::shared_ptr<T>. Describe every type before
 * resolving bindings that use it: handles are stable once added, but the
 * registry is meant to be filled during wiring.
 */
class TypeRegistry {
public:
    TypeRegistry() = default;
    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    template <typename T>
    TypeBuilder<T> add_type(const std::string& type_id);

    const TypeDescriptor* find(const std::string& type_id) const;
    const TypeDescriptor* find(std::type_index type) const;

    // Looks the method up on the type, then on its declared bases
    const MethodHandle* find_method(std::type_index type,
                                    const std::string& name,
                                    std::size_t arity) const;

    std::optional<std::string> find_disposer(std::type_index type) const;

    bool contains(const std::string& type_id) const;
    std::size_t size() const;

    /**
     * @brief Convert a chain value to a parameter type
     *
     * Exact matches pass through; objects convert to declared bases;
     * numbers convert between arithmetic types. Anything else throws
     * std::invalid_argument.
     */
    template <typename T>
    T convert(const Value& value) const;

private:
    template <typename T>
    friend class TypeBuilder;

    void insert(const std::string& type_id, std::type_index type);
    void add_constructor(const std::string& type_id, ConstructorHandle handle);
    void add_method(const std::string& type_id, MethodHandle handle);
    void add_base(const std::string& type_id, std::type_index base,
                  UpcastFn upcast);
    void set_disposer(const std::string& type_id,
                      const std::string& method_name);

    TypeDescriptor& descriptor_locked(const std::string& type_id);
    const MethodHandle* find_method_locked(std::type_index type,
                                           const std::string& name,
                                           std::size_t arity) const;
    Value upcast(const Value& value, std::type_index target) const;
    Value upcast_locked(const Value& value, std::type_index target) const;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<TypeDescriptor>> by_id_;
    std::unordered_map<std::type_index, std::shared_ptr<TypeDescriptor>>
        by_type_;
};

/**
 * @brief Fluent description of one user type
 *
 * @code
 * types.add_type<Counter>("Counter")
 *     .constructor<>()
 *     .constructor<int>()
 *     .method("increment", &Counter::increment)
 *     .method("value", &Counter::value)
 *     .disposer("flush");
 * @endcode
 */
template <typename T>
class TypeBuilder {
public:
    TypeBuilder(TypeRegistry& registry, std::string type_id)
        : registry_(registry), type_id_(std::move(type_id)) {}

    template <typename... A>
    TypeBuilder& constructor() {
        static_assert(std::is_constructible_v<T, std::decay_t<A>...>,
                      "T is not constructible from the given arguments");
        const TypeRegistry* registry = &registry_;
        ConstructorHandle handle;
        handle.arity = sizeof...(A);
        handle.create = [registry](const Arguments& args) -> Value {
            return [&]<std::size_t... I>(std::index_sequence<I...>) {
                return Value::from(std::make_shared<T>(
                    registry->convert<std::decay_t<A>>(args[I])...));
            }(std::index_sequence_for<A...>{});
        };
        registry_.add_constructor(type_id_, std::move(handle));
        return *this;
    }

    template <typename R, typename... A>
    TypeBuilder& method(const std::string& name, R (T::*fn)(A...)) {
        return bind_method<R, A...>(name, fn);
    }

    template <typename R, typename... A>
    TypeBuilder& method(const std::string& name, R (T::*fn)(A...) const) {
        return bind_method<R, A...>(name, fn);
    }

    // Lets objects of T pass where std::shared_ptr<Base> is expected and
    // exposes the methods described for Base
    template <typename Base>
    TypeBuilder& implements() {
        static_assert(std::is_base_of_v<Base, T>, "Base must be a base of T");
        registry_.add_base(type_id_, typeid(Base), [](const Value& object) {
            return Value::from(std::static_pointer_cast<Base>(
                object.get<std::shared_ptr<T>>()));
        });
        return *this;
    }

    // Zero-argument method run when a singleton of this type is disposed
    // and its binding names no dispose hook of its own
    TypeBuilder& disposer(const std::string& method_name) {
        registry_.set_disposer(type_id_, method_name);
        return *this;
    }

private:
    template <typename R, typename... A, typename Fn>
    TypeBuilder& bind_method(const std::string& name, Fn fn) {
        const TypeRegistry* registry = &registry_;
        MethodHandle handle;
        handle.name = name;
        handle.arity = sizeof...(A);
        handle.returns_void = std::is_void_v<R>;
        handle.call = [registry, fn](const Value& self,
                                     const Arguments& args) -> Value {
            auto target = registry->convert<std::shared_ptr<T>>(self);
            if (!target) {
                throw std::invalid_argument("method called on a null instance");
            }
            return [&]<std::size_t... I>(std::index_sequence<I...>) -> Value {
                if constexpr (std::is_void_v<R>) {
                    ((*target).*fn)(registry->convert<std::decay_t<A>>(
                        args[I])...);
                    return Value();
                } else if constexpr (std::is_lvalue_reference_v<R> &&
                                     std::is_base_of_v<std::decay_t<R>, T>) {
                    // Fluent setters returning *this keep the receiver
                    const auto& result = ((*target).*fn)(
                        registry->convert<std::decay_t<A>>(args[I])...);
                    if (static_cast<const void*>(&result) !=
                        static_cast<const void*>(target.get())) {
                        throw std::invalid_argument(
                            "method returned a reference to another object");
                    }
                    return self;
                } else {
                    return Value::from(((*target).*fn)(
                        registry->convert<std::decay_t<A>>(args[I])...));
                }
            }(std::index_sequence_for<A...>{});
        };
        registry_.add_method(type_id_, std::move(handle));
        return *this;
    }

    TypeRegistry& registry_;
    std::string type_id_;
};

template <typename T>
TypeBuilder<T> TypeRegistry::add_type(const std::string& type_id) {
    insert(type_id, typeid(T));
    return TypeBuilder<T>(*this, type_id);
}

template <typename T>
T TypeRegistry::convert(const Value& value) const {
    if constexpr (std::is_same_v<T, Value>) {
        return value;
    } else {
        if (const T* exact = value.try_get<T>()) {
            return *exact;
        }
        if constexpr (is_shared_ptr_v<T>) {
            using Pointee = typename T::element_type;
            if (value.is_object()) {
                Value cast = upcast(value, typeid(Pointee));
                if (const T* converted = cast.try_get<T>()) {
                    return *converted;
                }
            }
        } else if constexpr (std::is_arithmetic_v<T>) {
            if (auto number = value.as_number<T>()) {
                return *number;
            }
        }
        throw std::invalid_argument("cannot convert " + value.type_name() +
                                    " to " +
                                    boost::core::demangle(typeid(T).name()));
    }
}

}  // namespace butterfly::di
