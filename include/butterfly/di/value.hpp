#pragma once

#include <boost/any.hpp>
#include <boost/core/demangle.hpp>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

namespace butterfly::di {

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template <typename T>
constexpr bool is_shared_ptr_v = is_shared_ptr<T>::value;

/**
 * @brief Type-erased value flowing through factory chains
 *
 * Holds either a literal (number, bool, string, any copyable type) or an
 * object owned through std::shared_ptr<T>. For objects, type() reports T and
 * identity() the address of the managed object, so two values refer to the
 * same instance exactly when their identities are equal.
 */
class Value {
public:
    Value() : type_(typeid(void)) {}

    template <typename T>
    static Value from(T value) {
        using Decayed = std::decay_t<T>;
        if constexpr (std::is_same_v<Decayed, Value>) {
            return value;
        } else if constexpr (std::is_same_v<Decayed, const char*> ||
                             std::is_same_v<Decayed, char*>) {
            return Value(boost::any(std::string(value)),
                         typeid(std::string), nullptr, false);
        } else if constexpr (is_shared_ptr_v<Decayed>) {
            using Pointee = typename Decayed::element_type;
            std::shared_ptr<void> identity = std::const_pointer_cast<void>(
                std::static_pointer_cast<const void>(value));
            return Value(boost::any(std::move(value)), typeid(Pointee),
                         std::move(identity), true);
        } else {
            return Value(boost::any(std::move(value)), typeid(Decayed),
                         nullptr, false);
        }
    }

    bool empty() const { return data_.empty(); }
    bool is_object() const { return is_object_; }

    // Pointee type for objects, the stored type for literals
    std::type_index type() const { return type_; }

    std::string type_name() const {
        return empty() ? std::string("<empty>")
                       : boost::core::demangle(type_.name());
    }

    const void* identity() const { return object_.get(); }

    bool same_instance(const Value& other) const {
        return is_object_ && other.is_object_ && identity() == other.identity();
    }

    // Exact-type access; nullptr when the stored type differs
    template <typename T>
    const T* try_get() const {
        return boost::any_cast<T>(&data_);
    }

    // Exact-type access; throws boost::bad_any_cast when the type differs
    template <typename T>
    const T& get() const {
        return boost::any_cast<const T&>(data_);
    }

    template <typename T>
    std::optional<T> as_number() const {
        static_assert(std::is_arithmetic_v<T>, "T must be arithmetic");
        if constexpr (std::is_same_v<T, bool>) {
            if (auto* b = try_get<bool>()) return *b;
            return std::nullopt;
        } else {
            if (auto* v = try_get<int>()) return static_cast<T>(*v);
            if (auto* v = try_get<unsigned int>()) return static_cast<T>(*v);
            if (auto* v = try_get<long>()) return static_cast<T>(*v);
            if (auto* v = try_get<unsigned long>()) return static_cast<T>(*v);
            if (auto* v = try_get<long long>()) return static_cast<T>(*v);
            if (auto* v = try_get<unsigned long long>())
                return static_cast<T>(*v);
            if (auto* v = try_get<short>()) return static_cast<T>(*v);
            if (auto* v = try_get<double>()) return static_cast<T>(*v);
            if (auto* v = try_get<float>()) return static_cast<T>(*v);
            return std::nullopt;
        }
    }

    const boost::any& raw() const { return data_; }

private:
    Value(boost::any data, std::type_index type, std::shared_ptr<void> object,
          bool is_object)
        : data_(std::move(data)),
          type_(type),
          object_(std::move(object)),
          is_object_(is_object) {}

    boost::any data_;
    std::type_index type_;
    std::shared_ptr<void> object_;
    bool is_object_ = false;
};

using Arguments = std::vector<Value>;

}  // namespace butterfly::di
