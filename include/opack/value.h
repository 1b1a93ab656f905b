// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Generic value tree that every serializable object converts to and from.
///
/// A Value is one of:
/// - None (explicit absence, distinct from a missing Object key)
/// - Bool
/// - Number (int8..int64, uint8..uint64, float, double, kept at their own width)
/// - String
/// - Object: Value -> Value mapping, insertion order preserved, any Value as key
/// - Array: resizable, index-addressable sequence of Value
///
/// ## Ownership
/// Values own their payload. Containers are boxed (unique_ptr) to break the
/// recursive type dependency, and Value is move-only: a node can only have a
/// single parent, so a tree built from Values is acyclic by construction.
/// Use clone() for an independent deep copy.
///
/// ## Usage Example
/// ```cpp
/// Value root = Value::object();
/// root.as_object().put("x", 3);
/// root.as_object().put("tags", Value::array(2));
/// root.as_object().get("tags")->as_array().set(0, "first");
/// ```
///
/// @warning clone(), operator== and hash() recurse once per tree level.
///          Pathologically deep trees are the caller's responsibility.

#pragma once

#include <opack/opack_config.h>

#include <opack/api.h>
#include <opack/concepts.h>

#include <tsl/robin_map.h>

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <variant>
#include <vector>

namespace opack {

class Object;
class Array;
struct Value;

// ============================================================
// Number
// ============================================================

namespace detail {

/// True if `v` converts to T without leaving T's range
template <typename T, typename S>
bool fits_in(S v) noexcept
{
    if constexpr (std::is_floating_point_v<T>) {
        if constexpr (std::is_floating_point_v<S> && sizeof(S) > sizeof(T)) {
            // NaN and infinities carry over; finite values must not overflow
            return !std::isfinite(v) ||
                   (v >= -static_cast<S>(std::numeric_limits<T>::max()) &&
                    v <= static_cast<S>(std::numeric_limits<T>::max()));
        } else {
            return true;
        }
    } else if constexpr (std::is_floating_point_v<S>) {
        // [lower, 2^digits) brackets every finite value that truncates into T
        const S upper = std::ldexp(S{1}, std::numeric_limits<T>::digits);
        const S lower = std::is_signed_v<T> ? -upper : S{0};
        return std::isfinite(v) && v >= lower && v < upper;
    } else {
        return std::in_range<T>(v);
    }
}

/// static_cast for values that fit; otherwise the nearest limit of T (NaN -> 0)
template <typename T, typename S>
T clamp_to(S v) noexcept
{
    if (fits_in<T>(v)) return static_cast<T>(v);
    if constexpr (std::is_floating_point_v<S>) {
        if (std::isnan(v)) return T{};
    }
    if constexpr (std::is_signed_v<S>) {
        if (v < S{}) return std::numeric_limits<T>::lowest();
    }
    return std::numeric_limits<T>::max();
}

} // namespace detail

/// @brief Numeric scalar stored at the width it was created with
class OPACK_API Number {
public:
    using Storage = std::variant<int8_t,
                                 int16_t,
                                 int32_t,
                                 int64_t,
                                 uint8_t,
                                 uint16_t,
                                 uint32_t,
                                 uint64_t,
                                 float,
                                 double>;

    constexpr Number() noexcept : data_(int32_t{0}) {}

    template <NumericType T>
    constexpr Number(T v) noexcept : data_(static_cast<detail::fixed_width_t<T>>(v)) {}

    /// Check whether the number is stored as exactly T (after fixed-width mapping)
    template <NumericType T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<detail::fixed_width_t<T>>(data_);
    }

    /// True if the stored value lies within T's range.
    /// Floating-point values only fit an integral T when finite.
    template <NumericType T>
    [[nodiscard]] bool fits() const noexcept {
        return std::visit([](auto v) { return detail::fits_in<detail::fixed_width_t<T>>(v); }, data_);
    }

    /// Convert to T, whatever the stored width. Values outside T's range
    /// saturate to its limits; NaN converts to zero for an integral T.
    template <NumericType T>
    [[nodiscard]] T as() const noexcept {
        return std::visit([](auto v) { return static_cast<T>(detail::clamp_to<detail::fixed_width_t<T>>(v)); }, data_);
    }

    [[nodiscard]] bool is_integral() const noexcept { return !is_floating_point(); }
    [[nodiscard]] bool is_floating_point() const noexcept {
        return std::holds_alternative<float>(data_) || std::holds_alternative<double>(data_);
    }

    [[nodiscard]] const Storage& storage() const noexcept { return data_; }

    /// Kind-exact equality: Number(int32_t{3}) != Number(int64_t{3})
    [[nodiscard]] bool operator==(const Number& other) const noexcept { return data_ == other.data_; }
    [[nodiscard]] bool operator!=(const Number& other) const noexcept { return !(*this == other); }

    [[nodiscard]] std::size_t hash() const noexcept;
    [[nodiscard]] std::string to_string() const;

private:
    Storage data_;
};

// ============================================================
// Value
// ============================================================

enum class ValueKind : uint8_t {
    None,
    Bool,
    Number,
    String,
    Object,
    Array
};

[[nodiscard]] OPACK_API const char* to_string(ValueKind kind) noexcept;

using ObjectPtr = std::unique_ptr<Object>;
using ArrayPtr  = std::unique_ptr<Array>;

struct OPACK_API Value {
    /// Variant holding the payload. Order matches ValueKind.
    using DataVariant = std::variant<std::monostate, // None
                                     bool,
                                     Number,
                                     std::string,
                                     ObjectPtr,
                                     ArrayPtr>;

    DataVariant data;

    // ============================================================
    // Constructors
    // ============================================================
    // Not explicit, so that obj.put("x", 3) and arr.set(0, "a") read naturally.

    Value() noexcept : data(std::monostate{}) {}
    Value(bool v) noexcept : data(v) {}
    Value(Number v) noexcept : data(v) {}

    template <NumericType T>
    Value(T v) noexcept : data(Number{v}) {}

    Value(std::string v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(std::string_view v) : data(std::string(v)) {}

    Value(Object v);
    Value(Array v);

    Value(Value&& other) noexcept;
    Value& operator=(Value&& other) noexcept;
    Value(const Value&) = delete;
    Value& operator=(const Value&) = delete;
    ~Value();

    // ============================================================
    // Factory Methods
    // ============================================================

    [[nodiscard]] static Value none() { return Value{}; }
    [[nodiscard]] static Value object();
    /// Array of `size` None elements
    [[nodiscard]] static Value array(std::size_t size = 0);

    // ============================================================
    // Type Checking
    // ============================================================

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(data.index()); }

    [[nodiscard]] bool is_none() const noexcept { return std::holds_alternative<std::monostate>(data); }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(data); }
    [[nodiscard]] bool is_number() const noexcept { return std::holds_alternative<Number>(data); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<ObjectPtr>(data); }
    [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<ArrayPtr>(data); }
    [[nodiscard]] bool is_container() const noexcept { return is_object() || is_array(); }

    // ============================================================
    // Value Access
    // ============================================================

    template <typename T>
    [[nodiscard]] T* get_if() noexcept {
        return std::get_if<T>(&data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&data);
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const noexcept {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    /// Numeric payload converted to T, or default_val if not a Number
    template <NumericType T>
    [[nodiscard]] T as_number(T default_val = T{}) const noexcept {
        if (auto* p = get_if<Number>()) return p->as<T>();
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    /// Container access; throws std::bad_variant_access on a kind mismatch
    [[nodiscard]] Object& as_object();
    [[nodiscard]] const Object& as_object() const;
    [[nodiscard]] Array& as_array();
    [[nodiscard]] const Array& as_array() const;

    /// Container access returning nullptr on a kind mismatch
    [[nodiscard]] Object* object_if() noexcept;
    [[nodiscard]] const Object* object_if() const noexcept;
    [[nodiscard]] Array* array_if() noexcept;
    [[nodiscard]] const Array* array_if() const noexcept;

    // ============================================================
    // Utility
    // ============================================================

    /// Deep structural copy; the result shares no node with *this
    [[nodiscard]] Value clone() const;

    /// Deep equality (Object comparison ignores insertion order)
    [[nodiscard]] bool operator==(const Value& other) const;
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

    /// Structural hash consistent with operator==
    [[nodiscard]] std::size_t hash() const;

    /// Convert to string representation (for debugging)
    [[nodiscard]] std::string to_string() const;

    // ============================================================
    // Allowed payload types
    // ============================================================

    /// True for primitives, std::optional of a primitive, std::string and
    /// the Value container types themselves
    [[nodiscard]] static bool is_allowed_type(std::type_index type);

    /// @throws TypeNotAllowedError unless is_allowed_type(type)
    static void assert_allowed_type(std::type_index type);

    template <typename T>
    static void assert_allowed_type() {
        assert_allowed_type(std::type_index(typeid(T)));
    }
};

// ============================================================
// Object
// ============================================================

/// @brief Insertion-ordered Value -> Value mapping
///
/// Entries live in a vector in insertion order. A robin_map from key hash to
/// the newest entry with that hash, plus a per-entry chain of older entries
/// sharing the hash, gives O(1) lookup without storing keys twice.
/// put() on an existing key replaces the value and keeps the original position.
class OPACK_API Object {
public:
    using Entry = std::pair<Value, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Object() = default;
    Object(Object&&) noexcept = default;
    Object& operator=(Object&&) noexcept = default;
    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    void put(Value key, Value value);

    /// Lookup by key (returns nullptr if not found)
    [[nodiscard]] Value* get(const Value& key);
    [[nodiscard]] const Value* get(const Value& key) const;

    /// String-key convenience lookup
    template <StringLike K>
    [[nodiscard]] Value* get(const K& key) { return get(Value{std::string_view(key)}); }

    template <StringLike K>
    [[nodiscard]] const Value* get(const K& key) const { return get(Value{std::string_view(key)}); }

    [[nodiscard]] bool contains(const Value& key) const;

    template <StringLike K>
    [[nodiscard]] bool contains(const K& key) const { return get(key) != nullptr; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    /// Entry at insertion position `index`
    [[nodiscard]] const Entry& entry(std::size_t index) const { return entries_.at(index); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    [[nodiscard]] Object clone() const;

    /// Same key set with equal values; order is not significant
    [[nodiscard]] bool operator==(const Object& other) const;

private:
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    [[nodiscard]] std::size_t find_position(const Value& key, std::size_t key_hash) const;

    std::vector<Entry> entries_;
    std::vector<std::size_t> chain_;                   ///< next older entry with the same key hash
    tsl::robin_map<std::size_t, std::size_t> index_;   ///< key hash -> newest entry position
};

// ============================================================
// Array
// ============================================================

class OPACK_API Array {
public:
    using const_iterator = std::vector<Value>::const_iterator;

    Array() = default;
    /// Array of `size` None elements
    explicit Array(std::size_t size);
    Array(Array&&) noexcept = default;
    Array& operator=(Array&&) noexcept = default;
    Array(const Array&) = delete;
    Array& operator=(const Array&) = delete;

    /// Replace the element at `index`
    /// @throws IndexOutOfRangeError if index >= size(); the array is left untouched
    void set(std::size_t index, Value value);

    void push_back(Value value) { items_.push_back(std::move(value)); }

    /// Grow with None elements or shrink
    void resize(std::size_t size);

    /// Element by index (returns nullptr if out of bounds)
    [[nodiscard]] Value* get(std::size_t index);
    [[nodiscard]] const Value* get(std::size_t index) const;

    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return items_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return items_.end(); }

    [[nodiscard]] Array clone() const;
    [[nodiscard]] bool operator==(const Array& other) const;

private:
    std::vector<Value> items_;
};

} // namespace opack
