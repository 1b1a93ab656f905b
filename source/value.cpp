// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <opack/value.h>

#include <opack/diagnostics.h>
#include <opack/errors.h>

#include <boost/container_hash/hash.hpp>

#include <optional>
#include <sstream>

namespace opack {

// ============================================================
// Number
// ============================================================

std::size_t Number::hash() const noexcept
{
    std::size_t seed = data_.index();
    std::visit([&seed](auto v) { boost::hash_combine(seed, v); }, data_);
    return seed;
}

std::string Number::to_string() const
{
    return std::visit([](auto v) -> std::string {
        using T = decltype(v);
        if constexpr (std::is_same_v<T, int8_t>) {
            return std::to_string(static_cast<int>(v)) + "i8";
        } else if constexpr (std::is_same_v<T, int16_t>) {
            return std::to_string(v) + "i16";
        } else if constexpr (std::is_same_v<T, int32_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v) + "L";
        } else if constexpr (std::is_same_v<T, uint8_t>) {
            return std::to_string(static_cast<unsigned>(v)) + "u8";
        } else if constexpr (std::is_same_v<T, uint16_t>) {
            return std::to_string(v) + "u16";
        } else if constexpr (std::is_same_v<T, uint32_t>) {
            return std::to_string(v) + "u";
        } else if constexpr (std::is_same_v<T, uint64_t>) {
            return std::to_string(v) + "uL";
        } else if constexpr (std::is_same_v<T, float>) {
            std::ostringstream oss;
            oss << v << "f";
            return oss.str();
        } else {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
    }, data_);
}

const char* to_string(ValueKind kind) noexcept
{
    switch (kind) {
    case ValueKind::None:   return "None";
    case ValueKind::Bool:   return "Bool";
    case ValueKind::Number: return "Number";
    case ValueKind::String: return "String";
    case ValueKind::Object: return "Object";
    case ValueKind::Array:  return "Array";
    }
    return "<unknown>";
}

// ============================================================
// Value
// ============================================================

Value::Value(Object v) : data(std::make_unique<Object>(std::move(v))) {}
Value::Value(Array v) : data(std::make_unique<Array>(std::move(v))) {}

Value::Value(Value&& other) noexcept = default;
Value& Value::operator=(Value&& other) noexcept = default;
Value::~Value() = default;

Value Value::object()
{
    return Value{Object{}};
}

Value Value::array(std::size_t size)
{
    return Value{Array{size}};
}

Object& Value::as_object()
{
    return *std::get<ObjectPtr>(data);
}

const Object& Value::as_object() const
{
    return *std::get<ObjectPtr>(data);
}

Array& Value::as_array()
{
    return *std::get<ArrayPtr>(data);
}

const Array& Value::as_array() const
{
    return *std::get<ArrayPtr>(data);
}

Object* Value::object_if() noexcept
{
    auto* p = get_if<ObjectPtr>();
    return p ? p->get() : nullptr;
}

const Object* Value::object_if() const noexcept
{
    auto* p = get_if<ObjectPtr>();
    return p ? p->get() : nullptr;
}

Array* Value::array_if() noexcept
{
    auto* p = get_if<ArrayPtr>();
    return p ? p->get() : nullptr;
}

const Array* Value::array_if() const noexcept
{
    auto* p = get_if<ArrayPtr>();
    return p ? p->get() : nullptr;
}

Value Value::clone() const
{
    return std::visit([](const auto& val) -> Value {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, ObjectPtr>) {
            return Value{val->clone()};
        }
        else if constexpr (std::is_same_v<T, ArrayPtr>) {
            return Value{val->clone()};
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            return Value{};
        }
        else {
            return Value{val};
        }
    }, data);
}

bool Value::operator==(const Value& other) const
{
    if (data.index() != other.data.index()) return false;

    return std::visit([&other](const auto& val) -> bool {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, ObjectPtr>) {
            return *val == *std::get<ObjectPtr>(other.data);
        }
        else if constexpr (std::is_same_v<T, ArrayPtr>) {
            return *val == *std::get<ArrayPtr>(other.data);
        }
        else {
            return val == std::get<T>(other.data);
        }
    }, data);
}

std::size_t Value::hash() const
{
    std::size_t seed = data.index();

    std::visit([&seed](const auto& val) {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            // kind alone
        }
        else if constexpr (std::is_same_v<T, Number>) {
            boost::hash_combine(seed, val.hash());
        }
        else if constexpr (std::is_same_v<T, ObjectPtr>) {
            // Order-insensitive, matching Object::operator==
            std::size_t entries = 0;
            for (const auto& [k, v] : *val) {
                std::size_t entry_seed = 0;
                boost::hash_combine(entry_seed, k.hash());
                boost::hash_combine(entry_seed, v.hash());
                entries += entry_seed;
            }
            boost::hash_combine(seed, entries);
        }
        else if constexpr (std::is_same_v<T, ArrayPtr>) {
            for (const auto& item : *val) {
                boost::hash_combine(seed, item.hash());
            }
        }
        else {
            boost::hash_combine(seed, val);
        }
    }, data);

    return seed;
}

std::string Value::to_string() const
{
    return std::visit([](const auto& val) -> std::string {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return "none";
        }
        else if constexpr (std::is_same_v<T, bool>) {
            return val ? "true" : "false";
        }
        else if constexpr (std::is_same_v<T, Number>) {
            return val.to_string();
        }
        else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + val + "\"";
        }
        else if constexpr (std::is_same_v<T, ObjectPtr>) {
            std::ostringstream oss;
            oss << "{";
            bool first = true;
            for (const auto& [k, v] : *val) {
                if (!first) oss << ", ";
                first = false;
                oss << k.to_string() << ": " << v.to_string();
            }
            oss << "}";
            return oss.str();
        }
        else {
            std::ostringstream oss;
            oss << "[";
            bool first = true;
            for (const auto& v : *val) {
                if (!first) oss << ", ";
                first = false;
                oss << v.to_string();
            }
            oss << "]";
            return oss.str();
        }
    }, data);
}

// ============================================================
// Allowed payload types
// ============================================================

namespace {

template <typename... Ts>
bool is_one_of_or_optional(std::type_index type)
{
    return ((type == std::type_index(typeid(Ts)) ||
             type == std::type_index(typeid(std::optional<Ts>))) || ...);
}

bool is_primitive_or_wrapper(std::type_index type)
{
    return is_one_of_or_optional<bool,
                                 signed char,
                                 short,
                                 int,
                                 long,
                                 long long,
                                 unsigned char,
                                 unsigned short,
                                 unsigned int,
                                 unsigned long,
                                 unsigned long long,
                                 float,
                                 double>(type);
}

} // anonymous namespace

bool Value::is_allowed_type(std::type_index type)
{
    return is_primitive_or_wrapper(type) ||
           type == std::type_index(typeid(std::string)) ||
           type == std::type_index(typeid(Value)) ||
           type == std::type_index(typeid(Number)) ||
           type == std::type_index(typeid(Object)) ||
           type == std::type_index(typeid(Array));
}

void Value::assert_allowed_type(std::type_index type)
{
    if (!is_allowed_type(type)) {
        throw TypeNotAllowedError(std::string(type.name()) +
                                  " is not allowed type, allow only primitive type or wrapper "
                                  "(std::optional) or std::string or opack values");
    }
}

// ============================================================
// Object
// ============================================================

std::size_t Object::find_position(const Value& key, std::size_t key_hash) const
{
    auto it = index_.find(key_hash);
    if (it == index_.end()) return npos;

    for (std::size_t pos = it->second; pos != npos; pos = chain_[pos]) {
        if (entries_[pos].first == key) return pos;
    }
    return npos;
}

void Object::put(Value key, Value value)
{
    const std::size_t key_hash = key.hash();
    const std::size_t pos = find_position(key, key_hash);

    if (pos != npos) {
        // Key exists, replace the value in place
        entries_[pos].second = std::move(value);
        return;
    }

    const std::size_t new_pos = entries_.size();
    auto [it, inserted] = index_.try_emplace(key_hash, new_pos);
    chain_.push_back(inserted ? npos : it->second);
    if (!inserted) {
        it.value() = new_pos;
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

Value* Object::get(const Value& key)
{
    const std::size_t pos = find_position(key, key.hash());
    if (pos == npos) return nullptr;
    return &entries_[pos].second;
}

const Value* Object::get(const Value& key) const
{
    const std::size_t pos = find_position(key, key.hash());
    if (pos == npos) return nullptr;
    return &entries_[pos].second;
}

bool Object::contains(const Value& key) const
{
    return get(key) != nullptr;
}

Object Object::clone() const
{
    Object result;
    result.entries_.reserve(entries_.size());
    for (const auto& [k, v] : entries_) {
        result.entries_.emplace_back(k.clone(), v.clone());
    }
    result.chain_ = chain_;
    result.index_ = index_;
    return result;
}

bool Object::operator==(const Object& other) const
{
    if (size() != other.size()) return false;

    for (const auto& [k, v] : entries_) {
        const Value* found = other.get(k);
        if (!found || *found != v) return false;
    }
    return true;
}

// ============================================================
// Array
// ============================================================

Array::Array(std::size_t size) : items_(size) {}

void Array::set(std::size_t index, Value value)
{
    if (index >= items_.size()) {
        throw IndexOutOfRangeError(index, items_.size());
    }
    items_[index] = std::move(value);
}

void Array::resize(std::size_t size)
{
    items_.resize(size);
}

Value* Array::get(std::size_t index)
{
    if (index >= items_.size()) {
        detail::log_index_error("Array::get", index, "out of range");
        return nullptr;
    }
    return &items_[index];
}

const Value* Array::get(std::size_t index) const
{
    if (index >= items_.size()) {
        detail::log_index_error("Array::get", index, "out of range");
        return nullptr;
    }
    return &items_[index];
}

Array Array::clone() const
{
    Array result;
    result.items_.reserve(items_.size());
    for (const auto& item : items_) {
        result.items_.push_back(item.clone());
    }
    return result;
}

bool Array::operator==(const Array& other) const
{
    if (items_.size() != other.items_.size()) return false;

    for (std::size_t i = 0; i < items_.size(); ++i) {
        if (items_[i] != other.items_[i]) return false;
    }
    return true;
}

} // namespace opack
